#include "TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace JL {

TaskPool::TaskPool(size_t threadCount, std::string name)
    : name(std::move(name)) {
    jl_log("TaskPool::TaskPool constructing " + this->name, "TaskPool");
    if (threadCount == 0) threadCount = 1;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this, i);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            jl_log(std::string{"TaskPool::TaskPool failed to spawn worker: "} + error.what(), "TaskPool", "Error");
            break;
        }
    }
    jl_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::submit(std::shared_ptr<Task> task) -> std::optional<Error> {
    if (!task)
        return Error{Error::Code::UnknownError, "null task"};
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            jl_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::ShuttingDown, "Executor shutting down"};
        }
        if (this->workers.empty())
            return Error{Error::Code::UnknownError, "Executor has no workers"};
        if (!task->tryQueue()) {
            jl_log("TaskPool::submit: task already submitted: " + task->name(), "TaskPool", "Warning");
            return Error{Error::Code::UnknownError, "Task already submitted"};
        }
        tasks.push(std::move(task));
    }
    taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            for (auto& th : this->workers) {
                if (th.joinable() && th.get_id() != std::this_thread::get_id()) th.join();
            }
            return;
        }
        jl_log("TaskPool::shutdown begin " + this->name, "TaskPool");
        this->shuttingDown = true;
    }
    this->taskCV.notify_all();

    for (auto& th : this->workers) {
        if (th.joinable()) th.join();
    }
    activeWorkers = 0;

    this->workers.clear();
    std::queue<std::shared_ptr<Task>> dropped;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        dropped.swap(this->tasks);
    }
    if (!dropped.empty())
        jl_log("TaskPool::shutdown dropping " + std::to_string(dropped.size()) + " queued tasks", "TaskPool");
    while (!dropped.empty()) {
        dropped.front()->drop(Error{Error::Code::ShuttingDown, "Executor shut down before the task ran"});
        dropped.pop();
    }
    jl_log("TaskPool::shutdown ends " + this->name, "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->activeWorkers.load();
}

auto TaskPool::queued() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size();
}

auto TaskPool::workerFunction(size_t index) -> void {
#ifdef JL_LOG_DEBUG
    set_thread_name(this->name + "-" + std::to_string(index));
#else
    (void)index;
#endif
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            if (this->shuttingDown)
                break;

            task = std::move(tasks.front());
            tasks.pop();
        }

        ++activeTasks;
        try {
            task->transitionToRunning();
            task->function();
            task->markCompleted();
        } catch (std::exception const& error) {
            task->markFailed();
            jl_log("Exception in task " + task->name() + ": " + error.what(), "TaskPool", "Error");
        }
        --activeTasks;
    }
    jl_log("TaskPool::workerFunction exit", "TaskPool");
}

} // namespace JL
