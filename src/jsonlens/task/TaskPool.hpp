#pragma once
#include "Executor.hpp"
#include "Task.hpp"
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace JL {

// Fixed-size worker pool; tasks beyond the worker count wait in FIFO order.
class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount, std::string name = "Worker");
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(std::shared_ptr<Task> task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    auto queued() const -> size_t;
    auto running() const -> size_t { return this->activeTasks.load(); }

private:
    auto workerFunction(size_t index) -> void;

    std::string                       name;
    std::vector<std::jthread>         workers;
    std::queue<std::shared_ptr<Task>> tasks;
    mutable std::mutex                mutex;
    std::condition_variable           taskCV;
    std::atomic<bool>                 shuttingDown{false};
    std::atomic<size_t>               activeWorkers{0};
    std::atomic<size_t>               activeTasks{0};
};

} // namespace JL
