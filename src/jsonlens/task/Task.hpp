#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace JL {

// Represents the possible states of a task
enum class TaskState {
    NotStarted, // Created, not yet accepted by an executor
    Queued,     // Accepted, waiting for a worker
    Running,    // A worker is executing the function
    Completed,  // Function returned
    Failed      // Function threw
};

constexpr std::string_view taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::NotStarted:
            return "NotStarted";
        case TaskState::Queued:
            return "Queued";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

/**
 * Unit of background work: a callable plus an atomic lifecycle.
 *
 * Tasks report results through whatever the callable captures (a promise, a
 * load operation); the executor only drives the state machine. A task is
 * accepted at most once: tryQueue() fails when it was already submitted.
 * A queued task that never runs because its executor shut down is marked
 * Failed and handed the reason through `dropped`, so a captured promise can
 * still be resolved.
 */
struct Task {
    using DropHandler = std::function<void(Error)>;

    static auto Create(std::function<void()> fun, std::string label = {}, DropHandler dropped = {}) -> std::shared_ptr<Task> {
        auto task      = std::shared_ptr<Task>(new Task{});
        task->function = std::move(fun);
        task->label    = std::move(label);
        task->dropped  = std::move(dropped);
        return task;
    }

    auto hasStarted() const -> bool { return this->get() != TaskState::NotStarted; }
    auto isCompleted() const -> bool { return this->get() == TaskState::Completed; }
    auto isFailed() const -> bool { return this->get() == TaskState::Failed; }
    auto isTerminal() const -> bool { return this->isCompleted() || this->isFailed(); }
    auto get() const -> TaskState { return this->state.load(std::memory_order_acquire); }
    auto name() const -> std::string const& { return this->label; }

private:
    friend class TaskPool;

    Task()                       = default;
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;

    auto transition(TaskState from, TaskState to) -> bool { return this->state.compare_exchange_strong(from, to); }
    auto tryQueue() -> bool { return this->transition(TaskState::NotStarted, TaskState::Queued); }
    auto transitionToRunning() -> bool { return this->transition(TaskState::Queued, TaskState::Running); }
    auto markCompleted() -> bool { return this->transition(TaskState::Running, TaskState::Completed); }
    auto markFailed() -> void { this->state.store(TaskState::Failed, std::memory_order_release); }
    auto drop(Error reason) -> void {
        this->markFailed();
        if (this->dropped)
            this->dropped(std::move(reason));
    }

    std::atomic<TaskState> state{TaskState::NotStarted};
    std::function<void()>  function;
    DropHandler            dropped;
    std::string            label;
};

} // namespace JL
