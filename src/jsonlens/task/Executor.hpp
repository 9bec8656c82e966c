#pragma once

#include "core/Error.hpp"

#include <memory>
#include <optional>

namespace JL {

struct Task;

/**
 * Executor: where the loader and the session push their background work.
 *
 * submit() returns std::nullopt once the task is queued and ShuttingDown after
 * shutdown(). shutdown() refuses new work, lets running tasks finish and drops
 * queued ones, so a task must not assume it will run. size() is the worker count.
 * submit() and shutdown() may race.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto submit(std::shared_ptr<Task> task) -> std::optional<Error> = 0;
    virtual auto shutdown() -> void                                         = 0;
    virtual auto size() const -> size_t                                     = 0;
};

} // namespace JL
