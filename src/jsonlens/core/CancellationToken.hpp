#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace JL {

/**
 * CancellationToken: shared, copyable cancellation flag with an optional deadline.
 *
 * Every long running operation (parse, analyze, materialize, index build,
 * query) takes a token and polls it between units of work. Copies share the
 * same flag, so cancelling any copy is observed by all holders.
 *
 * A default constructed token is never cancelled unless cancel() is called on
 * it or on one of its copies.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    auto cancel() const -> void;
    [[nodiscard]] auto isCancelled() const -> bool;
    [[nodiscard]] auto deadlineExpired(Clock::time_point now = Clock::now()) const -> bool;
    [[nodiscard]] auto deadline() const -> std::optional<Clock::time_point>;

    // Derived token: cancelled when this one is, or when its own deadline passes.
    [[nodiscard]] auto withDeadline(Clock::time_point deadline) const -> CancellationToken;

    // nullopt while the operation may continue, otherwise the error to surface.
    [[nodiscard]] auto check(Clock::time_point now = Clock::now()) const -> std::optional<Error>;

private:
    std::shared_ptr<std::atomic<bool>> flag;
    std::optional<Clock::time_point>   deadline_;
};

} // namespace JL
