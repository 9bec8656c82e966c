#include "CancellationToken.hpp"

namespace JL {

CancellationToken::CancellationToken()
    : flag(std::make_shared<std::atomic<bool>>(false)) {}

auto CancellationToken::cancel() const -> void {
    this->flag->store(true, std::memory_order_release);
}

auto CancellationToken::isCancelled() const -> bool {
    return this->flag->load(std::memory_order_acquire);
}

auto CancellationToken::deadlineExpired(Clock::time_point now) const -> bool {
    return this->deadline_.has_value() && now >= *this->deadline_;
}

auto CancellationToken::deadline() const -> std::optional<Clock::time_point> {
    return this->deadline_;
}

auto CancellationToken::withDeadline(Clock::time_point deadline) const -> CancellationToken {
    CancellationToken derived = *this;
    if (!derived.deadline_ || deadline < *derived.deadline_)
        derived.deadline_ = deadline;
    return derived;
}

auto CancellationToken::check(Clock::time_point now) const -> std::optional<Error> {
    if (this->isCancelled())
        return Error{Error::Code::Cancelled, "operation cancelled"};
    if (this->deadlineExpired(now))
        return Error{Error::Code::Timeout, "operation exceeded its time budget"};
    return std::nullopt;
}

} // namespace JL
