#include "EventChannel.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace JL {

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto EventChannel::publish(Event event) -> void {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(this->listenersMutex_);
        listeners.reserve(this->listeners_.size());
        for (auto const& [id, listener] : this->listeners_)
            listeners.push_back(listener);
    }
    for (auto const& listener : listeners)
        listener(event);

    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        ++this->published_;
        if (this->queue_.size() >= this->capacity_) {
            this->queue_.pop_front();
            if (this->dropped_++ == 0)
                jl_log("EventChannel full, dropping oldest events", "Events", "Warning");
        }
        this->queue_.push_back(std::move(event));
    }
    this->cv_.notify_one();
}

auto EventChannel::tryPop() -> std::optional<Event> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->queue_.empty())
        return std::nullopt;
    Event event = std::move(this->queue_.front());
    this->queue_.pop_front();
    return event;
}

auto EventChannel::waitPop(std::chrono::milliseconds timeout) -> std::optional<Event> {
    std::unique_lock<std::mutex> lock(this->mutex_);
    if (!this->cv_.wait_for(lock, timeout, [this] { return !this->queue_.empty(); }))
        return std::nullopt;
    Event event = std::move(this->queue_.front());
    this->queue_.pop_front();
    return event;
}

auto EventChannel::drain() -> std::vector<Event> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    std::vector<Event> events(std::make_move_iterator(this->queue_.begin()), std::make_move_iterator(this->queue_.end()));
    this->queue_.clear();
    return events;
}

auto EventChannel::subscribe(Listener listener) -> ListenerId {
    std::lock_guard<std::mutex> lock(this->listenersMutex_);
    auto const id = this->nextListenerId_++;
    this->listeners_.emplace(id, std::move(listener));
    return id;
}

auto EventChannel::unsubscribe(ListenerId id) -> bool {
    std::lock_guard<std::mutex> lock(this->listenersMutex_);
    return this->listeners_.erase(id) > 0;
}

auto EventChannel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->queue_.size();
}

auto EventChannel::dropped() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->dropped_;
}

auto EventChannel::published() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->published_;
}

} // namespace JL
