#pragma once
#include "events/Event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace JL {

/**
 * EventChannel: bounded queue of core change notifications
 *
 * Purpose
 * -------
 * The core never talks to a presentation layer directly. State transitions
 * (children loaded, node evicted, memory level changed) are published here and
 * consumed either by polling the queue (tryPop/waitPop/drain) or through
 * synchronous listeners.
 *
 * Notes
 * -----
 * - The queue holds at most `capacity` events; publishing into a full queue
 *   drops the oldest event and bumps dropped().
 * - Listeners run on the publishing thread, outside the queue lock. A listener
 *   must not block and must not unsubscribe itself from within the callback.
 * - Thread-safety: all operations may be called concurrently.
 */
class EventChannel {
public:
    using Listener   = std::function<void(Event const&)>;
    using ListenerId = std::uint64_t;

    explicit EventChannel(std::size_t capacity = 4096);

    EventChannel(EventChannel const&)            = delete;
    EventChannel& operator=(EventChannel const&) = delete;

    auto publish(Event event) -> void;

    auto tryPop() -> std::optional<Event>;
    auto waitPop(std::chrono::milliseconds timeout) -> std::optional<Event>;
    auto drain() -> std::vector<Event>;

    auto subscribe(Listener listener) -> ListenerId;
    auto unsubscribe(ListenerId id) -> bool;

    auto size() const -> std::size_t;
    auto capacity() const -> std::size_t { return this->capacity_; }
    auto dropped() const -> std::uint64_t;
    auto published() const -> std::uint64_t;

private:
    std::size_t             capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<Event>       queue_;
    std::uint64_t           dropped_   = 0;
    std::uint64_t           published_ = 0;

    mutable std::mutex               listenersMutex_;
    std::map<ListenerId, Listener>   listeners_;
    ListenerId                       nextListenerId_ = 1;
};

} // namespace JL
