// === Event Channel ===========================================================
//
// Typed thread-safe FIFO used to pass events between components without one
// component calling into another. Producers publish from any thread; the
// dispatcher drains each channel during its pump.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace guard_link {

/** @brief Thread-safe FIFO carrying events of type @p Event. */
template <typename Event>
class EventChannel final {
  public:
    /** @brief Append an event for the consumer. */
    void publish(Event event) {
        std::scoped_lock lock(mutex_);
        queue_events_.push(std::move(event));
    }

    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<Event> try_consume() {
        std::scoped_lock lock(mutex_);
        if (queue_events_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(queue_events_.front());
        queue_events_.pop();
        return event;
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_events_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::queue<Event> queue_events_;
};

}  // namespace guard_link
