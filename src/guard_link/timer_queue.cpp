#include "guard_link/timer_queue.hpp"

#include <stdexcept>

namespace guard_link {

TimerHandle TimerQueue::schedule(TimePoint deadline, TimerEntry::Callback callback) {
    if (!callback) {
        throw std::invalid_argument("TimerQueue callback cannot be empty");
    }
    auto entry = std::make_shared<TimerEntry>();
    entry->deadline = deadline;
    entry->callback = std::move(callback);

    std::scoped_lock lock(mutex_);
    entry->sequence = next_sequence_++;
    queue_timers_.push(entry);
    return entry;
}

bool TimerQueue::cancel(const TimerHandle& handle) noexcept {
    if (handle == nullptr) {
        return false;
    }
    TimerState expected = TimerState::Pending;
    return handle->state.compare_exchange_strong(expected, TimerState::Cancelled);
}

std::size_t TimerQueue::fire_due(TimePoint now) {
    std::vector<TimerHandle> list_due;
    {
        std::scoped_lock lock(mutex_);
        while (!queue_timers_.empty() && queue_timers_.top()->deadline <= now) {
            list_due.push_back(queue_timers_.top());
            queue_timers_.pop();
        }
    }

    std::size_t fired_count = 0;
    for (const TimerHandle& entry : list_due) {
        TimerState expected = TimerState::Pending;
        if (!entry->state.compare_exchange_strong(expected, TimerState::Fired)) {
            continue;
        }
        entry->callback(now);
        ++fired_count;
    }

    std::scoped_lock lock(mutex_);
    discard_cancelled_head();
    return fired_count;
}

std::size_t TimerQueue::pending() const {
    std::scoped_lock lock(mutex_);
    auto copy = queue_timers_;
    std::size_t pending_count = 0;
    while (!copy.empty()) {
        if (copy.top()->state.load() == TimerState::Pending) {
            ++pending_count;
        }
        copy.pop();
    }
    return pending_count;
}

std::optional<TimePoint> TimerQueue::next_deadline() const {
    std::scoped_lock lock(mutex_);
    auto copy = queue_timers_;
    while (!copy.empty()) {
        if (copy.top()->state.load() == TimerState::Pending) {
            return copy.top()->deadline;
        }
        copy.pop();
    }
    return std::nullopt;
}

void TimerQueue::discard_cancelled_head() {
    while (!queue_timers_.empty() && queue_timers_.top()->state.load() == TimerState::Cancelled) {
        queue_timers_.pop();
    }
}

}  // namespace guard_link
