// === Timer Queue =============================================================
//
// Deadline-ordered one-shot timers fired by the dispatcher pump. Each timer
// settles exactly once: a compare-and-swap on its state decides between
// firing and cancellation, so a cancel racing a fire has a single winner.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "guard_link/types.hpp"

namespace guard_link {

enum class TimerState : std::uint8_t {
    Pending,
    Fired,
    Cancelled
};

/** @brief One scheduled callback; shared between the queue and its owner. */
struct TimerEntry final {
    using Callback = std::function<void(TimePoint fired_at)>;

    TimePoint deadline{};
    std::uint64_t sequence{};
    Callback callback{};
    std::atomic<TimerState> state{TimerState::Pending};
};

using TimerHandle = std::shared_ptr<TimerEntry>;

class TimerQueue final {
  public:
    /** @brief Register @p callback to run on the first pump at or after @p deadline. */
    TimerHandle schedule(TimePoint deadline, TimerEntry::Callback callback);

    /**
     * @brief Cancel a pending timer.
     * @return True only for the call that moved the timer out of Pending.
     */
    static bool cancel(const TimerHandle& handle) noexcept;

    /**
     * @brief Fire every timer due at @p now in deadline order. Callbacks run
     *        without the queue lock held and may schedule further timers.
     *        Callbacks must not throw.
     * @return Number of callbacks invoked.
     */
    std::size_t fire_due(TimePoint now);

    /** @brief Timers still pending (cancelled entries excluded). */
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::optional<TimePoint> next_deadline() const;

  private:
    struct LaterDeadline final {
        bool operator()(const TimerHandle& lhs, const TimerHandle& rhs) const noexcept {
            if (lhs->deadline != rhs->deadline) {
                return lhs->deadline > rhs->deadline;
            }
            return lhs->sequence > rhs->sequence;
        }
    };

    void discard_cancelled_head();

    mutable std::mutex mutex_;
    std::priority_queue<TimerHandle, std::vector<TimerHandle>, LaterDeadline> queue_timers_;
    std::uint64_t next_sequence_{0};
};

}  // namespace guard_link
