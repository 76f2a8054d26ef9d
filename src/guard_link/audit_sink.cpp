#include "guard_link/audit_sink.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace guard_link {

namespace {
template <class... Visitors>
struct Overloaded : Visitors... {
    using Visitors::operator()...;
};
template <class... Visitors>
Overloaded(Visitors...) -> Overloaded<Visitors...>;
}  // namespace

AuditSink::AuditSink(DurableStore& store, AuditPolicy policy)
    : store_(store),
      policy_(policy),
      logger_(get_logger()) {
    if (policy_.max_attempts <= 0) {
        throw std::invalid_argument("AuditSink max_attempts must be positive");
    }
    if (policy_.base_backoff.count() < 0.0) {
        throw std::invalid_argument("AuditSink backoff cannot be negative");
    }
}

void AuditSink::record_location(const LocationSample& sample, TimePoint now) {
    enqueue(sample, now);
}

void AuditSink::record_alert_event(const AlertEvent& event, TimePoint now) {
    enqueue(event, now);
}

void AuditSink::record_alert(const AlertRecord& alert, TimePoint now) {
    enqueue(alert, now);
}

std::size_t AuditSink::flush(TimePoint now) {
    std::vector<PendingWrite> list_due;
    std::vector<PendingWrite> list_held;
    {
        std::scoped_lock lock(mutex_);
        std::set<std::string> set_blocked_keys;
        std::deque<PendingWrite> queue_waiting;
        while (!queue_pending_.empty()) {
            PendingWrite pending = std::move(queue_pending_.front());
            queue_pending_.pop_front();
            const std::optional<std::string> key = ordering_key(pending.payload);
            const bool blocked = key.has_value() && set_blocked_keys.contains(*key);
            if (!blocked && pending.next_attempt_at <= now) {
                list_due.push_back(std::move(pending));
                continue;
            }
            if (key.has_value()) {
                set_blocked_keys.insert(*key);
            }
            queue_waiting.push_back(std::move(pending));
        }
        queue_pending_ = std::move(queue_waiting);
    }

    std::size_t written_count = 0;
    std::vector<PendingWrite> list_retry;
    std::set<std::string> set_failed_keys;
    for (PendingWrite& pending : list_due) {
        const std::optional<std::string> key = ordering_key(pending.payload);
        if (key.has_value() && set_failed_keys.contains(*key)) {
            list_held.push_back(std::move(pending));
            continue;
        }
        ++pending.attempts;
        try {
            write(pending.payload);
            ++written_count;
            continue;
        } catch (const std::exception& exc) {
            if (pending.attempts >= policy_.max_attempts) {
                logger_->error(
                    R"({{"component":"audit","action":"drop","record":"{}","attempts":{},"error":"{}"}})",
                    describe(pending.payload),
                    pending.attempts,
                    exc.what()
                );
                std::scoped_lock lock(mutex_);
                ++struct_stats_.dropped;
                continue;
            }
            if (key.has_value()) {
                set_failed_keys.insert(*key);
            }
            const Duration backoff = policy_.base_backoff * std::pow(2.0, pending.attempts - 1);
            pending.next_attempt_at = now + to_clock_duration(backoff);
            logger_->warn(
                R"({{"component":"audit","action":"retry","record":"{}","attempt":{},"backoff_s":{:.3f},"error":"{}"}})",
                describe(pending.payload),
                pending.attempts,
                backoff.count(),
                exc.what()
            );
            list_retry.push_back(std::move(pending));
        }
    }

    std::scoped_lock lock(mutex_);
    struct_stats_.written += written_count;
    struct_stats_.retried += list_retry.size();
    for (PendingWrite& pending : list_retry) {
        queue_pending_.push_back(std::move(pending));
    }
    for (PendingWrite& pending : list_held) {
        queue_pending_.push_back(std::move(pending));
    }
    std::sort(queue_pending_.begin(), queue_pending_.end(), [](const PendingWrite& lhs, const PendingWrite& rhs) {
        return lhs.sequence < rhs.sequence;
    });
    return written_count;
}

AuditStats AuditSink::stats() const {
    std::scoped_lock lock(mutex_);
    AuditStats snapshot = struct_stats_;
    snapshot.pending = queue_pending_.size();
    return snapshot;
}

void AuditSink::enqueue(AuditPayload payload, TimePoint now) {
    std::scoped_lock lock(mutex_);
    queue_pending_.push_back(PendingWrite{std::move(payload), next_sequence_++, 0, now});
}

void AuditSink::write(const AuditPayload& payload) {
    std::visit(
        Overloaded{
            [this](const LocationSample& sample) { store_.append_location_sample(sample); },
            [this](const AlertEvent& event) { store_.append_alert_event(event); },
            [this](const AlertRecord& alert) { store_.upsert_alert(alert); },
        },
        payload
    );
}

std::optional<std::string> AuditSink::ordering_key(const AuditPayload& payload) {
    return std::visit(
        Overloaded{
            [](const LocationSample&) { return std::optional<std::string>{}; },
            [](const AlertEvent& event) { return std::optional<std::string>{event.alert_id}; },
            [](const AlertRecord& alert) { return std::optional<std::string>{alert.id}; },
        },
        payload
    );
}

std::string AuditSink::describe(const AuditPayload& payload) {
    return std::visit(
        Overloaded{
            [](const LocationSample& sample) { return fmt::format("location_sample:{}", sample.agent_id); },
            [](const AlertEvent& event) { return fmt::format("alert_event:{}", event.event_id); },
            [](const AlertRecord& alert) { return fmt::format("alert:{}", alert.id); },
        },
        payload
    );
}

}  // namespace guard_link
