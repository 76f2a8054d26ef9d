// === Audit Sink ==============================================================
//
// Fire-and-forget front of the durable store. Recording only enqueues, so the
// ingest/escalation paths never wait on persistence; the dispatcher calls
// flush() to write due records, retrying failures with exponential backoff
// and dropping (with an error log) after the configured number of attempts.
// Records of one alert are written in the order they were recorded: while an
// earlier record of the alert waits for a retry, later ones wait behind it.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "guard_link/durable_store.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

/** @brief Retry policy for durable writes. */
struct AuditPolicy final {
    int max_attempts{5};
    Duration base_backoff{Duration{0.2}};  /**< Delay before the 2nd attempt; doubles after each failure. */
};

struct AuditStats final {
    std::size_t written{};
    std::size_t retried{};
    std::size_t dropped{};
    std::size_t pending{};
};

class AuditSink final {
  public:
    AuditSink(DurableStore& store, AuditPolicy policy);

    void record_location(const LocationSample& sample, TimePoint now);
    void record_alert_event(const AlertEvent& event, TimePoint now);
    void record_alert(const AlertRecord& alert, TimePoint now);

    /**
     * @brief Attempt every write whose retry time has come.
     * @return Number of records written.
     */
    std::size_t flush(TimePoint now);

    [[nodiscard]] AuditStats stats() const;

  private:
    using AuditPayload = std::variant<LocationSample, AlertEvent, AlertRecord>;

    struct PendingWrite final {
        AuditPayload payload;
        std::uint64_t sequence{};  /**< Recording order. */
        int attempts{};
        TimePoint next_attempt_at{};
    };

    void enqueue(AuditPayload payload, TimePoint now);
    void write(const AuditPayload& payload);
    [[nodiscard]] static std::string describe(const AuditPayload& payload);
    /** @brief Alert id for alert rows and events; samples are unordered. */
    [[nodiscard]] static std::optional<std::string> ordering_key(const AuditPayload& payload);

    DurableStore& store_;
    AuditPolicy policy_;
    mutable std::mutex mutex_;
    std::deque<PendingWrite> queue_pending_;  /**< Sorted by sequence. */
    std::uint64_t next_sequence_{0};
    AuditStats struct_stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
