// === Broadcast Router ========================================================
//
// Fans events out to the sessions of a room and holds them for recipients
// that are known to the room but not connected. Every user receives a publish
// at most once. While a user has a backlog for a room, new events for that
// room are appended behind it so the user always sees publish order; the
// backlog is flushed when the user joins the room again.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "guard_link/connection_registry.hpp"
#include "guard_link/directory.hpp"
#include "guard_link/envelope.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

/** @brief How long queued events stay deliverable, by category. */
struct RetentionPolicy final {
    Duration location_retention{Duration{24.0 * 3600.0}};  /**< Also applies to presence events. */
    Duration alert_retention{Duration{72.0 * 3600.0}};
};

/** @brief An event held for a recipient that is not live in the room. */
struct QueuedMessage final {
    std::string recipient_id{};
    Envelope envelope{};
    TimePoint enqueued_at{};
    int attempts{};  /**< Failed delivery attempts so far. */
};

struct RouterStats final {
    std::size_t published{};
    std::size_t delivered{};
    std::size_t queued{};
    std::size_t flushed{};
    std::size_t expired{};
    std::size_t delivery_failures{};
    std::size_t routing_gaps{};
    std::size_t pending{};
};

class BroadcastRouter final : public EventPublisher {
  public:
    BroadcastRouter(ConnectionRegistry& registry, const DirectoryService& directory, RetentionPolicy policy);

    void publish(const std::vector<std::string>& room_ids, const OutboundEvent& event, TimePoint now) override;

    /**
     * @brief React to a registry presence change: flush the backlog of a user
     *        joining a room and announce users coming online or going offline.
     */
    void on_presence(const PresenceEvent& presence, TimePoint now);

    /** @brief Retry queued events for every user that is live in the event's room. */
    std::size_t flush_pending(TimePoint now);

    /** @brief Drop queued events older than their retention window. */
    std::size_t purge_expired(TimePoint now);

    [[nodiscard]] std::vector<QueuedMessage> queued_for(const std::string& user_id) const;
    [[nodiscard]] RouterStats stats() const;

  private:
    [[nodiscard]] Duration retention_for(EventCategory category) const noexcept;
    [[nodiscard]] bool has_backlog_locked(const std::string& user_id, const std::string& room_id) const;
    void enqueue_locked(const std::string& user_id, const Envelope& envelope, TimePoint now, int attempts);
    /** @return True when at least one live session of the user accepted the frame. */
    bool deliver_locked(const std::vector<LiveSession>& list_sessions, const Envelope& envelope);
    std::size_t flush_user_locked(const std::string& user_id, TimePoint now);

    ConnectionRegistry& registry_;
    const DirectoryService& directory_;
    RetentionPolicy policy_;
    mutable std::mutex mutex_;
    std::uint64_t next_sequence_{1};
    std::map<std::string, std::deque<QueuedMessage>> map_queues_;
    RouterStats struct_stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
