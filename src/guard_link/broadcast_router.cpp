#include "guard_link/broadcast_router.hpp"

#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "guard_link/rooms.hpp"

namespace guard_link {

namespace {
const char* to_string(EventCategory category) {
    switch (category) {
        case EventCategory::Location:
            return "location";
        case EventCategory::Alert:
            return "alert";
        case EventCategory::Presence:
            return "presence";
    }
    return "unknown";
}

std::vector<LiveSession> sessions_of(std::vector<LiveSession> list_sessions, const std::string& user_id) {
    std::vector<LiveSession> list_user_sessions;
    for (LiveSession& live : list_sessions) {
        if (live.user_id == user_id) {
            list_user_sessions.push_back(std::move(live));
        }
    }
    return list_user_sessions;
}
}  // namespace

BroadcastRouter::BroadcastRouter(ConnectionRegistry& registry, const DirectoryService& directory, RetentionPolicy policy)
    : registry_(registry),
      directory_(directory),
      policy_(policy),
      logger_(get_logger()) {
    if (policy_.location_retention.count() <= 0.0 || policy_.alert_retention.count() <= 0.0) {
        throw std::invalid_argument("BroadcastRouter retention windows must be positive");
    }
}

/**
 * @brief Live recipients are resolved across every room before anything is
 *        queued, so a user live in any target room is delivered to through
 *        that room. Users only known to a room are queued under the first
 *        room that lists them.
 */
void BroadcastRouter::publish(const std::vector<std::string>& room_ids, const OutboundEvent& event, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const std::uint64_t sequence = next_sequence_++;
    ++struct_stats_.published;

    // user -> (room, sessions) of the first target room the user is live in
    std::map<std::string, std::pair<std::string, std::vector<LiveSession>>> map_live_targets;
    // user -> first target room the user is known to while not live there
    std::map<std::string, std::string> map_known_targets;
    for (const std::string& room_id : room_ids) {
        std::map<std::string, std::vector<LiveSession>> map_live_by_user;
        for (LiveSession& live : registry_.route(room_id)) {
            map_live_by_user[live.user_id].push_back(std::move(live));
        }
        std::set<std::string> set_known;
        for (std::string& user_id : registry_.subscribers(room_id)) {
            set_known.insert(std::move(user_id));
        }
        for (std::string& user_id : directory_.room_members(room_id)) {
            set_known.insert(std::move(user_id));
        }
        if (map_live_by_user.empty() && set_known.empty()) {
            ++struct_stats_.routing_gaps;
            logger_->warn(
                R"({{"component":"router","action":"routing_gap","room":"{}","event":"{}","sequence":{}}})",
                room_id,
                event.name,
                sequence
            );
            continue;
        }
        for (auto& [user_id, list_sessions] : map_live_by_user) {
            map_live_targets.try_emplace(user_id, room_id, std::move(list_sessions));
        }
        for (const std::string& user_id : set_known) {
            map_known_targets.try_emplace(user_id, room_id);
        }
    }

    for (const auto& [user_id, target] : map_live_targets) {
        const auto& [room_id, list_sessions] = target;
        const Envelope envelope{sequence, room_id, event, now};
        if (has_backlog_locked(user_id, room_id)) {
            enqueue_locked(user_id, envelope, now, 0);
        } else if (!deliver_locked(list_sessions, envelope)) {
            enqueue_locked(user_id, envelope, now, 1);
        }
    }
    for (const auto& [user_id, room_id] : map_known_targets) {
        if (map_live_targets.contains(user_id)) {
            continue;
        }
        enqueue_locked(user_id, Envelope{sequence, room_id, event, now}, now, 0);
    }
}

void BroadcastRouter::on_presence(const PresenceEvent& presence, TimePoint now) {
    switch (presence.change) {
        case PresenceChange::JoinedRoom: {
            std::scoped_lock lock(mutex_);
            flush_user_locked(presence.user_id, now);
            break;
        }
        case PresenceChange::Online:
        case PresenceChange::Offline: {
            const char* status = presence.change == PresenceChange::Online ? "online" : "offline";
            OutboundEvent event{
                "user_status_change",
                EventCategory::Presence,
                fmt::format(
                    R"({{"user_id":"{}","role":"{}","status":"{}","at":{}}})",
                    json_escape(presence.user_id),
                    to_string(presence.role),
                    status,
                    to_epoch_ms(presence.at)
                ),
            };
            publish({rooms::role(Role::Supervisor)}, event, now);
            break;
        }
        case PresenceChange::LeftRoom:
            break;
    }
}

std::size_t BroadcastRouter::flush_pending(TimePoint now) {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_users;
    list_users.reserve(map_queues_.size());
    for (const auto& [user_id, queue_messages] : map_queues_) {
        list_users.push_back(user_id);
    }
    std::size_t flushed_count = 0;
    for (const std::string& user_id : list_users) {
        flushed_count += flush_user_locked(user_id, now);
    }
    return flushed_count;
}

std::size_t BroadcastRouter::purge_expired(TimePoint now) {
    std::scoped_lock lock(mutex_);
    std::size_t expired_count = 0;
    for (auto iterator_queue = map_queues_.begin(); iterator_queue != map_queues_.end();) {
        std::deque<QueuedMessage>& queue_messages = iterator_queue->second;
        std::deque<QueuedMessage> queue_kept;
        for (QueuedMessage& message : queue_messages) {
            const Duration age{now - message.enqueued_at};
            if (age > retention_for(message.envelope.event.category)) {
                logger_->warn(
                    R"({{"component":"router","action":"expire","recipient":"{}","room":"{}","event":"{}","sequence":{},"age_s":{:.0f},"attempts":{}}})",
                    message.recipient_id,
                    message.envelope.room_id,
                    message.envelope.event.name,
                    message.envelope.sequence,
                    age.count(),
                    message.attempts
                );
                ++expired_count;
                continue;
            }
            queue_kept.push_back(std::move(message));
        }
        if (queue_kept.empty()) {
            iterator_queue = map_queues_.erase(iterator_queue);
        } else {
            queue_messages = std::move(queue_kept);
            ++iterator_queue;
        }
    }
    struct_stats_.expired += expired_count;
    return expired_count;
}

std::vector<QueuedMessage> BroadcastRouter::queued_for(const std::string& user_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_queue = map_queues_.find(user_id);
    if (iterator_queue == map_queues_.end()) {
        return {};
    }
    return {iterator_queue->second.begin(), iterator_queue->second.end()};
}

RouterStats BroadcastRouter::stats() const {
    std::scoped_lock lock(mutex_);
    RouterStats snapshot = struct_stats_;
    snapshot.pending = 0;
    for (const auto& [user_id, queue_messages] : map_queues_) {
        snapshot.pending += queue_messages.size();
    }
    return snapshot;
}

Duration BroadcastRouter::retention_for(EventCategory category) const noexcept {
    return category == EventCategory::Alert ? policy_.alert_retention : policy_.location_retention;
}

bool BroadcastRouter::has_backlog_locked(const std::string& user_id, const std::string& room_id) const {
    const auto iterator_queue = map_queues_.find(user_id);
    if (iterator_queue == map_queues_.end()) {
        return false;
    }
    for (const QueuedMessage& message : iterator_queue->second) {
        if (message.envelope.room_id == room_id) {
            return true;
        }
    }
    return false;
}

void BroadcastRouter::enqueue_locked(const std::string& user_id, const Envelope& envelope, TimePoint now, int attempts) {
    map_queues_[user_id].push_back(QueuedMessage{user_id, envelope, now, attempts});
    ++struct_stats_.queued;
    logger_->debug(
        R"({{"component":"router","action":"queue","recipient":"{}","room":"{}","event":"{}","category":"{}","sequence":{}}})",
        user_id,
        envelope.room_id,
        envelope.event.name,
        to_string(envelope.event.category),
        envelope.sequence
    );
}

bool BroadcastRouter::deliver_locked(const std::vector<LiveSession>& list_sessions, const Envelope& envelope) {
    bool delivered = false;
    for (const LiveSession& live : list_sessions) {
        try {
            live.sink(envelope);
            delivered = true;
            ++struct_stats_.delivered;
        } catch (const std::exception& exc) {
            ++struct_stats_.delivery_failures;
            logger_->warn(
                R"({{"component":"router","action":"delivery_failed","session":{},"user":"{}","room":"{}","sequence":{},"error":"{}"}})",
                live.handle,
                live.user_id,
                envelope.room_id,
                envelope.sequence,
                json_escape(exc.what())
            );
        }
    }
    return delivered;
}

std::size_t BroadcastRouter::flush_user_locked(const std::string& user_id, TimePoint now) {
    const auto iterator_queue = map_queues_.find(user_id);
    if (iterator_queue == map_queues_.end()) {
        return 0;
    }

    std::map<std::string, std::vector<LiveSession>> map_room_sessions;
    std::set<std::string> set_blocked_rooms;
    std::deque<QueuedMessage> queue_remaining;
    std::size_t flushed_count = 0;

    for (QueuedMessage& message : iterator_queue->second) {
        const std::string& room_id = message.envelope.room_id;
        if (set_blocked_rooms.contains(room_id)) {
            queue_remaining.push_back(std::move(message));
            continue;
        }
        auto iterator_room = map_room_sessions.find(room_id);
        if (iterator_room == map_room_sessions.end()) {
            iterator_room = map_room_sessions.emplace(room_id, sessions_of(registry_.route(room_id), user_id)).first;
        }
        const std::vector<LiveSession>& list_sessions = iterator_room->second;
        if (list_sessions.empty()) {
            set_blocked_rooms.insert(room_id);
            queue_remaining.push_back(std::move(message));
            continue;
        }
        if (!deliver_locked(list_sessions, message.envelope)) {
            ++message.attempts;
            set_blocked_rooms.insert(room_id);
            queue_remaining.push_back(std::move(message));
            continue;
        }
        ++flushed_count;
    }

    if (queue_remaining.empty()) {
        map_queues_.erase(iterator_queue);
    } else {
        iterator_queue->second = std::move(queue_remaining);
    }
    struct_stats_.flushed += flushed_count;
    if (flushed_count > 0) {
        logger_->info(
            R"({{"component":"router","action":"flush","recipient":"{}","delivered":{},"remaining":{},"at":{}}})",
            user_id,
            flushed_count,
            map_queues_.contains(user_id) ? map_queues_.at(user_id).size() : 0,
            to_epoch_ms(now)
        );
    }
    return flushed_count;
}

}  // namespace guard_link
