#include "guard_link/connection_registry.hpp"

#include <stdexcept>

#include "guard_link/errors.hpp"
#include "guard_link/rooms.hpp"

namespace guard_link {

namespace {
const char* to_string(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::ClientClosed:
            return "client_closed";
        case DisconnectReason::IdleTimeout:
            return "idle_timeout";
        case DisconnectReason::Shutdown:
            return "shutdown";
    }
    return "unknown";
}
}  // namespace

ConnectionRegistry::ConnectionRegistry(AuthService& auth_service,
                                       const DirectoryService& directory,
                                       Duration idle_timeout,
                                       EventChannel<PresenceEvent>& presence_channel)
    : auth_service_(auth_service),
      directory_(directory),
      idle_timeout_(idle_timeout),
      presence_channel_(presence_channel),
      logger_(get_logger()) {
    if (idle_timeout_.count() <= 0.0) {
        throw std::invalid_argument("ConnectionRegistry idle timeout must be positive");
    }
}

SessionHandle ConnectionRegistry::register_session(const std::string& token, FrameSink sink, TimePoint now) {
    if (!sink) {
        throw std::invalid_argument("ConnectionRegistry requires a frame sink");
    }
    std::optional<Principal> optional_principal = auth_service_.authenticate(token);
    if (!optional_principal.has_value()) {
        logger_->warn(R"({{"component":"registry","action":"reject","reason":"invalid_token"}})");
        throw AuthenticationError("Invalid authentication token");
    }

    std::scoped_lock lock(mutex_);
    const SessionHandle handle = next_handle_++;
    Session& session = map_sessions_[handle];
    session.principal = std::move(optional_principal.value());
    session.sink = std::move(sink);
    session.connected_at = now;
    session.last_seen_at = now;

    const Principal& principal = session.principal;
    if (++map_user_session_counts_[principal.user_id] == 1) {
        publish_presence(PresenceChange::Online, handle, principal, {}, now);
    }

    join_locked(handle, session, rooms::user(principal.user_id), now);
    join_locked(handle, session, rooms::role(principal.role), now);
    if (principal.agent_id.has_value()) {
        join_locked(handle, session, rooms::agent(*principal.agent_id), now);
    }
    if (principal.client_id.has_value()) {
        join_locked(handle, session, rooms::client(*principal.client_id), now);
    }

    logger_->info(
        R"({{"component":"registry","action":"connect","session":{},"user":"{}","role":"{}"}})",
        handle,
        principal.user_id,
        to_string(principal.role)
    );
    return handle;
}

void ConnectionRegistry::join_room(SessionHandle handle, const std::string& room_id, TimePoint now) {
    if (room_id.empty()) {
        throw ValidationError("Room id cannot be empty");
    }
    std::scoped_lock lock(mutex_);
    const auto iterator_session = map_sessions_.find(handle);
    if (iterator_session == map_sessions_.end()) {
        throw ValidationError("Unknown session " + std::to_string(handle));
    }
    Session& session = iterator_session->second;
    if (!can_join(session.principal, room_id)) {
        logger_->warn(
            R"({{"component":"registry","action":"join_denied","session":{},"user":"{}","room":"{}"}})",
            handle,
            session.principal.user_id,
            room_id
        );
        throw AuthenticationError("Access denied to room " + room_id);
    }
    session.last_seen_at = now;
    join_locked(handle, session, room_id, now);
}

void ConnectionRegistry::leave_room(SessionHandle handle, const std::string& room_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const auto iterator_session = map_sessions_.find(handle);
    if (iterator_session == map_sessions_.end()) {
        return;
    }
    Session& session = iterator_session->second;
    session.last_seen_at = now;
    if (session.rooms.erase(room_id) == 0) {
        return;
    }
    map_room_sessions_[room_id].erase(handle);
    if (map_room_sessions_[room_id].empty()) {
        map_room_sessions_.erase(room_id);
    }
    map_room_subscribers_[room_id].erase(session.principal.user_id);
    publish_presence(PresenceChange::LeftRoom, handle, session.principal, room_id, now);
}

std::vector<LiveSession> ConnectionRegistry::route(const std::string& room_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<LiveSession> list_live;
    const auto iterator_room = map_room_sessions_.find(room_id);
    if (iterator_room == map_room_sessions_.end()) {
        return list_live;
    }
    list_live.reserve(iterator_room->second.size());
    for (const SessionHandle handle : iterator_room->second) {
        const Session& session = map_sessions_.at(handle);
        list_live.push_back(LiveSession{handle, session.principal.user_id, session.sink});
    }
    return list_live;
}

std::vector<std::string> ConnectionRegistry::subscribers(const std::string& room_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_room = map_room_subscribers_.find(room_id);
    if (iterator_room == map_room_subscribers_.end()) {
        return {};
    }
    return {iterator_room->second.begin(), iterator_room->second.end()};
}

bool ConnectionRegistry::touch(SessionHandle handle, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const auto iterator_session = map_sessions_.find(handle);
    if (iterator_session == map_sessions_.end()) {
        return false;
    }
    iterator_session->second.last_seen_at = now;
    return true;
}

bool ConnectionRegistry::disconnect(SessionHandle handle, DisconnectReason reason, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const auto iterator_session = map_sessions_.find(handle);
    if (iterator_session == map_sessions_.end()) {
        return false;
    }
    Session session = std::move(iterator_session->second);
    map_sessions_.erase(iterator_session);

    for (const std::string& room_id : session.rooms) {
        auto iterator_room = map_room_sessions_.find(room_id);
        if (iterator_room != map_room_sessions_.end()) {
            iterator_room->second.erase(handle);
            if (iterator_room->second.empty()) {
                map_room_sessions_.erase(iterator_room);
            }
        }
        publish_presence(PresenceChange::LeftRoom, handle, session.principal, room_id, now);
    }

    const std::string& user_id = session.principal.user_id;
    if (--map_user_session_counts_[user_id] == 0) {
        map_user_session_counts_.erase(user_id);
        publish_presence(PresenceChange::Offline, handle, session.principal, {}, now);
    }

    logger_->info(
        R"({{"component":"registry","action":"disconnect","session":{},"user":"{}","reason":"{}"}})",
        handle,
        user_id,
        to_string(reason)
    );
    return true;
}

std::size_t ConnectionRegistry::expire_idle(TimePoint now) {
    std::vector<SessionHandle> list_expired;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [handle, session] : map_sessions_) {
            if (Duration{now - session.last_seen_at} > idle_timeout_) {
                list_expired.push_back(handle);
            }
        }
    }
    std::size_t expired_count = 0;
    for (const SessionHandle handle : list_expired) {
        if (disconnect(handle, DisconnectReason::IdleTimeout, now)) {
            ++expired_count;
        }
    }
    return expired_count;
}

std::optional<SessionSnapshot> ConnectionRegistry::session(SessionHandle handle) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_session = map_sessions_.find(handle);
    if (iterator_session == map_sessions_.end()) {
        return std::nullopt;
    }
    const Session& session = iterator_session->second;
    return SessionSnapshot{handle, session.principal, session.rooms, session.connected_at, session.last_seen_at};
}

bool ConnectionRegistry::is_user_online(const std::string& user_id) const {
    std::scoped_lock lock(mutex_);
    return map_user_session_counts_.contains(user_id);
}

std::vector<std::string> ConnectionRegistry::connected_users() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_users;
    list_users.reserve(map_user_session_counts_.size());
    for (const auto& [user_id, count] : map_user_session_counts_) {
        list_users.push_back(user_id);
    }
    return list_users;
}

std::size_t ConnectionRegistry::session_count() const {
    std::scoped_lock lock(mutex_);
    return map_sessions_.size();
}

bool ConnectionRegistry::can_join(const Principal& principal, const std::string& room_id) const {
    if (principal.role == Role::Supervisor || principal.role == Role::Admin) {
        return true;
    }
    if (room_id == rooms::user(principal.user_id) || room_id == rooms::role(principal.role)) {
        return true;
    }
    if (principal.role == Role::Agent) {
        return principal.agent_id.has_value() && room_id == rooms::agent(*principal.agent_id);
    }
    if (!principal.client_id.has_value()) {
        return false;
    }
    if (room_id == rooms::client(*principal.client_id)) {
        return true;
    }
    const std::string site_prefix = rooms::site("");
    if (room_id.starts_with(site_prefix)) {
        const std::optional<SiteRouting> routing = directory_.site_routing(room_id.substr(site_prefix.size()));
        return routing.has_value() && routing->client_id == *principal.client_id;
    }
    return false;
}

void ConnectionRegistry::join_locked(SessionHandle handle, Session& session, const std::string& room_id, TimePoint now) {
    if (!session.rooms.insert(room_id).second) {
        return;
    }
    map_room_sessions_[room_id].insert(handle);
    map_room_subscribers_[room_id].insert(session.principal.user_id);
    publish_presence(PresenceChange::JoinedRoom, handle, session.principal, room_id, now);
}

void ConnectionRegistry::publish_presence(PresenceChange change, SessionHandle handle, const Principal& principal,
                                          const std::string& room_id, TimePoint now) {
    presence_channel_.publish(PresenceEvent{change, handle, principal.user_id, principal.role, room_id, now});
}

}  // namespace guard_link
