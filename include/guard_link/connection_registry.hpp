// === Connection Registry =====================================================
//
// Tracks authenticated sessions, their immutable role and their room
// memberships. Holds no business logic: it answers "who is live in this room",
// remembers which users subscribed to a room so offline recipients can be
// queued for, and reports presence changes on a channel consumed by the
// broadcast router.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "guard_link/directory.hpp"
#include "guard_link/envelope.hpp"
#include "guard_link/event_channel.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

using SessionHandle = std::uint64_t;

/** @brief Transport callback delivering one frame to a connected session. Must not block. */
using FrameSink = std::function<void(const Envelope&)>;

enum class PresenceChange {
    Online,      /**< First live session of a user. */
    Offline,     /**< Last live session of a user ended. */
    JoinedRoom,  /**< A session entered a room (explicitly or at registration). */
    LeftRoom     /**< A session left a room (explicitly or by disconnecting). */
};

struct PresenceEvent final {
    PresenceChange change{PresenceChange::Online};
    SessionHandle handle{};
    std::string user_id{};
    Role role{Role::Agent};
    std::string room_id{};  /**< Empty for Online/Offline. */
    TimePoint at{};
};

enum class DisconnectReason {
    ClientClosed,
    IdleTimeout,
    Shutdown
};

/** @brief Routing view of one live session. */
struct LiveSession final {
    SessionHandle handle{};
    std::string user_id{};
    FrameSink sink{};
};

struct SessionSnapshot final {
    SessionHandle handle{};
    Principal principal{};
    std::set<std::string> rooms{};
    TimePoint connected_at{};
    TimePoint last_seen_at{};
};

class ConnectionRegistry final {
  public:
    ConnectionRegistry(AuthService& auth_service,
                       const DirectoryService& directory,
                       Duration idle_timeout,
                       EventChannel<PresenceEvent>& presence_channel);

    /**
     * @brief Authenticate @p token and open a session. The session joins its
     *        personal, role, agent and client rooms automatically.
     * @throws AuthenticationError when the token is rejected.
     */
    SessionHandle register_session(const std::string& token, FrameSink sink, TimePoint now);

    /** @throws AuthenticationError when the role may not enter @p room_id; ValidationError for an unknown handle. */
    void join_room(SessionHandle handle, const std::string& room_id, TimePoint now);
    void leave_room(SessionHandle handle, const std::string& room_id, TimePoint now);

    /** @brief Live sessions currently in @p room_id. */
    [[nodiscard]] std::vector<LiveSession> route(const std::string& room_id) const;
    /** @brief Users that joined @p room_id and have not left it, connected or not. */
    [[nodiscard]] std::vector<std::string> subscribers(const std::string& room_id) const;

    /** @brief Heartbeat; returns false for unknown handles. */
    bool touch(SessionHandle handle, TimePoint now);
    /** @brief Remove the session from every room; returns false if it was already gone. */
    bool disconnect(SessionHandle handle, DisconnectReason reason, TimePoint now);
    /** @brief Disconnect sessions idle beyond the timeout. */
    std::size_t expire_idle(TimePoint now);

    [[nodiscard]] std::optional<SessionSnapshot> session(SessionHandle handle) const;
    [[nodiscard]] bool is_user_online(const std::string& user_id) const;
    [[nodiscard]] std::vector<std::string> connected_users() const;
    [[nodiscard]] std::size_t session_count() const;

  private:
    struct Session final {
        Principal principal{};
        FrameSink sink{};
        std::set<std::string> rooms{};
        TimePoint connected_at{};
        TimePoint last_seen_at{};
    };

    [[nodiscard]] bool can_join(const Principal& principal, const std::string& room_id) const;
    void join_locked(SessionHandle handle, Session& session, const std::string& room_id, TimePoint now);
    void publish_presence(PresenceChange change, SessionHandle handle, const Principal& principal,
                          const std::string& room_id, TimePoint now);

    AuthService& auth_service_;
    const DirectoryService& directory_;
    Duration idle_timeout_;
    EventChannel<PresenceEvent>& presence_channel_;
    mutable std::mutex mutex_;
    SessionHandle next_handle_{1};
    std::unordered_map<SessionHandle, Session> map_sessions_;
    std::unordered_map<std::string, std::set<SessionHandle>> map_room_sessions_;
    std::unordered_map<std::string, std::set<std::string>> map_room_subscribers_;
    std::unordered_map<std::string, std::size_t> map_user_session_counts_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
