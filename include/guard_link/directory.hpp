// === External Directory & Auth ===============================================
//
// Contracts consumed from collaborators outside the coordination core: token
// validation at connection time, and the agent -> shift -> site -> geofence
// and site -> recipients resolution used for routing and escalation.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "guard_link/geofence.hpp"
#include "guard_link/types.hpp"

namespace guard_link {

/** @brief Identity returned by the auth service. */
struct Principal final {
    std::string user_id{};
    Role role{Role::Agent};
    std::optional<std::string> agent_id{};   /**< Present for agent users. */
    std::optional<std::string> client_id{};  /**< Present for client users. */
};

/** @brief A shift in progress and the single geofence used for it. */
struct ShiftAssignment final {
    std::string shift_id{};
    std::string agent_id{};
    std::string site_id{};
    TimePoint starts_at{};
    TimePoint ends_at{};
    Geofence geofence{};
};

/** @brief Routing metadata of a site. */
struct SiteRouting final {
    std::string site_id{};
    std::string area_id{};
    std::string client_id{};
};

/** @brief Validates session tokens. */
class AuthService {
  public:
    virtual ~AuthService() = default;

    /** @brief Resolve @p token, or std::nullopt when it is bad or expired. */
    [[nodiscard]] virtual std::optional<Principal> authenticate(const std::string& token) = 0;
};

/** @brief Read-only view of assignments maintained by the scheduling system. */
class DirectoryService {
  public:
    virtual ~DirectoryService() = default;

    [[nodiscard]] virtual bool agent_exists(const std::string& agent_id) const = 0;
    /** @brief Shift of @p agent_id in progress at @p at. */
    [[nodiscard]] virtual std::optional<ShiftAssignment> active_shift(const std::string& agent_id, TimePoint at) const = 0;
    [[nodiscard]] virtual std::optional<SiteRouting> site_routing(const std::string& site_id) const = 0;
    /**
     * @brief Users assigned to @p room_id whether or not they are connected,
     *        e.g. the supervisors of a site.
     */
    [[nodiscard]] virtual std::vector<std::string> room_members(const std::string& room_id) const = 0;
};

}  // namespace guard_link
