#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "guard_link/directory.hpp"

namespace guard_link {

/**
 * @brief Static directory and token table for the server demo and tests.
 *        Production deployments back these interfaces with the scheduling
 *        and identity services.
 */
class InMemoryDirectory final : public DirectoryService, public AuthService {
  public:
    void add_token(const std::string& token, Principal principal);
    void revoke_token(const std::string& token);
    void add_agent(const std::string& agent_id);
    /** @brief Throws std::invalid_argument if the agent already has an overlapping shift. */
    void add_shift(ShiftAssignment shift);
    void add_site(SiteRouting routing);
    void assign_member(const std::string& room_id, const std::string& user_id);

    [[nodiscard]] std::optional<Principal> authenticate(const std::string& token) override;

    [[nodiscard]] bool agent_exists(const std::string& agent_id) const override;
    [[nodiscard]] std::optional<ShiftAssignment> active_shift(const std::string& agent_id, TimePoint at) const override;
    [[nodiscard]] std::optional<SiteRouting> site_routing(const std::string& site_id) const override;
    [[nodiscard]] std::vector<std::string> room_members(const std::string& room_id) const override;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, Principal> map_tokens_;
    std::set<std::string> set_agents_;
    std::vector<ShiftAssignment> list_shifts_;
    std::map<std::string, SiteRouting> map_sites_;
    std::map<std::string, std::set<std::string>> map_room_members_;
};

}  // namespace guard_link
