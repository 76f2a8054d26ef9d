#include "guard_link/in_memory_directory.hpp"

#include <stdexcept>

namespace guard_link {

void InMemoryDirectory::add_token(const std::string& token, Principal principal) {
    std::scoped_lock lock(mutex_);
    if (principal.agent_id.has_value()) {
        set_agents_.insert(*principal.agent_id);
    }
    map_tokens_[token] = std::move(principal);
}

void InMemoryDirectory::revoke_token(const std::string& token) {
    std::scoped_lock lock(mutex_);
    map_tokens_.erase(token);
}

void InMemoryDirectory::add_agent(const std::string& agent_id) {
    std::scoped_lock lock(mutex_);
    set_agents_.insert(agent_id);
}

void InMemoryDirectory::add_shift(ShiftAssignment shift) {
    if (shift.ends_at <= shift.starts_at) {
        throw std::invalid_argument("Shift must end after it starts");
    }
    if (shift.geofence.site_id != shift.site_id) {
        throw std::invalid_argument("Shift geofence must belong to the shift's site");
    }
    std::scoped_lock lock(mutex_);
    for (const ShiftAssignment& existing : list_shifts_) {
        const bool overlaps = existing.agent_id == shift.agent_id && existing.starts_at < shift.ends_at
            && shift.starts_at < existing.ends_at;
        if (overlaps) {
            throw std::invalid_argument("Agent " + shift.agent_id + " already has an overlapping shift");
        }
    }
    set_agents_.insert(shift.agent_id);
    list_shifts_.push_back(std::move(shift));
}

void InMemoryDirectory::add_site(SiteRouting routing) {
    std::scoped_lock lock(mutex_);
    const std::string site_id = routing.site_id;
    map_sites_[site_id] = std::move(routing);
}

void InMemoryDirectory::assign_member(const std::string& room_id, const std::string& user_id) {
    std::scoped_lock lock(mutex_);
    map_room_members_[room_id].insert(user_id);
}

std::optional<Principal> InMemoryDirectory::authenticate(const std::string& token) {
    std::scoped_lock lock(mutex_);
    const auto iterator_token = map_tokens_.find(token);
    if (iterator_token == map_tokens_.end()) {
        return std::nullopt;
    }
    return iterator_token->second;
}

bool InMemoryDirectory::agent_exists(const std::string& agent_id) const {
    std::scoped_lock lock(mutex_);
    return set_agents_.contains(agent_id);
}

std::optional<ShiftAssignment> InMemoryDirectory::active_shift(const std::string& agent_id, TimePoint at) const {
    std::scoped_lock lock(mutex_);
    for (const ShiftAssignment& shift : list_shifts_) {
        if (shift.agent_id == agent_id && shift.starts_at <= at && at <= shift.ends_at) {
            return shift;
        }
    }
    return std::nullopt;
}

std::optional<SiteRouting> InMemoryDirectory::site_routing(const std::string& site_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_site = map_sites_.find(site_id);
    if (iterator_site == map_sites_.end()) {
        return std::nullopt;
    }
    return iterator_site->second;
}

std::vector<std::string> InMemoryDirectory::room_members(const std::string& room_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_room = map_room_members_.find(room_id);
    if (iterator_room == map_room_members_.end()) {
        return {};
    }
    return {iterator_room->second.begin(), iterator_room->second.end()};
}

}  // namespace guard_link
