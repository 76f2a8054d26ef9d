// === Room Names ==============================================================
//
// Canonical room identifiers. Every component builds room ids through these
// helpers so subscription messages and routing agree on spelling.

#pragma once

#include <string>
#include <string_view>

#include "guard_link/types.hpp"

namespace guard_link::rooms {

inline constexpr std::string_view k_monitoring{"monitoring"};

[[nodiscard]] inline std::string monitoring() {
    return std::string{k_monitoring};
}

[[nodiscard]] inline std::string site(std::string_view site_id) {
    return "site:" + std::string{site_id};
}

[[nodiscard]] inline std::string area(std::string_view area_id) {
    return "area:" + std::string{area_id};
}

[[nodiscard]] inline std::string agent(std::string_view agent_id) {
    return "agent:" + std::string{agent_id};
}

[[nodiscard]] inline std::string client(std::string_view client_id) {
    return "client:" + std::string{client_id};
}

[[nodiscard]] inline std::string user(std::string_view user_id) {
    return "user:" + std::string{user_id};
}

[[nodiscard]] inline std::string role(Role role) {
    return "role:" + std::string{to_string(role)};
}

}  // namespace guard_link::rooms
