#include "guard_link/types.hpp"

namespace guard_link {

std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Agent:
            return "AGENT";
        case Role::Supervisor:
            return "SUPERVISOR";
        case Role::Admin:
            return "ADMIN";
        case Role::Client:
            return "CLIENT";
    }
    return "UNKNOWN";
}

std::optional<Role> role_from_string(std::string_view str_role) noexcept {
    if (str_role == "AGENT") {
        return Role::Agent;
    }
    if (str_role == "SUPERVISOR") {
        return Role::Supervisor;
    }
    if (str_role == "ADMIN") {
        return Role::Admin;
    }
    if (str_role == "CLIENT") {
        return Role::Client;
    }
    return std::nullopt;
}

TimePoint WallClock::now() const {
    return SystemClock::now();
}

ManualClock::ManualClock(TimePoint start) : time_point_(start) {}

TimePoint ManualClock::now() const {
    std::scoped_lock lock(mutex_);
    return time_point_;
}

void ManualClock::advance(Duration delta) {
    std::scoped_lock lock(mutex_);
    time_point_ += to_clock_duration(delta);
}

void ManualClock::set(TimePoint time_point) {
    std::scoped_lock lock(mutex_);
    time_point_ = time_point;
}

}  // namespace guard_link
