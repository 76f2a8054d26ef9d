#include "guard_link/errors.hpp"

namespace guard_link {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Authentication:
            return "authentication";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::StaleData:
            return "stale_data";
        case ErrorKind::Routing:
            return "routing";
        case ErrorKind::Persistence:
            return "persistence";
        case ErrorKind::StateConflict:
            return "state_conflict";
    }
    return "unknown";
}

GuardLinkError::GuardLinkError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

ErrorKind GuardLinkError::kind() const noexcept {
    return kind_;
}

AuthenticationError::AuthenticationError(const std::string& message)
    : GuardLinkError(ErrorKind::Authentication, message) {}

ValidationError::ValidationError(const std::string& message)
    : GuardLinkError(ErrorKind::Validation, message) {}

PersistenceError::PersistenceError(const std::string& message)
    : GuardLinkError(ErrorKind::Persistence, message) {}

}  // namespace guard_link
