#include "guard_link/alert_record.hpp"

namespace guard_link {

std::string_view to_string(AlertType type) noexcept {
    switch (type) {
        case AlertType::Panic:
            return "PANIC";
        case AlertType::Medical:
            return "MEDICAL";
        case AlertType::Security:
            return "SECURITY";
        case AlertType::Fire:
            return "FIRE";
        case AlertType::General:
            return "GENERAL";
    }
    return "UNKNOWN";
}

std::string_view to_string(AlertPriority priority) noexcept {
    switch (priority) {
        case AlertPriority::Normal:
            return "NORMAL";
        case AlertPriority::High:
            return "HIGH";
        case AlertPriority::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string_view to_string(AlertStatus status) noexcept {
    switch (status) {
        case AlertStatus::Open:
            return "OPEN";
        case AlertStatus::Acknowledged:
            return "ACKNOWLEDGED";
        case AlertStatus::Resolved:
            return "RESOLVED";
    }
    return "UNKNOWN";
}

std::string_view to_string(ResolutionKind kind) noexcept {
    return kind == ResolutionKind::FalseAlarm ? "FALSE_ALARM" : "RESOLVED";
}

std::optional<AlertType> alert_type_from_string(std::string_view str_type) noexcept {
    if (str_type == "PANIC") {
        return AlertType::Panic;
    }
    if (str_type == "MEDICAL") {
        return AlertType::Medical;
    }
    if (str_type == "SECURITY") {
        return AlertType::Security;
    }
    if (str_type == "FIRE") {
        return AlertType::Fire;
    }
    if (str_type == "GENERAL") {
        return AlertType::General;
    }
    return std::nullopt;
}

}  // namespace guard_link
