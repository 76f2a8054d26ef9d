// === Alert Records ===========================================================
//
// Emergency-alert data model shared by the escalation engine, the audit sink
// and the durable store: alert types, priorities, lifecycle status and the
// per-transition audit event.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "guard_link/types.hpp"

namespace guard_link {

enum class AlertType {
    Panic,
    Medical,
    Security,
    Fire,
    General
};

enum class AlertPriority {
    Normal,
    High,
    Critical
};

/**
 * @brief Lifecycle status. Open alerts escalate; Acknowledged alerts stop
 *        escalating but remain open for resolution; Resolved is final.
 */
enum class AlertStatus : std::uint8_t {
    Open = 0,
    Acknowledged = 1,
    Resolved = 2
};

enum class ResolutionKind {
    Resolved,
    FalseAlarm
};

[[nodiscard]] std::string_view to_string(AlertType type) noexcept;
[[nodiscard]] std::string_view to_string(AlertPriority priority) noexcept;
[[nodiscard]] std::string_view to_string(AlertStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionKind kind) noexcept;
[[nodiscard]] std::optional<AlertType> alert_type_from_string(std::string_view str_type) noexcept;

struct Acknowledgment final {
    std::string user_id{};
    TimePoint acknowledged_at{};
};

struct Resolution final {
    std::string user_id{};
    ResolutionKind kind{ResolutionKind::Resolved};
    std::string notes{};
    TimePoint resolved_at{};
};

/** @brief Snapshot of an emergency alert. */
struct AlertRecord final {
    std::string id{};
    AlertType type{AlertType::General};
    AlertPriority priority{AlertPriority::Normal};
    std::string origin_agent_id{};
    std::string site_id{};
    std::optional<GeodeticCoordinate> location{};
    std::string description{};
    std::optional<double> violation_distance_m{};  /**< Set for geofence-raised alerts. */
    int level{0};
    AlertStatus status{AlertStatus::Open};
    std::vector<Acknowledgment> acknowledgments{};
    std::optional<Resolution> resolution{};
    TimePoint created_at{};
    TimePoint updated_at{};
};

/**
 * @brief One row of the alert transition log. Creation is recorded with no
 *        from_status.
 */
struct AlertEvent final {
    std::string event_id{};                      /**< Unique per alert transition; stores dedupe on it. */
    std::string alert_id{};
    int from_level{0};
    int to_level{0};
    std::optional<AlertStatus> from_status{};
    AlertStatus to_status{AlertStatus::Open};
    TimePoint occurred_at{};
    std::string actor{};
};

/** @brief True for OPEN(n) -> OPEN(n+1) rows. */
[[nodiscard]] inline bool is_escalation(const AlertEvent& event) noexcept {
    return event.from_status == AlertStatus::Open && event.to_status == AlertStatus::Open
        && event.to_level > event.from_level;
}

}  // namespace guard_link
