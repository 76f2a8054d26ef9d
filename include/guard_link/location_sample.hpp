#pragma once

#include <optional>
#include <string>

#include "guard_link/types.hpp"

namespace guard_link {

/**
 * @brief Position report as received from an agent device.
 */
struct LocationReport final {
    GeodeticCoordinate position{};            /**< Reported position. */
    double accuracy_m{};                      /**< Horizontal accuracy radius in metres. */
    std::optional<double> battery_percent{};  /**< Device battery, 0..100. */
    std::optional<double> speed_mps{};        /**< Ground speed if reported. */
    std::optional<double> heading_deg{};      /**< Heading if reported. */
    TimePoint captured_at{};                  /**< Device capture timestamp. */
};

/**
 * @brief Accepted (or audited) sample bound to the agent's active shift.
 *        Immutable once created.
 */
struct LocationSample final {
    std::string agent_id{};
    std::string site_id{};
    std::string shift_id{};
    GeodeticCoordinate position{};
    double accuracy_m{};
    std::optional<double> battery_percent{};
    std::optional<double> speed_mps{};
    std::optional<double> heading_deg{};
    TimePoint captured_at{};
};

/** @brief Freshness label derived at read time. */
enum class SampleStatus {
    Active,
    Stale
};

[[nodiscard]] inline const char* to_string(SampleStatus status) noexcept {
    return status == SampleStatus::Active ? "active" : "stale";
}

}  // namespace guard_link
