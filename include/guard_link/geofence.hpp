// === Geofence ================================================================
//
// Site boundary definitions (circle or polygon) and the point-in-boundary
// evaluation used by location ingest. Boundaries are inclusive: a sample lying
// exactly on the radius or on a polygon edge is inside.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "guard_link/types.hpp"

namespace guard_link {

enum class GeofenceShape {
    Circle,
    Polygon
};

/** @brief Security classification of the guarded site. */
enum class SecurityLevel {
    Standard,
    Elevated,
    Restricted
};

/** @brief Graded by how far outside the boundary the sample lies. */
enum class ViolationSeverity {
    Low,
    Medium,
    High
};

[[nodiscard]] std::string_view to_string(SecurityLevel level) noexcept;
[[nodiscard]] std::string_view to_string(ViolationSeverity severity) noexcept;
[[nodiscard]] std::optional<ViolationSeverity> severity_from_string(std::string_view str_severity) noexcept;

/** @brief Boundary bound to a site; immutable once constructed. */
struct Geofence final {
    std::string site_id{};
    GeofenceShape shape{GeofenceShape::Circle};
    GeodeticCoordinate center{};                /**< Circle centre, or polygon centroid. */
    double radius_m{};                          /**< Circle radius, or polygon circumradius. */
    std::vector<GeodeticCoordinate> vertices{};  /**< Polygon vertices; empty for circles. */
    SecurityLevel security_level{SecurityLevel::Standard};

    /** @brief Build a circular geofence; throws std::invalid_argument on a non-positive radius. */
    static Geofence circle(std::string site_id, GeodeticCoordinate center, double radius_m,
                           SecurityLevel security_level = SecurityLevel::Standard);
    /** @brief Build a polygon geofence; throws std::invalid_argument with fewer than three vertices. */
    static Geofence polygon(std::string site_id, std::vector<GeodeticCoordinate> vertices,
                            SecurityLevel security_level = SecurityLevel::Standard);
};

/** @brief Outcome of testing one position against a geofence. */
struct GeofenceEvaluation final {
    bool inside{true};
    double distance_outside_m{};   /**< Zero when inside. */
    double allowed_radius_m{};
    ViolationSeverity severity{ViolationSeverity::Low};
};

/** @brief O(1) for circles, O(vertices) for polygons. */
[[nodiscard]] GeofenceEvaluation evaluate_geofence(const Geofence& geofence, const GeodeticCoordinate& position);

/**
 * @brief Grade an excursion by the excess ratio over the allowed radius:
 *        above 100% is High, above 50% is Medium, otherwise Low.
 */
[[nodiscard]] ViolationSeverity classify_violation(double distance_outside_m, double allowed_radius_m) noexcept;

}  // namespace guard_link
