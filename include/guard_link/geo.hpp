// === Geodesy Helpers =========================================================
//
// Great-circle distance and planar polygon tests used by geofence evaluation.
// Polygon math projects vertices onto a local equirectangular plane centred on
// the query point, which is accurate to well under a metre at site scale.

#pragma once

#include <vector>

#include "guard_link/types.hpp"

namespace guard_link {

inline constexpr double k_earth_radius_m{6'371'000.0};

/** @brief Great-circle distance between two coordinates in metres. */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/** @brief True when latitude/longitude are finite and within range. */
[[nodiscard]] bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept;

/** @brief Polygon containment; points on an edge count as inside. */
[[nodiscard]] bool polygon_contains(const std::vector<GeodeticCoordinate>& vertices, const GeodeticCoordinate& point);

/** @brief Shortest distance from @p point to any polygon edge in metres. */
[[nodiscard]] double distance_to_polygon_edge_m(const std::vector<GeodeticCoordinate>& vertices,
                                                const GeodeticCoordinate& point);

/** @brief Arithmetic mean of the vertices. */
[[nodiscard]] GeodeticCoordinate polygon_centroid(const std::vector<GeodeticCoordinate>& vertices);

}  // namespace guard_link
