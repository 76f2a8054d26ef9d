#include "guard_link/geo.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace guard_link {

namespace {

constexpr double k_edge_tolerance_m{1e-6};  /**< Points this close to an edge are on the boundary. */

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/** @brief Planar offset in metres from a reference coordinate. */
struct LocalPoint final {
    double x_m{};
    double y_m{};
};

LocalPoint project(const GeodeticCoordinate& reference, const GeodeticCoordinate& coordinate) {
    const double cos_lat = std::cos(degrees_to_radians(reference.latitude_deg));
    return LocalPoint{
        degrees_to_radians(coordinate.longitude_deg - reference.longitude_deg) * cos_lat * k_earth_radius_m,
        degrees_to_radians(coordinate.latitude_deg - reference.latitude_deg) * k_earth_radius_m
    };
}

double distance_to_segment_m(const LocalPoint& point, const LocalPoint& a, const LocalPoint& b) {
    const double dx = b.x_m - a.x_m;
    const double dy = b.y_m - a.y_m;
    const double length_sq = dx * dx + dy * dy;
    double t = 0.0;
    if (length_sq > 0.0) {
        t = std::clamp(((point.x_m - a.x_m) * dx + (point.y_m - a.y_m) * dy) / length_sq, 0.0, 1.0);
    }
    const double px = a.x_m + t * dx - point.x_m;
    const double py = a.y_m + t * dy - point.y_m;
    return std::sqrt(px * px + py * py);
}

void require_polygon(const std::vector<GeodeticCoordinate>& vertices) {
    if (vertices.size() < 3) {
        throw std::invalid_argument("Polygon requires at least three vertices");
    }
}

}  // namespace

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept {
    return std::isfinite(coordinate.latitude_deg) && std::isfinite(coordinate.longitude_deg)
        && coordinate.latitude_deg >= -90.0 && coordinate.latitude_deg <= 90.0
        && coordinate.longitude_deg >= -180.0 && coordinate.longitude_deg <= 180.0;
}

bool polygon_contains(const std::vector<GeodeticCoordinate>& vertices, const GeodeticCoordinate& point) {
    require_polygon(vertices);
    if (distance_to_polygon_edge_m(vertices, point) <= k_edge_tolerance_m) {
        return true;
    }

    // Ray cast along +x from the query point, which sits at the local origin.
    bool inside = false;
    const std::size_t count = vertices.size();
    for (std::size_t index = 0, previous = count - 1; index < count; previous = index++) {
        const LocalPoint a = project(point, vertices[index]);
        const LocalPoint b = project(point, vertices[previous]);
        const bool crosses = (a.y_m > 0.0) != (b.y_m > 0.0);
        if (crosses) {
            const double x_intersect = a.x_m + (0.0 - a.y_m) * (b.x_m - a.x_m) / (b.y_m - a.y_m);
            if (x_intersect > 0.0) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double distance_to_polygon_edge_m(const std::vector<GeodeticCoordinate>& vertices, const GeodeticCoordinate& point) {
    require_polygon(vertices);
    const LocalPoint origin{};
    double minimum = std::numeric_limits<double>::max();
    const std::size_t count = vertices.size();
    for (std::size_t index = 0, previous = count - 1; index < count; previous = index++) {
        const double distance = distance_to_segment_m(origin, project(point, vertices[previous]), project(point, vertices[index]));
        minimum = std::min(minimum, distance);
    }
    return minimum;
}

GeodeticCoordinate polygon_centroid(const std::vector<GeodeticCoordinate>& vertices) {
    require_polygon(vertices);
    GeodeticCoordinate centroid{};
    for (const GeodeticCoordinate& vertex : vertices) {
        centroid.latitude_deg += vertex.latitude_deg;
        centroid.longitude_deg += vertex.longitude_deg;
    }
    centroid.latitude_deg /= static_cast<double>(vertices.size());
    centroid.longitude_deg /= static_cast<double>(vertices.size());
    return centroid;
}

}  // namespace guard_link
