#include "guard_link/geofence.hpp"

#include <algorithm>
#include <stdexcept>

#include "guard_link/geo.hpp"

namespace guard_link {

namespace {
constexpr double k_high_excess_ratio{1.0};
constexpr double k_medium_excess_ratio{0.5};
}  // namespace

std::string_view to_string(SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::Standard:
            return "STANDARD";
        case SecurityLevel::Elevated:
            return "ELEVATED";
        case SecurityLevel::Restricted:
            return "RESTRICTED";
    }
    return "UNKNOWN";
}

std::string_view to_string(ViolationSeverity severity) noexcept {
    switch (severity) {
        case ViolationSeverity::Low:
            return "LOW";
        case ViolationSeverity::Medium:
            return "MEDIUM";
        case ViolationSeverity::High:
            return "HIGH";
    }
    return "UNKNOWN";
}

std::optional<ViolationSeverity> severity_from_string(std::string_view str_severity) noexcept {
    for (const ViolationSeverity severity : {ViolationSeverity::Low, ViolationSeverity::Medium, ViolationSeverity::High}) {
        if (to_string(severity) == str_severity) {
            return severity;
        }
    }
    return std::nullopt;
}

Geofence Geofence::circle(std::string site_id, GeodeticCoordinate center, double radius_m, SecurityLevel security_level) {
    if (radius_m <= 0.0) {
        throw std::invalid_argument("Geofence radius must be positive");
    }
    if (!is_valid_coordinate(center)) {
        throw std::invalid_argument("Geofence center is not a valid coordinate");
    }
    Geofence geofence{};
    geofence.site_id = std::move(site_id);
    geofence.shape = GeofenceShape::Circle;
    geofence.center = center;
    geofence.radius_m = radius_m;
    geofence.security_level = security_level;
    return geofence;
}

Geofence Geofence::polygon(std::string site_id, std::vector<GeodeticCoordinate> vertices, SecurityLevel security_level) {
    if (vertices.size() < 3) {
        throw std::invalid_argument("Geofence polygon requires at least three vertices");
    }
    for (const GeodeticCoordinate& vertex : vertices) {
        if (!is_valid_coordinate(vertex)) {
            throw std::invalid_argument("Geofence polygon vertex is not a valid coordinate");
        }
    }
    Geofence geofence{};
    geofence.site_id = std::move(site_id);
    geofence.shape = GeofenceShape::Polygon;
    geofence.center = polygon_centroid(vertices);
    for (const GeodeticCoordinate& vertex : vertices) {
        geofence.radius_m = std::max(geofence.radius_m, haversine_distance_m(geofence.center, vertex));
    }
    geofence.vertices = std::move(vertices);
    geofence.security_level = security_level;
    return geofence;
}

GeofenceEvaluation evaluate_geofence(const Geofence& geofence, const GeodeticCoordinate& position) {
    GeofenceEvaluation evaluation{};
    evaluation.allowed_radius_m = geofence.radius_m;

    if (geofence.shape == GeofenceShape::Circle) {
        const double distance_m = haversine_distance_m(geofence.center, position);
        evaluation.inside = distance_m <= geofence.radius_m;
        evaluation.distance_outside_m = evaluation.inside ? 0.0 : distance_m - geofence.radius_m;
    } else {
        evaluation.inside = polygon_contains(geofence.vertices, position);
        evaluation.distance_outside_m = evaluation.inside ? 0.0 : distance_to_polygon_edge_m(geofence.vertices, position);
    }

    if (!evaluation.inside) {
        evaluation.severity = classify_violation(evaluation.distance_outside_m, evaluation.allowed_radius_m);
    }
    return evaluation;
}

ViolationSeverity classify_violation(double distance_outside_m, double allowed_radius_m) noexcept {
    if (allowed_radius_m <= 0.0) {
        return ViolationSeverity::High;
    }
    const double excess_ratio = distance_outside_m / allowed_radius_m;
    if (excess_ratio > k_high_excess_ratio) {
        return ViolationSeverity::High;
    }
    if (excess_ratio > k_medium_excess_ratio) {
        return ViolationSeverity::Medium;
    }
    return ViolationSeverity::Low;
}

}  // namespace guard_link
