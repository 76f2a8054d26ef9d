#include "guard_link/location_tracker.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "guard_link/geo.hpp"
#include "guard_link/rooms.hpp"

namespace guard_link {

namespace {
std::string optional_number(const std::optional<double>& value) {
    return value.has_value() ? fmt::format("{:.2f}", *value) : std::string{"null"};
}

std::vector<std::string> sample_rooms(const std::string& site_id, const std::string& agent_id) {
    return {rooms::site(site_id), rooms::monitoring(), rooms::agent(agent_id)};
}
}  // namespace

const char* to_string(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::Accepted:
            return "accepted";
        case IngestStatus::DiscardedLowAccuracy:
            return "discarded_low_accuracy";
        case IngestStatus::RejectedOutOfOrder:
            return "rejected_out_of_order";
        case IngestStatus::RejectedNoActiveShift:
            return "rejected_no_active_shift";
        case IngestStatus::RejectedInvalid:
            return "rejected_invalid";
    }
    return "unknown";
}

LocationTracker::LocationTracker(TrackerConfig config,
                                 const DirectoryService& directory,
                                 EventPublisher& publisher,
                                 AuditSink& audit_sink,
                                 EventChannel<GeofenceViolation>& violation_channel)
    : config_(config),
      directory_(directory),
      publisher_(publisher),
      audit_sink_(audit_sink),
      violation_channel_(violation_channel),
      logger_(get_logger()) {
    if (config_.accuracy_ceiling_m <= 0.0) {
        throw std::invalid_argument("LocationTracker accuracy ceiling must be positive");
    }
    if (config_.violation_cooldown.count() < 0.0) {
        throw std::invalid_argument("LocationTracker violation cooldown cannot be negative");
    }
    if (config_.cache_ttl.count() <= 0.0 || config_.freshness_window.count() <= 0.0) {
        throw std::invalid_argument("LocationTracker cache TTL and freshness window must be positive");
    }
}

IngestResult LocationTracker::ingest(const std::string& agent_id, const LocationReport& report, TimePoint now) {
    if (agent_id.empty()) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "agent id is empty");
    }
    if (!is_valid_coordinate(report.position)) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "coordinates out of range");
    }
    if (!std::isfinite(report.accuracy_m) || report.accuracy_m < 0.0) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "accuracy must be a non-negative number");
    }
    if (report.battery_percent.has_value() && (*report.battery_percent < 0.0 || *report.battery_percent > 100.0)) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "battery must be within 0..100");
    }
    if (report.speed_mps.has_value() && (!std::isfinite(*report.speed_mps) || *report.speed_mps < 0.0)) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "speed cannot be negative");
    }
    if (report.heading_deg.has_value() && (*report.heading_deg < 0.0 || *report.heading_deg >= 360.0)) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "heading must be within [0, 360)");
    }
    if (!directory_.agent_exists(agent_id)) {
        return reject(IngestStatus::RejectedInvalid, agent_id, "unknown agent");
    }

    const std::optional<ShiftAssignment> optional_shift = directory_.active_shift(agent_id, report.captured_at);
    if (!optional_shift.has_value()) {
        return reject(IngestStatus::RejectedNoActiveShift, agent_id, "no shift in progress");
    }
    const ShiftAssignment& shift = optional_shift.value();

    const std::shared_ptr<AgentTrack> track = track_for(agent_id);
    std::scoped_lock track_lock(track->mutex);

    if (track->last_accepted_at.has_value() && report.captured_at <= *track->last_accepted_at) {
        return reject(IngestStatus::RejectedOutOfOrder, agent_id, "sample is not newer than the last accepted sample");
    }

    LocationSample sample{
        agent_id,
        shift.site_id,
        shift.shift_id,
        report.position,
        report.accuracy_m,
        report.battery_percent,
        report.speed_mps,
        report.heading_deg,
        report.captured_at,
    };

    if (report.accuracy_m > config_.accuracy_ceiling_m) {
        audit_sink_.record_location(sample, now);
        {
            std::scoped_lock lock(mutex_);
            ++struct_stats_.discarded_low_accuracy;
        }
        logger_->info(
            R"({{"component":"tracker","action":"discard","agent":"{}","accuracy_m":{:.1f},"ceiling_m":{:.1f}}})",
            agent_id,
            report.accuracy_m,
            config_.accuracy_ceiling_m
        );
        return IngestResult{IngestStatus::DiscardedLowAccuracy, "accuracy exceeds ceiling", std::nullopt};
    }

    track->last_accepted_at = report.captured_at;
    {
        std::scoped_lock lock(mutex_);
        ++struct_stats_.accepted;
        CachedPosition& cached = map_latest_[agent_id];
        if (cached.sample.agent_id.empty() || cached.sample.captured_at < sample.captured_at) {
            cached = CachedPosition{sample, now};
        }
    }
    audit_sink_.record_location(sample, now);
    broadcast_sample(sample, now);

    IngestResult result{IngestStatus::Accepted, {}, std::nullopt};
    const GeofenceEvaluation evaluation = evaluate_geofence(shift.geofence, sample.position);
    if (evaluation.inside) {
        return result;
    }

    // Alert-raising violations are spaced by their own cooldown; a minor
    // excursion does not restart it.
    const bool raises_alert = evaluation.severity >= config_.alert_severity;
    const std::optional<TimePoint>& last_in_class = raises_alert ? track->last_alert_at : track->last_violation_at;
    if (last_in_class.has_value() && Duration{sample.captured_at - *last_in_class} < config_.violation_cooldown) {
        {
            std::scoped_lock lock(mutex_);
            ++struct_stats_.violations_suppressed;
        }
        logger_->debug(
            R"({{"component":"tracker","action":"violation_cooldown","agent":"{}","distance_outside_m":{:.1f},"raises_alert":{}}})",
            agent_id,
            evaluation.distance_outside_m,
            raises_alert
        );
        return result;
    }
    track->last_violation_at = sample.captured_at;
    if (raises_alert) {
        track->last_alert_at = sample.captured_at;
    }

    GeofenceViolation violation{
        fmt::format("gv-{}-{}", agent_id, to_epoch_ms(sample.captured_at)),
        agent_id,
        shift.site_id,
        shift.shift_id,
        sample,
        evaluation.distance_outside_m,
        evaluation.allowed_radius_m,
        evaluation.severity,
        shift.geofence.security_level,
        now,
        raises_alert,
    };
    {
        std::scoped_lock lock(mutex_);
        ++struct_stats_.violations;
    }
    logger_->warn(
        R"({{"component":"tracker","action":"violation","id":"{}","agent":"{}","site":"{}","distance_outside_m":{:.1f},"severity":"{}","raises_alert":{}}})",
        violation.id,
        agent_id,
        violation.site_id,
        violation.distance_outside_m,
        to_string(violation.severity),
        violation.raises_alert
    );
    broadcast_violation(violation, now);
    if (violation.raises_alert) {
        violation_channel_.publish(violation);
    }
    result.violation = std::move(violation);
    return result;
}

std::vector<LatestPosition> LocationTracker::latest_for_site(const std::string& site_id, TimePoint now) const {
    std::scoped_lock lock(mutex_);
    std::vector<LatestPosition> list_positions;
    for (const auto& [agent_id, cached] : map_latest_) {
        if (cached.sample.site_id != site_id || Duration{now - cached.received_at} > config_.cache_ttl) {
            continue;
        }
        list_positions.push_back(label(cached, now));
    }
    return list_positions;
}

std::optional<LatestPosition> LocationTracker::latest_for_agent(const std::string& agent_id, TimePoint now) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_latest = map_latest_.find(agent_id);
    if (iterator_latest == map_latest_.end() || Duration{now - iterator_latest->second.received_at} > config_.cache_ttl) {
        return std::nullopt;
    }
    return label(iterator_latest->second, now);
}

std::size_t LocationTracker::evict_expired(TimePoint now) {
    std::scoped_lock lock(mutex_);
    return std::erase_if(map_latest_, [&](const auto& entry) {
        return Duration{now - entry.second.received_at} > config_.cache_ttl;
    });
}

TrackingStats LocationTracker::stats() const {
    std::scoped_lock lock(mutex_);
    return struct_stats_;
}

std::shared_ptr<LocationTracker::AgentTrack> LocationTracker::track_for(const std::string& agent_id) {
    std::scoped_lock lock(mutex_);
    std::shared_ptr<AgentTrack>& track = map_tracks_[agent_id];
    if (track == nullptr) {
        track = std::make_shared<AgentTrack>();
    }
    return track;
}

IngestResult LocationTracker::reject(IngestStatus status, const std::string& agent_id, std::string detail) {
    {
        std::scoped_lock lock(mutex_);
        switch (status) {
            case IngestStatus::RejectedOutOfOrder:
                ++struct_stats_.rejected_out_of_order;
                break;
            case IngestStatus::RejectedNoActiveShift:
                ++struct_stats_.rejected_no_shift;
                break;
            case IngestStatus::RejectedInvalid:
                ++struct_stats_.rejected_invalid;
                break;
            case IngestStatus::Accepted:
            case IngestStatus::DiscardedLowAccuracy:
                break;
        }
    }
    logger_->debug(
        R"({{"component":"tracker","action":"reject","agent":"{}","status":"{}","detail":"{}"}})",
        json_escape(agent_id),
        to_string(status),
        detail
    );
    return IngestResult{status, std::move(detail), std::nullopt};
}

LatestPosition LocationTracker::label(const CachedPosition& cached, TimePoint now) const {
    const bool stale = Duration{now - cached.sample.captured_at} > config_.freshness_window;
    return LatestPosition{cached.sample, stale ? SampleStatus::Stale : SampleStatus::Active, cached.received_at};
}

void LocationTracker::broadcast_sample(const LocationSample& sample, TimePoint now) {
    OutboundEvent event{
        "location_update",
        EventCategory::Location,
        fmt::format(
            R"({{"agent_id":"{}","site_id":"{}","shift_id":"{}","lat":{:.7f},"lon":{:.7f},"accuracy_m":{:.1f},"battery":{},"speed_mps":{},"heading_deg":{},"captured_at":{},"status":"{}"}})",
            json_escape(sample.agent_id),
            json_escape(sample.site_id),
            json_escape(sample.shift_id),
            sample.position.latitude_deg,
            sample.position.longitude_deg,
            sample.accuracy_m,
            optional_number(sample.battery_percent),
            optional_number(sample.speed_mps),
            optional_number(sample.heading_deg),
            to_epoch_ms(sample.captured_at),
            to_string(SampleStatus::Active)
        ),
    };
    publisher_.publish(sample_rooms(sample.site_id, sample.agent_id), event, now);
}

void LocationTracker::broadcast_violation(const GeofenceViolation& violation, TimePoint now) {
    OutboundEvent event{
        "geofence_violation",
        EventCategory::Alert,
        fmt::format(
            R"({{"violation_id":"{}","agent_id":"{}","site_id":"{}","lat":{:.7f},"lon":{:.7f},"distance_outside_m":{:.1f},"allowed_radius_m":{:.1f},"severity":"{}","security_level":"{}","detected_at":{}}})",
            json_escape(violation.id),
            json_escape(violation.agent_id),
            json_escape(violation.site_id),
            violation.sample.position.latitude_deg,
            violation.sample.position.longitude_deg,
            violation.distance_outside_m,
            violation.allowed_radius_m,
            to_string(violation.severity),
            to_string(violation.security_level),
            to_epoch_ms(violation.detected_at)
        ),
    };
    publisher_.publish(sample_rooms(violation.site_id, violation.agent_id), event, now);
}

}  // namespace guard_link
