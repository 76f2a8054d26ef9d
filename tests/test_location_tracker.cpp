#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "guard_link/audit_sink.hpp"
#include "guard_link/location_tracker.hpp"
#include "guard_link/rooms.hpp"
#include "test_support.hpp"

using namespace guard_link;
using guard_link::test::at;
using guard_link::test::k_site_center;
using guard_link::test::north_of;
using guard_link::test::RecordingPublisher;
using guard_link::test::report_at;
using guard_link::test::World;

namespace {
struct TrackerFixture {
    explicit TrackerFixture(TrackerConfig config = TrackerConfig{})
        : tracker(config, world.directory, publisher, audit_sink, violations) {}

    std::vector<GeofenceViolation> drain_violations() {
        std::vector<GeofenceViolation> list_violations;
        while (std::optional<GeofenceViolation> violation = violations.try_consume()) {
            list_violations.push_back(*violation);
        }
        return list_violations;
    }

    World world{};
    RecordingPublisher publisher{};
    AuditSink audit_sink{world.store, AuditPolicy{}};
    EventChannel<GeofenceViolation> violations{};
    LocationTracker tracker;
};
}  // namespace

TEST_CASE("LocationTracker broadcasts accepted samples to site, monitoring and agent rooms") {
    TrackerFixture fixture{};
    const IngestResult result = fixture.tracker.ingest("agent-1", report_at(k_site_center, at(0.0)), at(0.5));

    REQUIRE(result.status == IngestStatus::Accepted);
    REQUIRE_FALSE(result.violation.has_value());

    const auto list_updates = fixture.publisher.named("location_update");
    REQUIRE(list_updates.size() == 1);
    REQUIRE(list_updates.front().room_ids
            == std::vector<std::string>{rooms::site("site-1"), rooms::monitoring(), rooms::agent("agent-1")});
    REQUIRE_THAT(list_updates.front().event.payload, Catch::Contains(R"("shift_id":"shift-1")"));

    REQUIRE(fixture.audit_sink.flush(at(1.0)) == 1);
    const std::vector<LocationSample> list_samples = fixture.world.store.location_samples();
    REQUIRE(list_samples.size() == 1);
    REQUIRE(list_samples.front().site_id == "site-1");
}

TEST_CASE("LocationTracker accepts only strictly newer samples per agent") {
    TrackerFixture fixture{};
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(10.0)), at(10.0)).status
            == IngestStatus::Accepted);
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(10.0)), at(11.0)).status
            == IngestStatus::RejectedOutOfOrder);
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(5.0)), at(11.0)).status
            == IngestStatus::RejectedOutOfOrder);
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(12.0)), at(12.0)).status
            == IngestStatus::Accepted);

    REQUIRE(fixture.publisher.named("location_update").size() == 2);
    const TrackingStats stats = fixture.tracker.stats();
    REQUIRE(stats.accepted == 2);
    REQUIRE(stats.rejected_out_of_order == 2);

    const std::optional<LatestPosition> latest = fixture.tracker.latest_for_agent("agent-1", at(12.0));
    REQUIRE(latest.has_value());
    REQUIRE(latest->sample.captured_at == at(12.0));
}

TEST_CASE("LocationTracker audits low-accuracy samples without broadcasting them") {
    TrackerFixture fixture{};
    const IngestResult result =
        fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 500.0), at(10.0), 250.0), at(10.0));

    REQUIRE(result.status == IngestStatus::DiscardedLowAccuracy);
    REQUIRE(fixture.publisher.size() == 0);
    REQUIRE(fixture.drain_violations().empty());
    REQUIRE_FALSE(fixture.tracker.latest_for_agent("agent-1", at(10.0)).has_value());

    REQUIRE(fixture.audit_sink.flush(at(11.0)) == 1);
    REQUIRE(fixture.world.store.location_samples().size() == 1);

    // The discarded sample does not move the watermark.
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(9.0)), at(11.0)).status
            == IngestStatus::Accepted);
}

TEST_CASE("LocationTracker rejects invalid reports and agents off shift") {
    TrackerFixture fixture{};

    REQUIRE(fixture.tracker.ingest("agent-2", report_at(k_site_center, at(0.0)), at(0.0)).status
            == IngestStatus::RejectedNoActiveShift);
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(k_site_center, at(13.0 * 3600.0)), at(13.0 * 3600.0)).status
            == IngestStatus::RejectedNoActiveShift);
    REQUIRE(fixture.tracker.ingest("agent-404", report_at(k_site_center, at(0.0)), at(0.0)).status
            == IngestStatus::RejectedInvalid);
    REQUIRE(fixture.tracker.ingest("", report_at(k_site_center, at(0.0)), at(0.0)).status
            == IngestStatus::RejectedInvalid);

    LocationReport report = report_at(GeodeticCoordinate{91.0, 0.0}, at(0.0));
    REQUIRE(fixture.tracker.ingest("agent-1", report, at(0.0)).status == IngestStatus::RejectedInvalid);

    report = report_at(k_site_center, at(0.0));
    report.battery_percent = 140.0;
    REQUIRE(fixture.tracker.ingest("agent-1", report, at(0.0)).status == IngestStatus::RejectedInvalid);

    report = report_at(k_site_center, at(0.0));
    report.heading_deg = 360.0;
    REQUIRE(fixture.tracker.ingest("agent-1", report, at(0.0)).status == IngestStatus::RejectedInvalid);

    report = report_at(k_site_center, at(0.0));
    report.accuracy_m = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(fixture.tracker.ingest("agent-1", report, at(0.0)).status == IngestStatus::RejectedInvalid);

    REQUIRE(fixture.publisher.size() == 0);
    const TrackingStats stats = fixture.tracker.stats();
    REQUIRE(stats.rejected_no_shift == 2);
    REQUIRE(stats.rejected_invalid == 6);
}

TEST_CASE("LocationTracker raises a graded violation outside the geofence") {
    TrackerFixture fixture{};
    const IngestResult result =
        fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 180.0), at(0.0)), at(0.0));

    REQUIRE(result.status == IngestStatus::Accepted);
    REQUIRE(result.violation.has_value());
    const GeofenceViolation& violation = *result.violation;
    REQUIRE(violation.site_id == "site-1");
    REQUIRE(violation.shift_id == "shift-1");
    REQUIRE(violation.distance_outside_m == Approx(80.0).margin(0.5));
    REQUIRE(violation.allowed_radius_m == Approx(100.0));
    REQUIRE(violation.severity == ViolationSeverity::Medium);
    REQUIRE(violation.raises_alert);

    const auto list_broadcasts = fixture.publisher.named("geofence_violation");
    REQUIRE(list_broadcasts.size() == 1);
    REQUIRE(list_broadcasts.front().event.category == EventCategory::Alert);
    REQUIRE(list_broadcasts.front().room_ids.front() == rooms::site("site-1"));

    const std::vector<GeofenceViolation> list_published = fixture.drain_violations();
    REQUIRE(list_published.size() == 1);
    REQUIRE(list_published.front().id == violation.id);
}

TEST_CASE("LocationTracker spaces violations of one agent by the cooldown") {
    TrackerFixture fixture{};
    const GeodeticCoordinate outside = north_of(k_site_center, 260.0);

    REQUIRE(fixture.tracker.ingest("agent-1", report_at(outside, at(0.0)), at(0.0)).violation.has_value());
    REQUIRE_FALSE(fixture.tracker.ingest("agent-1", report_at(outside, at(120.0)), at(120.0)).violation.has_value());
    REQUIRE(fixture.tracker.ingest("agent-1", report_at(outside, at(301.0)), at(301.0)).violation.has_value());

    REQUIRE(fixture.drain_violations().size() == 2);
    const TrackingStats stats = fixture.tracker.stats();
    REQUIRE(stats.violations == 2);
    REQUIRE(stats.violations_suppressed == 1);
    REQUIRE(fixture.publisher.named("location_update").size() == 3);
}

TEST_CASE("LocationTracker broadcasts but does not escalate violations below the alert severity") {
    TrackerConfig config{};
    config.alert_severity = ViolationSeverity::Medium;
    TrackerFixture fixture{config};

    const IngestResult result =
        fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 140.0), at(0.0)), at(0.0));
    REQUIRE(result.violation.has_value());
    REQUIRE(result.violation->severity == ViolationSeverity::Low);
    REQUIRE_FALSE(result.violation->raises_alert);
    REQUIRE(fixture.publisher.named("geofence_violation").size() == 1);
    REQUIRE(fixture.drain_violations().empty());
}

TEST_CASE("LocationTracker labels cached positions stale and evicts them after the TTL") {
    TrackerFixture fixture{};
    fixture.tracker.ingest("agent-1", report_at(k_site_center, at(0.0)), at(0.0));

    std::vector<LatestPosition> list_latest = fixture.tracker.latest_for_site("site-1", at(60.0));
    REQUIRE(list_latest.size() == 1);
    REQUIRE(list_latest.front().status == SampleStatus::Active);

    list_latest = fixture.tracker.latest_for_site("site-1", at(121.0));
    REQUIRE(list_latest.size() == 1);
    REQUIRE(list_latest.front().status == SampleStatus::Stale);
    REQUIRE(fixture.tracker.latest_for_site("site-2", at(121.0)).empty());

    REQUIRE(fixture.tracker.evict_expired(at(300.0)) == 0);
    REQUIRE(fixture.tracker.evict_expired(at(301.0)) == 1);
    REQUIRE(fixture.tracker.latest_for_site("site-1", at(301.0)).empty());
}

TEST_CASE("LocationTracker lets a severe breach alert right after a minor excursion") {
    TrackerConfig config{};
    config.alert_severity = ViolationSeverity::Medium;
    TrackerFixture fixture{config};

    const IngestResult minor =
        fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 120.0), at(0.0)), at(0.0));
    REQUIRE(minor.violation.has_value());
    REQUIRE_FALSE(minor.violation->raises_alert);

    const IngestResult severe =
        fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 300.0), at(60.0)), at(60.0));
    REQUIRE(severe.violation.has_value());
    REQUIRE(severe.violation->severity == ViolationSeverity::High);
    REQUIRE(severe.violation->raises_alert);

    const std::vector<GeofenceViolation> list_published = fixture.drain_violations();
    REQUIRE(list_published.size() == 1);
    REQUIRE(list_published.front().id == severe.violation->id);

    // Both classes are now inside their cooldown.
    REQUIRE_FALSE(fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 120.0), at(120.0)), at(120.0))
                      .violation.has_value());
    REQUIRE_FALSE(fixture.tracker.ingest("agent-1", report_at(north_of(k_site_center, 300.0), at(180.0)), at(180.0))
                      .violation.has_value());
    REQUIRE(fixture.tracker.stats().violations_suppressed == 2);
    REQUIRE(fixture.publisher.named("geofence_violation").size() == 2);
}
