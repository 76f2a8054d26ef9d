// === Location Tracker ========================================================
//
// Ingest path for agent position reports. Each report is validated, bound to
// the agent's active shift, checked against the per-agent watermark and the
// accuracy ceiling, then tested against the shift's geofence. Accepted samples
// are broadcast, cached as the agent's latest position and handed to the audit
// sink. Violations are broadcast and, when severe enough, published on the
// violation channel for the escalation engine.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "guard_link/audit_sink.hpp"
#include "guard_link/directory.hpp"
#include "guard_link/envelope.hpp"
#include "guard_link/event_channel.hpp"
#include "guard_link/geofence.hpp"
#include "guard_link/location_sample.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

struct TrackerConfig final {
    double accuracy_ceiling_m{100.0};                     /**< Reports less accurate than this are discarded. */
    Duration violation_cooldown{Duration{300.0}};         /**< Minimum spacing of violations per agent, per alerting class. */
    ViolationSeverity alert_severity{ViolationSeverity::Low};  /**< Lowest severity that raises an alert. */
    Duration cache_ttl{Duration{300.0}};                  /**< Latest-position cache lifetime. */
    Duration freshness_window{Duration{120.0}};           /**< Sample age beyond which it reads as stale. */
};

enum class IngestStatus {
    Accepted,
    DiscardedLowAccuracy,   /**< Audited, not broadcast or evaluated. */
    RejectedOutOfOrder,     /**< Not newer than the last accepted sample. */
    RejectedNoActiveShift,
    RejectedInvalid
};

[[nodiscard]] const char* to_string(IngestStatus status) noexcept;

/** @brief A sample observed outside its shift's geofence. Never mutated. */
struct GeofenceViolation final {
    std::string id{};
    std::string agent_id{};
    std::string site_id{};
    std::string shift_id{};
    LocationSample sample{};
    double distance_outside_m{};
    double allowed_radius_m{};
    ViolationSeverity severity{ViolationSeverity::Low};
    SecurityLevel security_level{SecurityLevel::Standard};
    TimePoint detected_at{};
    bool raises_alert{false};
};

struct IngestResult final {
    IngestStatus status{IngestStatus::Accepted};
    std::string detail{};
    std::optional<GeofenceViolation> violation{};
};

/** @brief Cached latest sample of an agent with its freshness label. */
struct LatestPosition final {
    LocationSample sample{};
    SampleStatus status{SampleStatus::Active};
    TimePoint received_at{};
};

struct TrackingStats final {
    std::size_t accepted{};
    std::size_t discarded_low_accuracy{};
    std::size_t rejected_out_of_order{};
    std::size_t rejected_no_shift{};
    std::size_t rejected_invalid{};
    std::size_t violations{};
    std::size_t violations_suppressed{};
};

class LocationTracker final {
  public:
    LocationTracker(TrackerConfig config,
                    const DirectoryService& directory,
                    EventPublisher& publisher,
                    AuditSink& audit_sink,
                    EventChannel<GeofenceViolation>& violation_channel);

    /**
     * @brief Process one report from @p agent_id. Samples of one agent are
     *        serialized; different agents proceed concurrently.
     */
    IngestResult ingest(const std::string& agent_id, const LocationReport& report, TimePoint now);

    /** @brief Latest cached position of every agent on @p site_id. */
    [[nodiscard]] std::vector<LatestPosition> latest_for_site(const std::string& site_id, TimePoint now) const;
    [[nodiscard]] std::optional<LatestPosition> latest_for_agent(const std::string& agent_id, TimePoint now) const;

    /** @brief Drop cache entries older than the TTL. */
    std::size_t evict_expired(TimePoint now);

    [[nodiscard]] TrackingStats stats() const;

  private:
    struct AgentTrack final {
        std::mutex mutex;
        std::optional<TimePoint> last_accepted_at{};
        std::optional<TimePoint> last_violation_at{};  /**< Any broadcast violation. */
        std::optional<TimePoint> last_alert_at{};      /**< Violations that raised an alert. */
    };

    struct CachedPosition final {
        LocationSample sample{};
        TimePoint received_at{};
    };

    std::shared_ptr<AgentTrack> track_for(const std::string& agent_id);
    IngestResult reject(IngestStatus status, const std::string& agent_id, std::string detail);
    [[nodiscard]] LatestPosition label(const CachedPosition& cached, TimePoint now) const;
    void broadcast_sample(const LocationSample& sample, TimePoint now);
    void broadcast_violation(const GeofenceViolation& violation, TimePoint now);

    TrackerConfig config_;
    const DirectoryService& directory_;
    EventPublisher& publisher_;
    AuditSink& audit_sink_;
    EventChannel<GeofenceViolation>& violation_channel_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<AgentTrack>> map_tracks_;
    std::unordered_map<std::string, CachedPosition> map_latest_;
    TrackingStats struct_stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
