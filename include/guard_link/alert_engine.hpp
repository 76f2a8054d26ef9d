// === Alert Escalation Engine =================================================
//
// Owns the emergency-alert state machine:
//
//   OPEN(0) -> OPEN(1) -> ... -> OPEN(max)     on timer expiry
//   OPEN(n) -> ACKNOWLEDGED                    acknowledge()
//   OPEN(n) | ACKNOWLEDGED -> RESOLVED         resolve()
//
// Status and level of each alert live in one atomic phase word. Every
// transition, timer-driven or external, is a compare-and-swap on that word
// from the phase it observed, so an escalation whose alert was acknowledged
// in the meantime fails its swap and records nothing. At most one escalation
// timer is pending per alert.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "guard_link/alert_record.hpp"
#include "guard_link/audit_sink.hpp"
#include "guard_link/directory.hpp"
#include "guard_link/envelope.hpp"
#include "guard_link/location_tracker.hpp"
#include "guard_link/logging.hpp"
#include "guard_link/timer_queue.hpp"

namespace guard_link {

struct EscalationPolicy final {
    /** @brief Offset from creation at which level i+1 is reached; its size is the highest level. */
    std::vector<Duration> level_offsets{Duration{300.0}, Duration{900.0}};
    /** @brief Priority of SECURITY, GENERAL and geofence alerts by the triggering role. */
    std::map<Role, AlertPriority> role_default_priority{
        {Role::Agent, AlertPriority::Normal},
        {Role::Supervisor, AlertPriority::High},
        {Role::Admin, AlertPriority::High},
        {Role::Client, AlertPriority::Normal},
    };
};

/** @brief Request to open an alert. */
struct AlertTrigger final {
    AlertType type{AlertType::General};
    std::string agent_id{};
    std::optional<std::string> site_id{};  /**< Defaults to the site of the agent's active shift. */
    std::optional<GeodeticCoordinate> location{};
    std::string description{};
    std::string actor_id{};
    Role actor_role{Role::Agent};
};

enum class TransitionOutcome {
    Applied,
    AlreadyTerminal  /**< Duplicate request; the record is returned unchanged. */
};

struct TransitionResult final {
    TransitionOutcome outcome{TransitionOutcome::Applied};
    AlertRecord alert{};
};

struct EscalationStats final {
    std::size_t created{};
    std::size_t escalations{};
    std::size_t acknowledged{};
    std::size_t resolved{};
    std::size_t duplicate_requests{};
    std::size_t superseded_timers{};
    std::size_t open{};
};

class AlertEscalationEngine final {
  public:
    AlertEscalationEngine(EscalationPolicy policy,
                          const DirectoryService& directory,
                          EventPublisher& publisher,
                          AuditSink& audit_sink,
                          TimerQueue& timer_queue);

    /**
     * @brief Open an alert at level 0, notify the level-0 rooms and arm the
     *        first escalation timer.
     * @throws ValidationError for an unknown agent, a missing actor or no resolvable site.
     */
    AlertRecord create_alert(const AlertTrigger& trigger, TimePoint now);

    /** @brief Open a SECURITY alert for a geofence violation. */
    AlertRecord raise_for_violation(const GeofenceViolation& violation, TimePoint now);

    /** @throws ValidationError for an unknown alert id or empty user id. */
    TransitionResult acknowledge(const std::string& alert_id, const std::string& user_id, TimePoint now);

    /** @throws ValidationError for an unknown alert id or empty user id. */
    TransitionResult resolve(const std::string& alert_id, const std::string& user_id, ResolutionKind kind,
                             const std::string& notes, TimePoint now);

    /**
     * @brief Re-register alerts loaded from the durable store and re-arm the
     *        next escalation relative to each alert's creation time.
     * @return Number of alerts registered.
     */
    std::size_t recover(const std::vector<AlertRecord>& open_alerts, TimePoint now);

    /** @brief Forget resolved alerts last updated before @p cutoff. */
    std::size_t forget_resolved_before(TimePoint cutoff);

    [[nodiscard]] std::optional<AlertRecord> find_alert(const std::string& alert_id) const;
    /** @brief Alerts not yet resolved, oldest first. */
    [[nodiscard]] std::vector<AlertRecord> active_alerts() const;
    /** @brief Rooms notified at @p level; each level widens the previous one. */
    [[nodiscard]] std::vector<std::string> rooms_for_level(const AlertRecord& alert, int level) const;
    [[nodiscard]] int max_level() const noexcept;
    [[nodiscard]] EscalationStats stats() const;

  private:
    struct AlertState final {
        std::mutex mutex;
        std::atomic<std::uint32_t> phase{0};
        AlertRecord record{};
        TimerHandle timer{};
    };

    [[nodiscard]] static std::uint32_t encode_phase(AlertStatus status, int level) noexcept;
    [[nodiscard]] static AlertStatus status_of(std::uint32_t phase) noexcept;
    [[nodiscard]] static int level_of(std::uint32_t phase) noexcept;

    [[nodiscard]] AlertPriority priority_for(AlertType type, Role actor_role) const;
    [[nodiscard]] std::shared_ptr<AlertState> find_state(const std::string& alert_id) const;
    AlertRecord open_alert(AlertRecord record, const std::string& actor, TimePoint now);
    void arm_next_escalation(const std::shared_ptr<AlertState>& state);
    void escalate(const std::shared_ptr<AlertState>& state, int target_level, TimePoint fired_at);
    void record_transition(const AlertRecord& record, const std::string& suffix, int from_level,
                           std::optional<AlertStatus> from_status, const std::string& actor, TimePoint now);
    void broadcast(const AlertRecord& record, const std::string& event_name, const std::vector<std::string>& room_ids,
                   TimePoint now);

    EscalationPolicy policy_;
    const DirectoryService& directory_;
    EventPublisher& publisher_;
    AuditSink& audit_sink_;
    TimerQueue& timer_queue_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<AlertState>> map_alerts_;
    std::uint64_t next_alert_number_{1};
    EscalationStats struct_stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
