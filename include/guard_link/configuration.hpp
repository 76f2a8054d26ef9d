// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects for the tracker, escalation
// engine, registry, router and audit sink. `ConfigurationLoader` translates
// GUARD_LINK_* environment variables into these structures so downstream
// modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "guard_link/alert_engine.hpp"
#include "guard_link/audit_sink.hpp"
#include "guard_link/broadcast_router.hpp"
#include "guard_link/location_tracker.hpp"
#include "guard_link/types.hpp"

namespace guard_link {

/**
 * @brief Immutable bundle of runtime knobs for the coordination engine.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};              /**< Destination directory for structured logs. */
    std::string log_level{};                  /**< spdlog level name applied at startup. */
    double dispatch_hz{};                     /**< Dispatcher pump cadence in Hertz. */
    TrackerConfig tracker{};                  /**< Ingest and geofence settings. */
    EscalationPolicy escalation{};            /**< Escalation tier offsets and default priorities. */
    Duration session_idle_timeout{};          /**< Heartbeat timeout before forced disconnect. */
    RetentionPolicy retention{};              /**< Offline queue retention by category. */
    AuditPolicy audit{};                      /**< Durable write retry policy. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables. Initializes the shared logger as a side effect.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static double load_dispatch_hz();
    static EscalationPolicy load_escalation_policy();
};

}  // namespace guard_link
