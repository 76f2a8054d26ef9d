// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the coordination runtime.
//
// Responsibilities
// - Enforce defaults and sane bounds for timing knobs such as the violation
//   cooldown, escalation offsets and queue retention windows.
// - Surface clear diagnostics via the logging subsystem whenever input cannot
//   be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: This file never reads from disk; deployments populate the process
// environment ahead of time (systemd unit, container env, shell-sourced .env).

#include "guard_link/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "guard_link/envelope.hpp"
#include "guard_link/geofence.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr double k_default_dispatch_hz{10.0};
constexpr double k_default_accuracy_ceiling_m{100.0};
constexpr double k_default_violation_cooldown_s{300.0};
constexpr double k_default_location_cache_ttl_s{300.0};
constexpr double k_default_freshness_window_s{120.0};
constexpr double k_default_escalation_level1_s{300.0};
constexpr double k_default_escalation_level2_s{900.0};
constexpr double k_default_session_idle_timeout_s{60.0};
constexpr double k_default_location_retention_s{24.0 * 3600.0};
constexpr double k_default_alert_retention_s{72.0 * 3600.0};
constexpr int k_default_audit_max_attempts{5};
constexpr double k_default_audit_backoff_ms{200.0};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* variable, double fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn(R"({{"component":"configuration","event":"non_positive","variable":"{}","fallback":{}}})",
                               variable,
                               fallback);
        }
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        get_logger()->warn(R"({{"component":"configuration","event":"unparseable","variable":"{}","value":"{}","fallback":{}}})",
                           variable,
                           json_escape(raw_value),
                           fallback);
        return fallback;
    }
}

int parse_int(const char* variable, int fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn(R"({{"component":"configuration","event":"non_positive","variable":"{}","fallback":{}}})",
                               variable,
                               fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn(R"({{"component":"configuration","event":"unparseable","variable":"{}","value":"{}","fallback":{}}})",
                           variable,
                           json_escape(raw_value),
                           fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable, std::string_view fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

ViolationSeverity parse_severity(const char* variable, ViolationSeverity fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::optional<ViolationSeverity> severity = severity_from_string(raw_value);
    if (!severity.has_value()) {
        get_logger()->warn(R"({{"component":"configuration","event":"unknown_severity","variable":"{}","value":"{}","fallback":"{}"}})",
                           variable,
                           json_escape(raw_value),
                           to_string(fallback));
        return fallback;
    }
    return severity.value();
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("GUARD_LINK_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("GUARD_LINK_LOG_LEVEL", k_default_log_level);
    config.dispatch_hz = load_dispatch_hz();

    config.tracker.accuracy_ceiling_m = parse_double("GUARD_LINK_ACCURACY_CEILING_M", k_default_accuracy_ceiling_m);
    config.tracker.violation_cooldown =
        Duration{parse_double("GUARD_LINK_VIOLATION_COOLDOWN_S", k_default_violation_cooldown_s)};
    config.tracker.alert_severity = parse_severity("GUARD_LINK_VIOLATION_ALERT_SEVERITY", ViolationSeverity::Low);
    config.tracker.cache_ttl = Duration{parse_double("GUARD_LINK_LOCATION_CACHE_TTL_S", k_default_location_cache_ttl_s)};
    config.tracker.freshness_window =
        Duration{parse_double("GUARD_LINK_FRESHNESS_WINDOW_S", k_default_freshness_window_s)};

    config.escalation = load_escalation_policy();
    config.session_idle_timeout =
        Duration{parse_double("GUARD_LINK_SESSION_IDLE_TIMEOUT_S", k_default_session_idle_timeout_s)};

    config.retention.location_retention =
        Duration{parse_double("GUARD_LINK_LOCATION_RETENTION_S", k_default_location_retention_s)};
    config.retention.alert_retention = Duration{parse_double("GUARD_LINK_ALERT_RETENTION_S", k_default_alert_retention_s)};

    config.audit.max_attempts = parse_int("GUARD_LINK_AUDIT_MAX_ATTEMPTS", k_default_audit_max_attempts);
    config.audit.base_backoff = Duration{parse_double("GUARD_LINK_AUDIT_BACKOFF_MS", k_default_audit_backoff_ms) / 1000.0};

    logger->info(
        R"({{"component":"configuration","event":"loaded","dispatch_hz":{},"accuracy_ceiling_m":{},"violation_cooldown_s":{},"escalation_s":[{},{}],"idle_timeout_s":{}}})",
        config.dispatch_hz,
        config.tracker.accuracy_ceiling_m,
        config.tracker.violation_cooldown.count(),
        config.escalation.level_offsets[0].count(),
        config.escalation.level_offsets[1].count(),
        config.session_idle_timeout.count()
    );

    return config;
}

double ConfigurationLoader::load_dispatch_hz() {
    return parse_double("GUARD_LINK_DISPATCH_HZ", k_default_dispatch_hz);
}

EscalationPolicy ConfigurationLoader::load_escalation_policy() {
    const double level1_s = parse_double("GUARD_LINK_ESCALATION_LEVEL1_S", k_default_escalation_level1_s);
    const double level2_s = parse_double("GUARD_LINK_ESCALATION_LEVEL2_S", k_default_escalation_level2_s);

    EscalationPolicy policy{};
    if (level2_s <= level1_s) {
        get_logger()->warn(R"({{"component":"configuration","event":"escalation_order","level1_s":{},"level2_s":{},"fallback":"defaults"}})",
                           level1_s,
                           level2_s);
        policy.level_offsets = {Duration{k_default_escalation_level1_s}, Duration{k_default_escalation_level2_s}};
        return policy;
    }
    policy.level_offsets = {Duration{level1_s}, Duration{level2_s}};
    return policy;
}

}  // namespace guard_link
