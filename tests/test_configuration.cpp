#include <cstdlib>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "guard_link/configuration.hpp"

using namespace guard_link;

namespace {
const std::vector<std::string> k_variables{
    "GUARD_LINK_LOG_LEVEL",
    "GUARD_LINK_DISPATCH_HZ",
    "GUARD_LINK_ACCURACY_CEILING_M",
    "GUARD_LINK_VIOLATION_COOLDOWN_S",
    "GUARD_LINK_VIOLATION_ALERT_SEVERITY",
    "GUARD_LINK_LOCATION_CACHE_TTL_S",
    "GUARD_LINK_FRESHNESS_WINDOW_S",
    "GUARD_LINK_ESCALATION_LEVEL1_S",
    "GUARD_LINK_ESCALATION_LEVEL2_S",
    "GUARD_LINK_SESSION_IDLE_TIMEOUT_S",
    "GUARD_LINK_LOCATION_RETENTION_S",
    "GUARD_LINK_ALERT_RETENTION_S",
    "GUARD_LINK_AUDIT_MAX_ATTEMPTS",
    "GUARD_LINK_AUDIT_BACKOFF_MS",
};

/** @brief Clears every GUARD_LINK_* knob on entry and exit. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() {
        clear();
    }

    ~ScopedEnvironment() {
        clear();
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    void set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

  private:
    static void clear() {
        for (const std::string& name : k_variables) {
            ::unsetenv(name.c_str());
        }
    }
};
}  // namespace

TEST_CASE("ConfigurationLoader falls back to defaults when nothing is set") {
    ScopedEnvironment environment{};
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_level == "info");
    REQUIRE(config.dispatch_hz == Approx(10.0));
    REQUIRE(config.tracker.accuracy_ceiling_m == Approx(100.0));
    REQUIRE(config.tracker.violation_cooldown.count() == Approx(300.0));
    REQUIRE(config.tracker.alert_severity == ViolationSeverity::Low);
    REQUIRE(config.tracker.cache_ttl.count() == Approx(300.0));
    REQUIRE(config.tracker.freshness_window.count() == Approx(120.0));
    REQUIRE(config.escalation.level_offsets.size() == 2);
    REQUIRE(config.escalation.level_offsets[0].count() == Approx(300.0));
    REQUIRE(config.escalation.level_offsets[1].count() == Approx(900.0));
    REQUIRE(config.session_idle_timeout.count() == Approx(60.0));
    REQUIRE(config.retention.location_retention.count() == Approx(86400.0));
    REQUIRE(config.retention.alert_retention.count() == Approx(259200.0));
    REQUIRE(config.audit.max_attempts == 5);
    REQUIRE(config.audit.base_backoff.count() == Approx(0.2));
}

TEST_CASE("ConfigurationLoader applies environment overrides") {
    ScopedEnvironment environment{};
    environment.set("GUARD_LINK_LOG_LEVEL", "debug");
    environment.set("GUARD_LINK_DISPATCH_HZ", "20");
    environment.set("GUARD_LINK_VIOLATION_COOLDOWN_S", "120");
    environment.set("GUARD_LINK_VIOLATION_ALERT_SEVERITY", "HIGH");
    environment.set("GUARD_LINK_ESCALATION_LEVEL1_S", "60");
    environment.set("GUARD_LINK_ESCALATION_LEVEL2_S", "180");
    environment.set("GUARD_LINK_SESSION_IDLE_TIMEOUT_S", "45");
    environment.set("GUARD_LINK_AUDIT_MAX_ATTEMPTS", "3");
    environment.set("GUARD_LINK_AUDIT_BACKOFF_MS", "500");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_level == "debug");
    REQUIRE(config.dispatch_hz == Approx(20.0));
    REQUIRE(config.tracker.violation_cooldown.count() == Approx(120.0));
    REQUIRE(config.tracker.alert_severity == ViolationSeverity::High);
    REQUIRE(config.escalation.level_offsets[0].count() == Approx(60.0));
    REQUIRE(config.escalation.level_offsets[1].count() == Approx(180.0));
    REQUIRE(config.session_idle_timeout.count() == Approx(45.0));
    REQUIRE(config.audit.max_attempts == 3);
    REQUIRE(config.audit.base_backoff.count() == Approx(0.5));
}

TEST_CASE("ConfigurationLoader rejects unusable values") {
    ScopedEnvironment environment{};
    environment.set("GUARD_LINK_DISPATCH_HZ", "fast");
    environment.set("GUARD_LINK_ACCURACY_CEILING_M", "-5");
    environment.set("GUARD_LINK_VIOLATION_ALERT_SEVERITY", "extreme");
    environment.set("GUARD_LINK_ESCALATION_LEVEL1_S", "600");
    environment.set("GUARD_LINK_ESCALATION_LEVEL2_S", "300");
    environment.set("GUARD_LINK_AUDIT_MAX_ATTEMPTS", "0");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.dispatch_hz == Approx(10.0));
    REQUIRE(config.tracker.accuracy_ceiling_m == Approx(100.0));
    REQUIRE(config.tracker.alert_severity == ViolationSeverity::Low);
    REQUIRE(config.escalation.level_offsets[0].count() == Approx(300.0));
    REQUIRE(config.escalation.level_offsets[1].count() == Approx(900.0));
    REQUIRE(config.audit.max_attempts == 5);
}
