#pragma once

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <numbers>
#include <string>
#include <vector>

#include "guard_link/configuration.hpp"
#include "guard_link/connection_registry.hpp"
#include "guard_link/envelope.hpp"
#include "guard_link/geo.hpp"
#include "guard_link/in_memory_directory.hpp"
#include "guard_link/in_memory_store.hpp"
#include "guard_link/location_sample.hpp"
#include "guard_link/rooms.hpp"

namespace guard_link::test {

inline constexpr GeodeticCoordinate k_site_center{32.7157, -117.1611};
inline constexpr double k_site_radius_m{100.0};

inline TimePoint t0() {
    return TimePoint{std::chrono::seconds{1'700'000'000}};
}

inline TimePoint at(double seconds) {
    return t0() + to_clock_duration(Duration{seconds});
}

/** @brief Point @p metres due north of @p origin (exact along a meridian). */
inline GeodeticCoordinate north_of(const GeodeticCoordinate& origin, double metres) {
    return GeodeticCoordinate{origin.latitude_deg + metres / k_earth_radius_m * 180.0 / std::numbers::pi,
                              origin.longitude_deg};
}

inline LocationReport report_at(const GeodeticCoordinate& position, TimePoint captured_at, double accuracy_m = 5.0) {
    LocationReport report{};
    report.position = position;
    report.accuracy_m = accuracy_m;
    report.battery_percent = 80.0;
    report.captured_at = captured_at;
    return report;
}

/** @brief Frame sink that records every envelope it receives. */
class RecordingSink final {
  public:
    [[nodiscard]] FrameSink sink() const {
        auto frames = frames_;
        return [frames](const Envelope& envelope) { frames->push_back(envelope); };
    }

    [[nodiscard]] const std::vector<Envelope>& frames() const {
        return *frames_;
    }

    [[nodiscard]] std::vector<Envelope> named(const std::string& event_name) const {
        std::vector<Envelope> list_matching;
        std::copy_if(frames_->begin(), frames_->end(), std::back_inserter(list_matching),
                     [&](const Envelope& envelope) { return envelope.event.name == event_name; });
        return list_matching;
    }

    void clear() {
        frames_->clear();
    }

  private:
    std::shared_ptr<std::vector<Envelope>> frames_ = std::make_shared<std::vector<Envelope>>();
};

/** @brief EventPublisher stand-in that records what would have been routed. */
class RecordingPublisher final : public EventPublisher {
  public:
    struct Publication final {
        std::vector<std::string> room_ids;
        OutboundEvent event;
        TimePoint at;
    };

    void publish(const std::vector<std::string>& room_ids, const OutboundEvent& event, TimePoint now) override {
        list_publications_.push_back(Publication{room_ids, event, now});
    }

    [[nodiscard]] std::vector<Publication> named(const std::string& event_name) const {
        std::vector<Publication> list_matching;
        for (const Publication& publication : list_publications_) {
            if (publication.event.name == event_name) {
                list_matching.push_back(publication);
            }
        }
        return list_matching;
    }

    [[nodiscard]] std::size_t size() const {
        return list_publications_.size();
    }

  private:
    std::vector<Publication> list_publications_;
};

/**
 * @brief One site (site-1, area-1, client-1) with a 100 m circular geofence,
 *        agent-1 on shift around t0, two supervisors, an admin and a client.
 */
struct World final {
    InMemoryDirectory directory;
    InMemoryDurableStore store;

    World() {
        directory.add_site(SiteRouting{"site-1", "area-1", "client-1"});
        directory.add_token("agent-token", Principal{"user-agent-1", Role::Agent, "agent-1", std::nullopt});
        directory.add_token("sup-token", Principal{"user-sup-1", Role::Supervisor, std::nullopt, std::nullopt});
        directory.add_token("sup2-token", Principal{"user-sup-2", Role::Supervisor, std::nullopt, std::nullopt});
        directory.add_token("admin-token", Principal{"user-admin-1", Role::Admin, std::nullopt, std::nullopt});
        directory.add_token("client-token", Principal{"user-client-1", Role::Client, std::nullopt, "client-1"});
        directory.add_agent("agent-2");
        directory.assign_member(rooms::site("site-1"), "user-sup-1");
        directory.add_shift(ShiftAssignment{
            "shift-1",
            "agent-1",
            "site-1",
            t0() - std::chrono::hours(1),
            t0() + std::chrono::hours(12),
            Geofence::circle("site-1", k_site_center, k_site_radius_m),
        });
    }
};

inline Configuration make_test_configuration() {
    Configuration configuration{};
    configuration.log_directory = "logs";
    configuration.log_level = "warn";
    configuration.dispatch_hz = 10.0;
    configuration.session_idle_timeout = Duration{3600.0};
    return configuration;
}

}  // namespace guard_link::test
