#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "guard_link/configuration.hpp"
#include "guard_link/coordination_runtime.hpp"
#include "guard_link/in_memory_directory.hpp"
#include "guard_link/in_memory_store.hpp"
#include "guard_link/logging.hpp"
#include "guard_link/rooms.hpp"
#include "guard_link/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

/**
 * @brief Seed a single guarded site with one agent on shift, plus supervisor,
 *        admin and client accounts, so the server can be exercised locally.
 */
void seed_demo_directory(guard_link::InMemoryDirectory& directory, guard_link::TimePoint now) {
    using namespace guard_link;

    const GeodeticCoordinate site_center{32.7157, -117.1611};
    directory.add_site(SiteRouting{"site-harbor", "area-west", "client-acme"});
    directory.add_token("demo-agent-token", Principal{"user-agent-1", Role::Agent, "agent-1", std::nullopt});
    directory.add_token("demo-supervisor-token", Principal{"user-supervisor-1", Role::Supervisor, std::nullopt, std::nullopt});
    directory.add_token("demo-admin-token", Principal{"user-admin-1", Role::Admin, std::nullopt, std::nullopt});
    directory.add_token("demo-client-token", Principal{"user-client-1", Role::Client, std::nullopt, "client-acme"});
    directory.assign_member(rooms::site("site-harbor"), "user-supervisor-1");
    directory.add_shift(ShiftAssignment{
        "shift-harbor-night",
        "agent-1",
        "site-harbor",
        now - std::chrono::hours(1),
        now + std::chrono::hours(8),
        Geofence::circle("site-harbor", site_center, 150.0, SecurityLevel::Elevated),
    });
}
}  // namespace

int main() {
    using namespace guard_link;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        get_logger()->info("guard_link server {}", k_version);

        WallClock clock;
        InMemoryDirectory directory;
        InMemoryDurableStore store;
        seed_demo_directory(directory, clock.now());

        CoordinationRuntime runtime{configuration, directory, directory, store, clock};
        runtime.initialize();
        runtime.run();

        const SessionHandle console_session = runtime.connect("demo-supervisor-token", [](const Envelope& envelope) {
            get_logger()->info("[{} #{}] {} {}", envelope.room_id, envelope.sequence, envelope.event.name,
                               envelope.event.payload);
        });
        runtime.handle_command(console_session, "join:monitoring");

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            runtime.handle_command(console_session, "heartbeat");
        }

        runtime.disconnect(console_session);
        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
