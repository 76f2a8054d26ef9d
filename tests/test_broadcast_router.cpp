#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "guard_link/broadcast_router.hpp"
#include "guard_link/connection_registry.hpp"
#include "guard_link/rooms.hpp"
#include "test_support.hpp"

using namespace guard_link;
using guard_link::test::at;
using guard_link::test::RecordingSink;
using guard_link::test::World;

namespace {
OutboundEvent location_event(const std::string& name) {
    return OutboundEvent{name, EventCategory::Location, "{}"};
}

OutboundEvent alert_event(const std::string& name) {
    return OutboundEvent{name, EventCategory::Alert, "{}"};
}

void drain_presence(EventChannel<PresenceEvent>& presence, BroadcastRouter& router, TimePoint now) {
    while (std::optional<PresenceEvent> event = presence.try_consume()) {
        router.on_presence(*event, now);
    }
}

std::vector<std::string> names_of(const std::vector<Envelope>& list_frames, const std::string& prefix) {
    std::vector<std::string> list_names;
    for (const Envelope& envelope : list_frames) {
        if (envelope.event.name.rfind(prefix, 0) == 0) {
            list_names.push_back(envelope.event.name);
        }
    }
    return list_names;
}

struct RouterFixture {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{600.0}, presence};
    BroadcastRouter router{registry, world.directory, RetentionPolicy{}};
};
}  // namespace

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter delivers once per user across overlapping rooms") {
    RecordingSink sink{};
    const SessionHandle handle = registry.register_session("sup-token", sink.sink(), at(0.0));
    registry.join_room(handle, rooms::monitoring(), at(0.0));
    registry.join_room(handle, rooms::site("site-1"), at(0.0));

    router.publish({rooms::site("site-1"), rooms::monitoring()}, location_event("location_update"), at(1.0));

    const std::vector<Envelope> list_frames = sink.named("location_update");
    REQUIRE(list_frames.size() == 1);
    REQUIRE(list_frames.front().room_id == rooms::site("site-1"));
    REQUIRE(router.stats().delivered == 1);
    REQUIRE(router.queued_for("user-sup-1").empty());
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter delivers live through a later room when an earlier one only knows the user") {
    RecordingSink sink{};
    const SessionHandle handle = registry.register_session("sup-token", sink.sink(), at(0.0));
    registry.join_room(handle, rooms::monitoring(), at(0.0));

    router.publish({rooms::site("site-1"), rooms::monitoring(), rooms::agent("agent-1")},
                   location_event("location_update"), at(1.0));
    router.flush_pending(at(1.0));

    const std::vector<Envelope> list_frames = sink.named("location_update");
    REQUIRE(list_frames.size() == 1);
    REQUIRE(list_frames.front().room_id == rooms::monitoring());
    REQUIRE(router.queued_for("user-sup-1").empty());
    REQUIRE(router.stats().pending == 0);
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter queues for offline members and flushes in order on rejoin") {
    router.publish({rooms::site("site-1")}, location_event("evt-1"), at(1.0));
    router.publish({rooms::site("site-1")}, alert_event("evt-2"), at(2.0));
    router.publish({rooms::site("site-1")}, location_event("evt-3"), at(3.0));
    REQUIRE(router.queued_for("user-sup-1").size() == 3);

    RecordingSink sink{};
    const SessionHandle handle = registry.register_session("sup-token", sink.sink(), at(10.0));
    drain_presence(presence, router, at(10.0));
    REQUIRE(names_of(sink.frames(), "evt-").empty());

    registry.join_room(handle, rooms::site("site-1"), at(11.0));
    drain_presence(presence, router, at(11.0));

    const std::vector<Envelope>& list_frames = sink.frames();
    REQUIRE(names_of(list_frames, "evt-") == std::vector<std::string>{"evt-1", "evt-2", "evt-3"});
    REQUIRE(router.queued_for("user-sup-1").empty());

    router.flush_pending(at(12.0));
    REQUIRE(names_of(sink.frames(), "evt-").size() == 3);
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter appends live traffic behind an existing backlog") {
    router.publish({rooms::site("site-1")}, location_event("evt-1"), at(1.0));

    RecordingSink sink{};
    const SessionHandle handle = registry.register_session("sup-token", sink.sink(), at(5.0));
    registry.join_room(handle, rooms::site("site-1"), at(5.0));

    router.publish({rooms::site("site-1")}, location_event("evt-2"), at(6.0));
    REQUIRE(names_of(sink.frames(), "evt-").empty());
    REQUIRE(router.queued_for("user-sup-1").size() == 2);

    drain_presence(presence, router, at(7.0));
    REQUIRE(names_of(sink.frames(), "evt-") == std::vector<std::string>{"evt-1", "evt-2"});

    router.publish({rooms::site("site-1")}, location_event("evt-3"), at(8.0));
    REQUIRE(names_of(sink.frames(), "evt-") == std::vector<std::string>{"evt-1", "evt-2", "evt-3"});
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter reports rooms without any recipient") {
    router.publish({"site:nowhere"}, alert_event("emergency_alert"), at(1.0));

    const RouterStats stats = router.stats();
    REQUIRE(stats.published == 1);
    REQUIRE(stats.routing_gaps == 1);
    REQUIRE(stats.pending == 0);
}

TEST_CASE("BroadcastRouter expires queued events by category") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{600.0}, presence};
    BroadcastRouter router{registry, world.directory, RetentionPolicy{Duration{3600.0}, Duration{7200.0}}};

    router.publish({rooms::site("site-1")}, location_event("location_update"), at(0.0));
    router.publish({rooms::site("site-1")}, alert_event("emergency_alert"), at(0.0));

    REQUIRE(router.purge_expired(at(3000.0)) == 0);
    REQUIRE(router.purge_expired(at(3601.0)) == 1);

    const std::vector<QueuedMessage> list_remaining = router.queued_for("user-sup-1");
    REQUIRE(list_remaining.size() == 1);
    REQUIRE(list_remaining.front().envelope.event.name == "emergency_alert");

    REQUIRE(router.purge_expired(at(7201.0)) == 1);
    REQUIRE(router.queued_for("user-sup-1").empty());
    REQUIRE(router.stats().expired == 2);

    REQUIRE_THROWS_AS((BroadcastRouter{registry, world.directory, RetentionPolicy{Duration{0.0}, Duration{1.0}}}),
                      std::invalid_argument);
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter keeps events whose delivery failed") {
    const FrameSink failing_sink = [](const Envelope&) { throw std::runtime_error("socket closed"); };
    registry.register_session("sup-token", failing_sink, at(0.0));

    router.publish({rooms::user("user-sup-1")}, alert_event("emergency_alert"), at(1.0));

    const std::vector<QueuedMessage> list_queued = router.queued_for("user-sup-1");
    REQUIRE(list_queued.size() == 1);
    REQUIRE(list_queued.front().attempts == 1);
    REQUIRE(router.stats().delivery_failures == 1);

    router.flush_pending(at(2.0));
    REQUIRE(router.queued_for("user-sup-1").front().attempts == 2);
}

TEST_CASE_METHOD(RouterFixture, "BroadcastRouter announces users going online and offline to supervisors") {
    RecordingSink supervisor_sink{};
    registry.register_session("sup-token", supervisor_sink.sink(), at(0.0));
    drain_presence(presence, router, at(0.0));
    supervisor_sink.clear();

    RecordingSink agent_sink{};
    const SessionHandle agent = registry.register_session("agent-token", agent_sink.sink(), at(1.0));
    drain_presence(presence, router, at(1.0));

    std::vector<Envelope> list_changes = supervisor_sink.named("user_status_change");
    REQUIRE(list_changes.size() == 1);
    REQUIRE(list_changes.front().event.category == EventCategory::Presence);
    REQUIRE_THAT(list_changes.front().event.payload, Catch::Contains(R"("user_id":"user-agent-1")"));
    REQUIRE_THAT(list_changes.front().event.payload, Catch::Contains(R"("status":"online")"));
    REQUIRE(agent_sink.named("user_status_change").empty());

    registry.disconnect(agent, DisconnectReason::ClientClosed, at(2.0));
    drain_presence(presence, router, at(2.0));

    list_changes = supervisor_sink.named("user_status_change");
    REQUIRE(list_changes.size() == 2);
    REQUIRE_THAT(list_changes.back().event.payload, Catch::Contains(R"("status":"offline")"));
}
