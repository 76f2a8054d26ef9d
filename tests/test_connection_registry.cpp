#include <algorithm>
#include <vector>

#include <catch2/catch.hpp>

#include "guard_link/connection_registry.hpp"
#include "guard_link/errors.hpp"
#include "test_support.hpp"

using namespace guard_link;
using guard_link::test::at;
using guard_link::test::RecordingSink;
using guard_link::test::World;

namespace {
std::vector<PresenceEvent> drain(EventChannel<PresenceEvent>& channel) {
    std::vector<PresenceEvent> list_events;
    while (std::optional<PresenceEvent> event = channel.try_consume()) {
        list_events.push_back(*event);
    }
    return list_events;
}

bool contains(const std::vector<std::string>& list_values, const std::string& value) {
    return std::find(list_values.begin(), list_values.end(), value) != list_values.end();
}
}  // namespace

TEST_CASE("ConnectionRegistry authenticates and auto-joins personal rooms") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{60.0}, presence};
    RecordingSink sink{};

    REQUIRE_THROWS_AS(registry.register_session("forged-token", sink.sink(), at(0.0)), AuthenticationError);
    REQUIRE(registry.session_count() == 0);

    const SessionHandle handle = registry.register_session("agent-token", sink.sink(), at(0.0));
    const std::optional<SessionSnapshot> snapshot = registry.session(handle);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->principal.role == Role::Agent);
    REQUIRE(snapshot->rooms == std::set<std::string>{"user:user-agent-1", "role:AGENT", "agent:agent-1"});

    const std::vector<PresenceEvent> list_events = drain(presence);
    REQUIRE(list_events.size() == 4);
    REQUIRE(list_events.front().change == PresenceChange::Online);
    REQUIRE(list_events.back().change == PresenceChange::JoinedRoom);

    REQUIRE(registry.route("agent:agent-1").size() == 1);
    REQUIRE(registry.is_user_online("user-agent-1"));
}

TEST_CASE("ConnectionRegistry enforces room access by role") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{60.0}, presence};
    RecordingSink sink{};

    const SessionHandle agent = registry.register_session("agent-token", sink.sink(), at(0.0));
    REQUIRE_THROWS_AS(registry.join_room(agent, "monitoring", at(1.0)), AuthenticationError);
    REQUIRE_THROWS_AS(registry.join_room(agent, "agent:agent-2", at(1.0)), AuthenticationError);
    REQUIRE_NOTHROW(registry.join_room(agent, "agent:agent-1", at(1.0)));

    const SessionHandle client = registry.register_session("client-token", sink.sink(), at(0.0));
    REQUIRE_NOTHROW(registry.join_room(client, "site:site-1", at(1.0)));
    REQUIRE_THROWS_AS(registry.join_room(client, "site:site-9", at(1.0)), AuthenticationError);
    REQUIRE_THROWS_AS(registry.join_room(client, "monitoring", at(1.0)), AuthenticationError);

    const SessionHandle supervisor = registry.register_session("sup-token", sink.sink(), at(0.0));
    REQUIRE_NOTHROW(registry.join_room(supervisor, "monitoring", at(1.0)));
    REQUIRE_NOTHROW(registry.join_room(supervisor, "agent:agent-1", at(1.0)));
    REQUIRE(registry.route("agent:agent-1").size() == 2);

    REQUIRE_THROWS_AS(registry.join_room(9'999, "monitoring", at(1.0)), ValidationError);
}

TEST_CASE("ConnectionRegistry keeps subscriptions across disconnect until the room is left") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{60.0}, presence};
    RecordingSink sink{};

    const SessionHandle handle = registry.register_session("sup-token", sink.sink(), at(0.0));
    registry.join_room(handle, "monitoring", at(1.0));
    registry.join_room(handle, "site:site-1", at(1.0));
    registry.leave_room(handle, "site:site-1", at(2.0));
    REQUIRE_FALSE(contains(registry.subscribers("site:site-1"), "user-sup-1"));

    drain(presence);
    REQUIRE(registry.disconnect(handle, DisconnectReason::ClientClosed, at(3.0)));
    REQUIRE_FALSE(registry.disconnect(handle, DisconnectReason::ClientClosed, at(3.0)));

    REQUIRE(registry.route("monitoring").empty());
    REQUIRE(contains(registry.subscribers("monitoring"), "user-sup-1"));
    REQUIRE_FALSE(registry.is_user_online("user-sup-1"));

    const std::vector<PresenceEvent> list_events = drain(presence);
    REQUIRE(list_events.back().change == PresenceChange::Offline);
    const auto left_count = std::count_if(list_events.begin(), list_events.end(), [](const PresenceEvent& event) {
        return event.change == PresenceChange::LeftRoom;
    });
    REQUIRE(left_count == 3);
}

TEST_CASE("ConnectionRegistry reports a user offline only after the last session ends") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{60.0}, presence};
    RecordingSink sink{};

    const SessionHandle phone = registry.register_session("sup-token", sink.sink(), at(0.0));
    const SessionHandle laptop = registry.register_session("sup-token", sink.sink(), at(1.0));
    REQUIRE(phone != laptop);

    auto count_changes = [](const std::vector<PresenceEvent>& list_events, PresenceChange change) {
        return std::count_if(list_events.begin(), list_events.end(),
                             [change](const PresenceEvent& event) { return event.change == change; });
    };
    REQUIRE(count_changes(drain(presence), PresenceChange::Online) == 1);

    registry.disconnect(phone, DisconnectReason::ClientClosed, at(2.0));
    REQUIRE(registry.is_user_online("user-sup-1"));
    REQUIRE(count_changes(drain(presence), PresenceChange::Offline) == 0);

    registry.disconnect(laptop, DisconnectReason::ClientClosed, at(3.0));
    REQUIRE(count_changes(drain(presence), PresenceChange::Offline) == 1);
    REQUIRE(registry.connected_users().empty());
}

TEST_CASE("ConnectionRegistry expires sessions that stop sending heartbeats") {
    World world{};
    EventChannel<PresenceEvent> presence{};
    ConnectionRegistry registry{world.directory, world.directory, Duration{60.0}, presence};
    RecordingSink sink{};

    const SessionHandle active = registry.register_session("sup-token", sink.sink(), at(0.0));
    const SessionHandle silent = registry.register_session("agent-token", sink.sink(), at(0.0));

    REQUIRE(registry.expire_idle(at(50.0)) == 0);
    REQUIRE(registry.touch(active, at(50.0)));

    REQUIRE(registry.expire_idle(at(61.0)) == 1);
    REQUIRE_FALSE(registry.session(silent).has_value());
    REQUIRE(registry.session(active).has_value());

    REQUIRE(registry.expire_idle(at(111.0)) == 1);
    REQUIRE(registry.session_count() == 0);
    REQUIRE_FALSE(registry.touch(active, at(112.0)));
}
