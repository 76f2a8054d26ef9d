// === Coordination Runtime ====================================================
//
// Wires the registry, tracker, escalation engine, router and audit sink
// together and exposes the operations used by the transport and REST layers.
// A background dispatcher thread pumps presence and violation channels,
// escalation timers, queue maintenance and audit retries at a fixed cadence.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "guard_link/alert_engine.hpp"
#include "guard_link/audit_sink.hpp"
#include "guard_link/broadcast_router.hpp"
#include "guard_link/configuration.hpp"
#include "guard_link/connection_registry.hpp"
#include "guard_link/durable_store.hpp"
#include "guard_link/event_channel.hpp"
#include "guard_link/location_tracker.hpp"
#include "guard_link/timer_queue.hpp"

namespace guard_link {

struct JoinRoomMessage final {
    std::string room_id{};
};

struct LeaveRoomMessage final {
    std::string room_id{};
};

struct HeartbeatMessage final {};

struct LocationUpdateMessage final {
    LocationReport report{};
};

struct EmergencyAlertMessage final {
    AlertType type{AlertType::General};
    std::optional<std::string> agent_id{};  /**< Required when the sender is not an agent. */
    std::optional<GeodeticCoordinate> location{};
    std::string description{};
};

/** @brief Decoded inbound session frame. */
using InboundMessage =
    std::variant<JoinRoomMessage, LeaveRoomMessage, HeartbeatMessage, LocationUpdateMessage, EmergencyAlertMessage>;

/**
 * @brief Decode a text subscription command: `join:{room}`, `leave:{room}`
 *        or `heartbeat`.
 * @throws ValidationError for anything else.
 */
[[nodiscard]] InboundMessage parse_command(std::string_view command);

/** @brief Synchronous answer to one inbound frame. */
struct FrameReply final {
    bool accepted{true};
    std::string code{"ok"};
    std::string detail{};
};

/** @brief Work done by one dispatcher pump. */
struct PumpSummary final {
    std::size_t sessions_expired{};
    std::size_t presence_events{};
    std::size_t violations_raised{};
    std::size_t timers_fired{};
    std::size_t messages_flushed{};
    std::size_t messages_expired{};
    std::size_t cache_evicted{};
    std::size_t audit_written{};
};

class CoordinationRuntime final {
  public:
    CoordinationRuntime(Configuration configuration,
                        AuthService& auth_service,
                        const DirectoryService& directory,
                        DurableStore& store,
                        const Clock& clock);
    ~CoordinationRuntime();

    CoordinationRuntime(const CoordinationRuntime&) = delete;
    CoordinationRuntime& operator=(const CoordinationRuntime&) = delete;

    /** @brief Re-register open alerts from the durable store. */
    void initialize();
    /** @brief Start the background dispatcher. */
    void run();
    /** @brief Stop the dispatcher and flush pending audit writes once more. */
    void shutdown();

    /** @brief One dispatcher iteration; called by the background loop or directly by tests. */
    PumpSummary pump(TimePoint now);

    /** @throws AuthenticationError when the token is rejected. */
    SessionHandle connect(const std::string& token, FrameSink sink);
    void disconnect(SessionHandle handle);

    FrameReply handle_frame(SessionHandle handle, const InboundMessage& message);
    FrameReply handle_command(SessionHandle handle, std::string_view command);

    AlertRecord trigger_alert(const AlertTrigger& trigger);
    TransitionResult acknowledge_alert(const std::string& alert_id, const std::string& user_id);
    TransitionResult resolve_alert(const std::string& alert_id, const std::string& user_id, ResolutionKind kind,
                                   const std::string& notes);

    [[nodiscard]] std::vector<LatestPosition> latest_locations(const std::string& site_id) const;
    [[nodiscard]] std::vector<LocationSample> location_history(const std::string& agent_id, TimePoint from, TimePoint to);
    [[nodiscard]] std::vector<AlertRecord> active_alerts() const;

    [[nodiscard]] ConnectionRegistry& registry() noexcept;
    [[nodiscard]] BroadcastRouter& router() noexcept;
    [[nodiscard]] LocationTracker& tracker() noexcept;
    [[nodiscard]] AlertEscalationEngine& engine() noexcept;
    [[nodiscard]] AuditSink& audit_sink() noexcept;

  private:
    FrameReply dispatch_frame(SessionHandle handle, const InboundMessage& message, TimePoint now);
    void dispatch_loop();

    Configuration configuration_;
    const DirectoryService& directory_;
    DurableStore& store_;
    const Clock& clock_;
    EventChannel<PresenceEvent> presence_channel_;
    EventChannel<GeofenceViolation> violation_channel_;
    TimerQueue timer_queue_;
    AuditSink audit_sink_;
    ConnectionRegistry registry_;
    BroadcastRouter router_;
    LocationTracker tracker_;
    AlertEscalationEngine engine_;
    std::atomic<bool> flag_running_{false};
    std::thread dispatch_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guard_link
