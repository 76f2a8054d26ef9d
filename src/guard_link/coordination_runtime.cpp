#include "guard_link/coordination_runtime.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "guard_link/errors.hpp"
#include "guard_link/logging.hpp"

namespace guard_link {

namespace {
constexpr std::string_view k_join_prefix{"join:"};
constexpr std::string_view k_leave_prefix{"leave:"};
constexpr std::string_view k_heartbeat{"heartbeat"};
}  // namespace

InboundMessage parse_command(std::string_view command) {
    if (command == k_heartbeat) {
        return HeartbeatMessage{};
    }
    if (command.starts_with(k_join_prefix) && command.size() > k_join_prefix.size()) {
        return JoinRoomMessage{std::string{command.substr(k_join_prefix.size())}};
    }
    if (command.starts_with(k_leave_prefix) && command.size() > k_leave_prefix.size()) {
        return LeaveRoomMessage{std::string{command.substr(k_leave_prefix.size())}};
    }
    throw ValidationError("Unrecognized command '" + std::string{command} + "'");
}

CoordinationRuntime::CoordinationRuntime(Configuration configuration,
                                         AuthService& auth_service,
                                         const DirectoryService& directory,
                                         DurableStore& store,
                                         const Clock& clock)
    : configuration_(std::move(configuration)),
      directory_(directory),
      store_(store),
      clock_(clock),
      audit_sink_(store_, configuration_.audit),
      registry_(auth_service, directory_, configuration_.session_idle_timeout, presence_channel_),
      router_(registry_, directory_, configuration_.retention),
      tracker_(configuration_.tracker, directory_, router_, audit_sink_, violation_channel_),
      engine_(configuration_.escalation, directory_, router_, audit_sink_, timer_queue_),
      logger_(get_logger()) {
    if (configuration_.dispatch_hz <= 0.0) {
        throw std::invalid_argument("CoordinationRuntime dispatch rate must be positive");
    }
}

CoordinationRuntime::~CoordinationRuntime() {
    shutdown();
}

/**
 * @brief Recover alerts that were open when the previous process stopped.
 *        Overdue escalation tiers fire on the first pump.
 */
void CoordinationRuntime::initialize() {
    logger_->info("Initializing coordination runtime");
    std::vector<AlertRecord> list_open_alerts;
    try {
        list_open_alerts = store_.load_open_alerts();
    } catch (const std::exception& exc) {
        logger_->critical("Failed to load open alerts for recovery: {}", exc.what());
        throw;
    }
    const std::size_t recovered_count = engine_.recover(list_open_alerts, clock_.now());
    logger_->info("Recovered {} open alerts", recovered_count);
}

void CoordinationRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting dispatcher at {} Hz", configuration_.dispatch_hz);
    dispatch_thread_ = std::thread(&CoordinationRuntime::dispatch_loop, this);
}

void CoordinationRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down coordination runtime");
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    const std::size_t written_count = audit_sink_.flush(clock_.now());
    const AuditStats audit_stats = audit_sink_.stats();
    logger_->info("Final audit flush wrote {} records; {} still pending", written_count, audit_stats.pending);
}

PumpSummary CoordinationRuntime::pump(TimePoint now) {
    PumpSummary summary{};
    summary.sessions_expired = registry_.expire_idle(now);

    while (std::optional<PresenceEvent> presence = presence_channel_.try_consume()) {
        router_.on_presence(*presence, now);
        ++summary.presence_events;
    }

    while (std::optional<GeofenceViolation> violation = violation_channel_.try_consume()) {
        try {
            engine_.raise_for_violation(*violation, now);
            ++summary.violations_raised;
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"runtime","action":"violation_alert_failed","violation":"{}","error":"{}"}})",
                violation->id,
                json_escape(exc.what())
            );
        }
    }

    summary.timers_fired = timer_queue_.fire_due(now);
    summary.messages_flushed = router_.flush_pending(now);
    summary.messages_expired = router_.purge_expired(now);
    summary.cache_evicted = tracker_.evict_expired(now);
    engine_.forget_resolved_before(now - to_clock_duration(configuration_.retention.alert_retention));
    summary.audit_written = audit_sink_.flush(now);
    return summary;
}

SessionHandle CoordinationRuntime::connect(const std::string& token, FrameSink sink) {
    return registry_.register_session(token, std::move(sink), clock_.now());
}

void CoordinationRuntime::disconnect(SessionHandle handle) {
    registry_.disconnect(handle, DisconnectReason::ClientClosed, clock_.now());
}

FrameReply CoordinationRuntime::handle_frame(SessionHandle handle, const InboundMessage& message) {
    const TimePoint now = clock_.now();
    try {
        return dispatch_frame(handle, message, now);
    } catch (const AuthenticationError& exc) {
        return FrameReply{false, "forbidden", exc.what()};
    } catch (const ValidationError& exc) {
        return FrameReply{false, "invalid", exc.what()};
    }
}

FrameReply CoordinationRuntime::handle_command(SessionHandle handle, std::string_view command) {
    try {
        return handle_frame(handle, parse_command(command));
    } catch (const ValidationError& exc) {
        return FrameReply{false, "invalid", exc.what()};
    }
}

AlertRecord CoordinationRuntime::trigger_alert(const AlertTrigger& trigger) {
    return engine_.create_alert(trigger, clock_.now());
}

TransitionResult CoordinationRuntime::acknowledge_alert(const std::string& alert_id, const std::string& user_id) {
    return engine_.acknowledge(alert_id, user_id, clock_.now());
}

TransitionResult CoordinationRuntime::resolve_alert(const std::string& alert_id, const std::string& user_id,
                                                    ResolutionKind kind, const std::string& notes) {
    return engine_.resolve(alert_id, user_id, kind, notes, clock_.now());
}

std::vector<LatestPosition> CoordinationRuntime::latest_locations(const std::string& site_id) const {
    return tracker_.latest_for_site(site_id, clock_.now());
}

std::vector<LocationSample> CoordinationRuntime::location_history(const std::string& agent_id, TimePoint from,
                                                                  TimePoint to) {
    if (to < from) {
        throw ValidationError("History range ends before it starts");
    }
    return store_.location_history(agent_id, from, to);
}

std::vector<AlertRecord> CoordinationRuntime::active_alerts() const {
    return engine_.active_alerts();
}

ConnectionRegistry& CoordinationRuntime::registry() noexcept {
    return registry_;
}

BroadcastRouter& CoordinationRuntime::router() noexcept {
    return router_;
}

LocationTracker& CoordinationRuntime::tracker() noexcept {
    return tracker_;
}

AlertEscalationEngine& CoordinationRuntime::engine() noexcept {
    return engine_;
}

AuditSink& CoordinationRuntime::audit_sink() noexcept {
    return audit_sink_;
}

FrameReply CoordinationRuntime::dispatch_frame(SessionHandle handle, const InboundMessage& message, TimePoint now) {
    const std::optional<SessionSnapshot> session = registry_.session(handle);
    if (!session.has_value()) {
        return FrameReply{false, "unknown_session", "session is not connected"};
    }
    registry_.touch(handle, now);
    const Principal& principal = session->principal;

    if (const auto* join = std::get_if<JoinRoomMessage>(&message)) {
        registry_.join_room(handle, join->room_id, now);
        return FrameReply{true, "ok", join->room_id};
    }
    if (const auto* leave = std::get_if<LeaveRoomMessage>(&message)) {
        registry_.leave_room(handle, leave->room_id, now);
        return FrameReply{true, "ok", leave->room_id};
    }
    if (std::holds_alternative<HeartbeatMessage>(message)) {
        return FrameReply{};
    }
    if (const auto* update = std::get_if<LocationUpdateMessage>(&message)) {
        if (!principal.agent_id.has_value()) {
            throw ValidationError("Only agents report locations");
        }
        const IngestResult result = tracker_.ingest(*principal.agent_id, update->report, now);
        const bool accepted = result.status != IngestStatus::RejectedInvalid
            && result.status != IngestStatus::RejectedNoActiveShift;
        return FrameReply{accepted, to_string(result.status), result.detail};
    }

    const auto& alert_message = std::get<EmergencyAlertMessage>(message);
    AlertTrigger trigger{};
    trigger.type = alert_message.type;
    trigger.agent_id = principal.agent_id.value_or(alert_message.agent_id.value_or(""));
    trigger.location = alert_message.location;
    trigger.description = alert_message.description;
    trigger.actor_id = principal.user_id;
    trigger.actor_role = principal.role;
    const AlertRecord alert = engine_.create_alert(trigger, now);
    return FrameReply{true, "ok", alert.id};
}

/**
 * @brief Fixed-cadence loop pumping timers, channels, queues and audit retries.
 */
void CoordinationRuntime::dispatch_loop() {
    using SteadyClock = std::chrono::steady_clock;
    const SteadyClock::duration tick_interval =
        std::chrono::duration_cast<SteadyClock::duration>(Duration{1.0 / configuration_.dispatch_hz});
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const auto steady_now = SteadyClock::now();
        if (steady_now < next_tick) {
            std::this_thread::sleep_for(next_tick - steady_now);
            continue;
        }
        try {
            pump(clock_.now());
        } catch (const std::exception& exc) {
            logger_->error("Dispatcher pump error: {}", exc.what());
        }
        next_tick = steady_now + tick_interval;
    }
}

}  // namespace guard_link
