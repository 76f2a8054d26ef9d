#include "guard_link/alert_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "guard_link/errors.hpp"
#include "guard_link/rooms.hpp"

namespace guard_link {

namespace {
constexpr std::uint32_t k_level_mask{0xFFFFu};
constexpr int k_status_shift{16};
constexpr const char* k_system_actor{"system"};

void add_room(std::vector<std::string>& list_rooms, std::string room_id) {
    if (std::find(list_rooms.begin(), list_rooms.end(), room_id) == list_rooms.end()) {
        list_rooms.push_back(std::move(room_id));
    }
}

std::string alert_payload(const AlertRecord& alert) {
    const std::string location = alert.location.has_value()
        ? fmt::format(R"({{"lat":{:.7f},"lon":{:.7f}}})", alert.location->latitude_deg, alert.location->longitude_deg)
        : std::string{"null"};
    const std::string violation_distance = alert.violation_distance_m.has_value()
        ? fmt::format("{:.1f}", *alert.violation_distance_m)
        : std::string{"null"};
    const std::string acknowledged_by = alert.acknowledgments.empty()
        ? std::string{"null"}
        : fmt::format(R"("{}")", json_escape(alert.acknowledgments.front().user_id));
    const std::string resolution = alert.resolution.has_value()
        ? fmt::format(
              R"({{"by":"{}","kind":"{}","notes":"{}","at":{}}})",
              json_escape(alert.resolution->user_id),
              to_string(alert.resolution->kind),
              json_escape(alert.resolution->notes),
              to_epoch_ms(alert.resolution->resolved_at)
          )
        : std::string{"null"};

    return fmt::format(
        R"({{"id":"{}","type":"{}","priority":"{}","status":"{}","level":{},"agent_id":"{}","site_id":"{}","location":{},"description":"{}","violation_distance_m":{},"acknowledged_by":{},"resolution":{},"created_at":{},"updated_at":{}}})",
        json_escape(alert.id),
        to_string(alert.type),
        to_string(alert.priority),
        to_string(alert.status),
        alert.level,
        json_escape(alert.origin_agent_id),
        json_escape(alert.site_id),
        location,
        json_escape(alert.description),
        violation_distance,
        acknowledged_by,
        resolution,
        to_epoch_ms(alert.created_at),
        to_epoch_ms(alert.updated_at)
    );
}
}  // namespace

AlertEscalationEngine::AlertEscalationEngine(EscalationPolicy policy,
                                             const DirectoryService& directory,
                                             EventPublisher& publisher,
                                             AuditSink& audit_sink,
                                             TimerQueue& timer_queue)
    : policy_(std::move(policy)),
      directory_(directory),
      publisher_(publisher),
      audit_sink_(audit_sink),
      timer_queue_(timer_queue),
      logger_(get_logger()) {
    Duration previous_offset{0.0};
    for (const Duration& offset : policy_.level_offsets) {
        if (offset <= previous_offset) {
            throw std::invalid_argument("Escalation offsets must be positive and strictly increasing");
        }
        previous_offset = offset;
    }
    if (policy_.level_offsets.size() > k_level_mask) {
        throw std::invalid_argument("Too many escalation levels");
    }
}

AlertRecord AlertEscalationEngine::create_alert(const AlertTrigger& trigger, TimePoint now) {
    if (trigger.actor_id.empty()) {
        throw ValidationError("Alert trigger requires an actor");
    }
    if (trigger.agent_id.empty() || !directory_.agent_exists(trigger.agent_id)) {
        throw ValidationError("Unknown agent '" + trigger.agent_id + "'");
    }

    std::string site_id = trigger.site_id.value_or("");
    if (site_id.empty()) {
        const std::optional<ShiftAssignment> shift = directory_.active_shift(trigger.agent_id, now);
        if (!shift.has_value()) {
            throw ValidationError("Agent '" + trigger.agent_id + "' has no site to route the alert to");
        }
        site_id = shift->site_id;
    }

    AlertRecord record{};
    record.type = trigger.type;
    record.priority = priority_for(trigger.type, trigger.actor_role);
    record.origin_agent_id = trigger.agent_id;
    record.site_id = std::move(site_id);
    record.location = trigger.location;
    record.description = trigger.description;
    return open_alert(std::move(record), trigger.actor_id, now);
}

AlertRecord AlertEscalationEngine::raise_for_violation(const GeofenceViolation& violation, TimePoint now) {
    AlertRecord record{};
    record.type = AlertType::Security;
    record.priority = priority_for(AlertType::Security, Role::Agent);
    record.origin_agent_id = violation.agent_id;
    record.site_id = violation.site_id;
    record.location = violation.sample.position;
    record.description = fmt::format(
        "Geofence violation {}: {:.0f} m outside site {} ({} severity)",
        violation.id,
        violation.distance_outside_m,
        violation.site_id,
        to_string(violation.severity)
    );
    record.violation_distance_m = violation.distance_outside_m;
    return open_alert(std::move(record), k_system_actor, now);
}

TransitionResult AlertEscalationEngine::acknowledge(const std::string& alert_id, const std::string& user_id,
                                                    TimePoint now) {
    if (user_id.empty()) {
        throw ValidationError("Acknowledgment requires a user");
    }
    const std::shared_ptr<AlertState> state = find_state(alert_id);
    if (state == nullptr) {
        throw ValidationError("Unknown alert '" + alert_id + "'");
    }

    std::scoped_lock state_lock(state->mutex);
    std::uint32_t observed = state->phase.load();
    if (status_of(observed) != AlertStatus::Open
        || !state->phase.compare_exchange_strong(observed, encode_phase(AlertStatus::Acknowledged, level_of(observed)))) {
        {
            std::scoped_lock lock(mutex_);
            ++struct_stats_.duplicate_requests;
        }
        logger_->info(
            R"({{"component":"escalation","action":"acknowledge_ignored","alert":"{}","user":"{}","status":"{}"}})",
            alert_id,
            user_id,
            to_string(state->record.status)
        );
        return TransitionResult{TransitionOutcome::AlreadyTerminal, state->record};
    }

    TimerQueue::cancel(state->timer);
    state->timer.reset();

    AlertRecord& record = state->record;
    record.status = AlertStatus::Acknowledged;
    record.acknowledgments.push_back(Acknowledgment{user_id, now});
    record.updated_at = now;
    record_transition(record, "acknowledged", record.level, AlertStatus::Open, user_id, now);

    std::vector<std::string> list_rooms = rooms_for_level(record, record.level);
    add_room(list_rooms, rooms::agent(record.origin_agent_id));
    broadcast(record, "alert_acknowledged", list_rooms, now);

    {
        std::scoped_lock lock(mutex_);
        ++struct_stats_.acknowledged;
    }
    logger_->info(
        R"({{"component":"escalation","action":"acknowledge","alert":"{}","user":"{}","level":{}}})",
        alert_id,
        user_id,
        record.level
    );
    return TransitionResult{TransitionOutcome::Applied, record};
}

TransitionResult AlertEscalationEngine::resolve(const std::string& alert_id, const std::string& user_id,
                                                ResolutionKind kind, const std::string& notes, TimePoint now) {
    if (user_id.empty()) {
        throw ValidationError("Resolution requires a user");
    }
    const std::shared_ptr<AlertState> state = find_state(alert_id);
    if (state == nullptr) {
        throw ValidationError("Unknown alert '" + alert_id + "'");
    }

    std::scoped_lock state_lock(state->mutex);
    std::uint32_t observed = state->phase.load();
    if (status_of(observed) == AlertStatus::Resolved
        || !state->phase.compare_exchange_strong(observed, encode_phase(AlertStatus::Resolved, level_of(observed)))) {
        {
            std::scoped_lock lock(mutex_);
            ++struct_stats_.duplicate_requests;
        }
        logger_->info(
            R"({{"component":"escalation","action":"resolve_ignored","alert":"{}","user":"{}"}})",
            alert_id,
            user_id
        );
        return TransitionResult{TransitionOutcome::AlreadyTerminal, state->record};
    }

    TimerQueue::cancel(state->timer);
    state->timer.reset();

    AlertRecord& record = state->record;
    const AlertStatus from_status = record.status;
    record.status = AlertStatus::Resolved;
    record.resolution = Resolution{user_id, kind, notes, now};
    record.updated_at = now;
    record_transition(record, "resolved", record.level, from_status, user_id, now);

    std::vector<std::string> list_rooms = rooms_for_level(record, record.level);
    add_room(list_rooms, rooms::agent(record.origin_agent_id));
    broadcast(record, "alert_resolved", list_rooms, now);

    {
        std::scoped_lock lock(mutex_);
        ++struct_stats_.resolved;
    }
    logger_->info(
        R"({{"component":"escalation","action":"resolve","alert":"{}","user":"{}","kind":"{}","level":{}}})",
        alert_id,
        user_id,
        to_string(kind),
        record.level
    );
    return TransitionResult{TransitionOutcome::Applied, record};
}

std::size_t AlertEscalationEngine::recover(const std::vector<AlertRecord>& open_alerts, TimePoint now) {
    std::size_t recovered_count = 0;
    for (const AlertRecord& record : open_alerts) {
        if (record.status == AlertStatus::Resolved || record.id.empty()) {
            continue;
        }
        auto state = std::make_shared<AlertState>();
        state->record = record;
        state->phase.store(encode_phase(record.status, record.level));

        std::scoped_lock state_lock(state->mutex);
        {
            std::scoped_lock lock(mutex_);
            if (!map_alerts_.try_emplace(record.id, state).second) {
                continue;
            }
        }
        if (record.status == AlertStatus::Open) {
            arm_next_escalation(state);
        }
        ++recovered_count;
        logger_->info(
            R"({{"component":"escalation","action":"recover","alert":"{}","status":"{}","level":{},"next_deadline_in_s":{:.0f}}})",
            record.id,
            to_string(record.status),
            record.level,
            state->timer != nullptr ? Duration{state->timer->deadline - now}.count() : 0.0
        );
    }
    return recovered_count;
}

std::size_t AlertEscalationEngine::forget_resolved_before(TimePoint cutoff) {
    std::vector<std::pair<std::string, std::shared_ptr<AlertState>>> list_resolved;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [alert_id, state] : map_alerts_) {
            if (status_of(state->phase.load()) == AlertStatus::Resolved) {
                list_resolved.emplace_back(alert_id, state);
            }
        }
    }
    std::size_t forgotten_count = 0;
    for (const auto& [alert_id, state] : list_resolved) {
        TimePoint updated_at{};
        {
            std::scoped_lock state_lock(state->mutex);
            updated_at = state->record.updated_at;
        }
        if (updated_at >= cutoff) {
            continue;
        }
        std::scoped_lock lock(mutex_);
        forgotten_count += map_alerts_.erase(alert_id);
    }
    return forgotten_count;
}

std::optional<AlertRecord> AlertEscalationEngine::find_alert(const std::string& alert_id) const {
    const std::shared_ptr<AlertState> state = find_state(alert_id);
    if (state == nullptr) {
        return std::nullopt;
    }
    std::scoped_lock state_lock(state->mutex);
    return state->record;
}

std::vector<AlertRecord> AlertEscalationEngine::active_alerts() const {
    std::vector<std::shared_ptr<AlertState>> list_states;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [alert_id, state] : map_alerts_) {
            if (status_of(state->phase.load()) != AlertStatus::Resolved) {
                list_states.push_back(state);
            }
        }
    }
    std::vector<AlertRecord> list_alerts;
    list_alerts.reserve(list_states.size());
    for (const std::shared_ptr<AlertState>& state : list_states) {
        std::scoped_lock state_lock(state->mutex);
        if (state->record.status != AlertStatus::Resolved) {
            list_alerts.push_back(state->record);
        }
    }
    std::sort(list_alerts.begin(), list_alerts.end(), [](const AlertRecord& lhs, const AlertRecord& rhs) {
        return lhs.created_at < rhs.created_at || (lhs.created_at == rhs.created_at && lhs.id < rhs.id);
    });
    return list_alerts;
}

std::vector<std::string> AlertEscalationEngine::rooms_for_level(const AlertRecord& alert, int level) const {
    const std::optional<SiteRouting> routing = directory_.site_routing(alert.site_id);
    const bool has_area = routing.has_value() && !routing->area_id.empty();

    std::vector<std::string> list_rooms{rooms::site(alert.site_id)};
    if (alert.priority != AlertPriority::Normal) {
        add_room(list_rooms, rooms::monitoring());
    }
    if (alert.priority == AlertPriority::Critical && has_area) {
        add_room(list_rooms, rooms::area(routing->area_id));
    }
    if (level >= 1) {
        if (has_area) {
            add_room(list_rooms, rooms::area(routing->area_id));
        }
        add_room(list_rooms, rooms::role(Role::Supervisor));
    }
    if (level >= 2) {
        add_room(list_rooms, rooms::role(Role::Admin));
    }
    return list_rooms;
}

int AlertEscalationEngine::max_level() const noexcept {
    return static_cast<int>(policy_.level_offsets.size());
}

EscalationStats AlertEscalationEngine::stats() const {
    std::scoped_lock lock(mutex_);
    EscalationStats snapshot = struct_stats_;
    snapshot.open = 0;
    for (const auto& [alert_id, state] : map_alerts_) {
        if (status_of(state->phase.load()) != AlertStatus::Resolved) {
            ++snapshot.open;
        }
    }
    return snapshot;
}

std::uint32_t AlertEscalationEngine::encode_phase(AlertStatus status, int level) noexcept {
    return (static_cast<std::uint32_t>(status) << k_status_shift) | (static_cast<std::uint32_t>(level) & k_level_mask);
}

AlertStatus AlertEscalationEngine::status_of(std::uint32_t phase) noexcept {
    return static_cast<AlertStatus>(phase >> k_status_shift);
}

int AlertEscalationEngine::level_of(std::uint32_t phase) noexcept {
    return static_cast<int>(phase & k_level_mask);
}

AlertPriority AlertEscalationEngine::priority_for(AlertType type, Role actor_role) const {
    switch (type) {
        case AlertType::Panic:
        case AlertType::Medical:
            return AlertPriority::Critical;
        case AlertType::Fire:
            return AlertPriority::High;
        case AlertType::Security:
        case AlertType::General:
            break;
    }
    const auto iterator_priority = policy_.role_default_priority.find(actor_role);
    return iterator_priority == policy_.role_default_priority.end() ? AlertPriority::Normal : iterator_priority->second;
}

std::shared_ptr<AlertEscalationEngine::AlertState> AlertEscalationEngine::find_state(const std::string& alert_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_alert = map_alerts_.find(alert_id);
    return iterator_alert == map_alerts_.end() ? nullptr : iterator_alert->second;
}

AlertRecord AlertEscalationEngine::open_alert(AlertRecord record, const std::string& actor, TimePoint now) {
    auto state = std::make_shared<AlertState>();
    state->phase.store(encode_phase(AlertStatus::Open, 0));

    std::scoped_lock state_lock(state->mutex);
    {
        std::scoped_lock lock(mutex_);
        record.id = fmt::format("alert_{}_{}", to_epoch_ms(now), next_alert_number_++);
        ++struct_stats_.created;
        map_alerts_.emplace(record.id, state);
    }
    record.level = 0;
    record.status = AlertStatus::Open;
    record.created_at = now;
    record.updated_at = now;
    state->record = std::move(record);

    const AlertRecord& stored = state->record;
    record_transition(stored, "created", 0, std::nullopt, actor, now);
    broadcast(stored, "emergency_alert", rooms_for_level(stored, 0), now);
    arm_next_escalation(state);

    logger_->warn(
        R"({{"component":"escalation","action":"create","alert":"{}","type":"{}","priority":"{}","agent":"{}","site":"{}","actor":"{}"}})",
        stored.id,
        to_string(stored.type),
        to_string(stored.priority),
        stored.origin_agent_id,
        stored.site_id,
        actor
    );
    return stored;
}

void AlertEscalationEngine::arm_next_escalation(const std::shared_ptr<AlertState>& state) {
    const int level = state->record.level;
    if (level >= max_level()) {
        state->timer.reset();
        return;
    }
    const TimePoint deadline = state->record.created_at + to_clock_duration(policy_.level_offsets[level]);
    const int target_level = level + 1;
    std::weak_ptr<AlertState> weak_state = state;
    state->timer = timer_queue_.schedule(deadline, [this, weak_state, target_level](TimePoint fired_at) {
        if (const std::shared_ptr<AlertState> locked_state = weak_state.lock()) {
            escalate(locked_state, target_level, fired_at);
        }
    });
}

void AlertEscalationEngine::escalate(const std::shared_ptr<AlertState>& state, int target_level, TimePoint fired_at) {
    try {
        std::scoped_lock state_lock(state->mutex);
        std::uint32_t expected = encode_phase(AlertStatus::Open, target_level - 1);
        if (!state->phase.compare_exchange_strong(expected, encode_phase(AlertStatus::Open, target_level))) {
            {
                std::scoped_lock lock(mutex_);
                ++struct_stats_.superseded_timers;
            }
            logger_->debug(
                R"({{"component":"escalation","action":"escalation_superseded","alert":"{}","target_level":{},"status":"{}"}})",
                state->record.id,
                target_level,
                to_string(status_of(expected))
            );
            return;
        }

        AlertRecord& record = state->record;
        record.level = target_level;
        record.updated_at = fired_at;
        record_transition(record, fmt::format("level:{}", target_level), target_level - 1, AlertStatus::Open,
                          k_system_actor, fired_at);
        const std::vector<std::string> list_rooms = rooms_for_level(record, target_level);
        broadcast(record, "alert_escalated", list_rooms, fired_at);

        {
            std::scoped_lock lock(mutex_);
            ++struct_stats_.escalations;
        }
        logger_->warn(
            R"({{"component":"escalation","action":"escalate","alert":"{}","from_level":{},"to_level":{},"rooms":"{}"}})",
            record.id,
            target_level - 1,
            target_level,
            fmt::join(list_rooms, ",")
        );
        arm_next_escalation(state);
    } catch (const std::exception& exc) {
        logger_->error(
            R"({{"component":"escalation","action":"escalate_failed","target_level":{},"error":"{}"}})",
            target_level,
            json_escape(exc.what())
        );
    }
}

void AlertEscalationEngine::record_transition(const AlertRecord& record, const std::string& suffix, int from_level,
                                              std::optional<AlertStatus> from_status, const std::string& actor,
                                              TimePoint now) {
    AlertEvent event{
        fmt::format("{}:{}", record.id, suffix),
        record.id,
        from_level,
        record.level,
        from_status,
        record.status,
        now,
        actor,
    };
    audit_sink_.record_alert_event(event, now);
    audit_sink_.record_alert(record, now);
}

void AlertEscalationEngine::broadcast(const AlertRecord& record, const std::string& event_name,
                                      const std::vector<std::string>& room_ids, TimePoint now) {
    publisher_.publish(room_ids, OutboundEvent{event_name, EventCategory::Alert, alert_payload(record)}, now);
}

}  // namespace guard_link
