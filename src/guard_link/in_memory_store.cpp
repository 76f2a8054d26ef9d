#include "guard_link/in_memory_store.hpp"

#include <algorithm>

#include "guard_link/errors.hpp"

namespace guard_link {

void InMemoryDurableStore::append_location_sample(const LocationSample& sample) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    list_samples_.push_back(sample);
}

void InMemoryDurableStore::append_alert_event(const AlertEvent& event) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    if (!set_event_ids_.insert(event.event_id).second) {
        return;
    }
    list_alert_events_.push_back(event);
}

void InMemoryDurableStore::upsert_alert(const AlertRecord& alert) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    map_alerts_[alert.id] = alert;
}

std::vector<AlertRecord> InMemoryDurableStore::load_open_alerts() {
    ensure_available();
    std::scoped_lock lock(mutex_);
    std::vector<AlertRecord> open_alerts;
    for (const auto& [alert_id, alert] : map_alerts_) {
        if (alert.status != AlertStatus::Resolved) {
            open_alerts.push_back(alert);
        }
    }
    return open_alerts;
}

std::vector<LocationSample> InMemoryDurableStore::location_history(const std::string& agent_id, TimePoint from,
                                                                   TimePoint to) {
    ensure_available();
    std::scoped_lock lock(mutex_);
    std::vector<LocationSample> history;
    for (const LocationSample& sample : list_samples_) {
        if (sample.agent_id == agent_id && sample.captured_at >= from && sample.captured_at <= to) {
            history.push_back(sample);
        }
    }
    std::sort(history.begin(), history.end(), [](const LocationSample& lhs, const LocationSample& rhs) {
        return lhs.captured_at < rhs.captured_at;
    });
    return history;
}

void InMemoryDurableStore::set_available(bool available) noexcept {
    flag_available_.store(available);
}

std::vector<LocationSample> InMemoryDurableStore::location_samples() const {
    std::scoped_lock lock(mutex_);
    return list_samples_;
}

std::vector<AlertEvent> InMemoryDurableStore::alert_events(const std::string& alert_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<AlertEvent> events;
    for (const AlertEvent& event : list_alert_events_) {
        if (event.alert_id == alert_id) {
            events.push_back(event);
        }
    }
    return events;
}

std::optional<AlertRecord> InMemoryDurableStore::alert(const std::string& alert_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_alert = map_alerts_.find(alert_id);
    if (iterator_alert == map_alerts_.end()) {
        return std::nullopt;
    }
    return iterator_alert->second;
}

void InMemoryDurableStore::ensure_available() const {
    if (!flag_available_.load()) {
        throw PersistenceError("durable store unavailable");
    }
}

}  // namespace guard_link
