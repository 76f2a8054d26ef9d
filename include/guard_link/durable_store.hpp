// === Durable Store ===========================================================
//
// Append-only persistence contract for location samples and alert
// transitions. Implementations signal outages by throwing PersistenceError;
// the audit sink owns retries so callers never see those failures.

#pragma once

#include <vector>

#include "guard_link/alert_record.hpp"
#include "guard_link/location_sample.hpp"

namespace guard_link {

class DurableStore {
  public:
    virtual ~DurableStore() = default;

    virtual void append_location_sample(const LocationSample& sample) = 0;
    /** @brief At-least-once: implementations ignore a repeated event_id. */
    virtual void append_alert_event(const AlertEvent& event) = 0;
    /** @brief Insert or replace the alert row keyed by id. Rows of one alert arrive in transition order. */
    virtual void upsert_alert(const AlertRecord& alert) = 0;
    /** @brief Alerts not yet resolved, for startup recovery. */
    [[nodiscard]] virtual std::vector<AlertRecord> load_open_alerts() = 0;
    [[nodiscard]] virtual std::vector<LocationSample> location_history(const std::string& agent_id, TimePoint from,
                                                                       TimePoint to) = 0;
};

}  // namespace guard_link
