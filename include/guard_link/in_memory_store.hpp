#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "guard_link/durable_store.hpp"

namespace guard_link {

/**
 * @brief Process-local DurableStore used by the server demo and the tests.
 *        Can be switched unavailable to exercise audit retries.
 */
class InMemoryDurableStore final : public DurableStore {
  public:
    void append_location_sample(const LocationSample& sample) override;
    void append_alert_event(const AlertEvent& event) override;
    void upsert_alert(const AlertRecord& alert) override;
    [[nodiscard]] std::vector<AlertRecord> load_open_alerts() override;
    [[nodiscard]] std::vector<LocationSample> location_history(const std::string& agent_id, TimePoint from,
                                                               TimePoint to) override;

    /** @brief While unavailable every write throws PersistenceError. */
    void set_available(bool available) noexcept;

    [[nodiscard]] std::vector<LocationSample> location_samples() const;
    [[nodiscard]] std::vector<AlertEvent> alert_events(const std::string& alert_id) const;
    [[nodiscard]] std::optional<AlertRecord> alert(const std::string& alert_id) const;

  private:
    void ensure_available() const;

    std::atomic<bool> flag_available_{true};
    mutable std::mutex mutex_;
    std::vector<LocationSample> list_samples_;
    std::vector<AlertEvent> list_alert_events_;
    std::set<std::string> set_event_ids_;
    std::map<std::string, AlertRecord> map_alerts_;
};

}  // namespace guard_link
