// === Outbound Events =========================================================
//
// Wire-level shape of everything pushed to connected sessions, plus the
// publisher seam components use instead of calling the router directly.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guard_link/types.hpp"

namespace guard_link {

/** @brief Category drives queue retention for offline recipients. */
enum class EventCategory {
    Location,
    Alert,
    Presence
};

/** @brief Named event with a JSON payload. */
struct OutboundEvent final {
    std::string name{};
    EventCategory category{EventCategory::Location};
    std::string payload{};  /**< JSON object text. */
};

/** @brief Event as delivered: stamped with a publish sequence and the room it was routed through. */
struct Envelope final {
    std::uint64_t sequence{};
    std::string room_id{};
    OutboundEvent event{};
    TimePoint published_at{};
};

/** @brief Fan-out seam implemented by the broadcast router. */
class EventPublisher {
  public:
    virtual ~EventPublisher() = default;

    /**
     * @brief Deliver @p event to every recipient of @p room_ids, once per
     *        recipient even when it belongs to several of the rooms.
     */
    virtual void publish(const std::vector<std::string>& room_ids, const OutboundEvent& event, TimePoint now) = 0;
};

/** @brief Escape a string for embedding inside a JSON string literal. */
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace guard_link
