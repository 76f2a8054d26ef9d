// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the coordination engine (time primitives, geodetic coordinates, roles and
// the injectable clock).

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace guard_link {

/**
 * @brief Alias for the wall clock. Device capture timestamps are wall time, so
 *        every component compares against the same clock.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Convert a configuration duration to the clock's native resolution.
 */
[[nodiscard]] inline SystemClock::duration to_clock_duration(Duration duration) {
    return std::chrono::duration_cast<SystemClock::duration>(duration);
}

/**
 * @brief Milliseconds since the Unix epoch, used in wire payloads.
 */
[[nodiscard]] inline std::int64_t to_epoch_ms(TimePoint time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Role resolved once at session registration.
 */
enum class Role {
    Agent,       /**< Field agent pushing positions. */
    Supervisor,  /**< Site or area supervisor. */
    Admin,       /**< Platform administrator. */
    Client       /**< Client portal user scoped to its own sites. */
};

[[nodiscard]] std::string_view to_string(Role role) noexcept;
[[nodiscard]] std::optional<Role> role_from_string(std::string_view str_role) noexcept;

/** @brief Source of the current time, injectable for deterministic tests. */
class Clock {
  public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

/** @brief Clock backed by the system wall clock. */
class WallClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
};

/** @brief Clock that only moves when told to. */
class ManualClock final : public Clock {
  public:
    explicit ManualClock(TimePoint start);

    [[nodiscard]] TimePoint now() const override;
    void advance(Duration delta);
    void set(TimePoint time_point);

  private:
    mutable std::mutex mutex_;
    TimePoint time_point_;
};

}  // namespace guard_link
