// === Core Types ==============================================================
//
// Collects the shared time aliases and the plain value types that make up a
// measurement: geo locations, barometric altitudes, raw sensor values and
// user events.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace data_capturing {

/**
 * @brief Alias for the wall clock used to timestamp captured values.
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
 * @brief A latitude/longitude pair in decimal degrees.
 */
struct Coordinate final {
    double latitude_deg{};   /**< Latitude from -90 (south) to 90 (north). */
    double longitude_deg{};  /**< Longitude from -180 (west) to 180 (east). */
};

/**
 * @brief One geo location fix provided by the positioning system.
 */
struct GeoLocation final {
    double latitude_deg{};             /**< Latitude from -90 (south) to 90 (north). */
    double longitude_deg{};            /**< Longitude from -180 (west) to 180 (east). */
    double accuracy_m{};               /**< Estimated horizontal accuracy in metres. */
    double speed_mps{};                /**< Device speed at the time of the fix. */
    TimePoint time{};                  /**< Time the fix was taken. */
    bool is_valid{true};               /**< Whether the fix is part of the cleaned track. */
    double altitude_m{};               /**< Altitude above mean sea level in metres. */
    double vertical_accuracy_m{};      /**< Estimated accuracy of the altitude in metres. */

    [[nodiscard]] Coordinate coordinate() const noexcept {
        return Coordinate{latitude_deg, longitude_deg};
    }
};

/**
 * @brief A barometric altitude sample from an altimeter.
 */
struct Altitude final {
    double relative_altitude_m{};  /**< Altitude change relative to the first sample. */
    double pressure_kpa{};         /**< Measured air pressure in kilopascals. */
    TimePoint time{};              /**< Time the sample was taken. */
};

/**
 * @brief One three-axis sample (acceleration, rotation or direction).
 *
 * Axes follow the device frame: x to the right, y to the top, z out of the
 * screen towards the user.
 */
struct SensorValue final {
    TimePoint time{};
    double x{};
    double y{};
    double z{};

    bool operator==(const SensorValue&) const = default;
};

/**
 * @brief Kinds of events recorded while a measurement is running.
 *
 * The numeric codes are stable and must not be reordered.
 */
enum class EventType : std::int16_t {
    LifecycleStart = 0,      /**< Capturing started. */
    LifecyclePause = 1,      /**< Capturing paused. */
    LifecycleResume = 2,     /**< Capturing resumed after a pause. */
    LifecycleStop = 3,       /**< Capturing stopped. */
    ModalityTypeChange = 4   /**< The user switched the transport modality. */
};

/** @brief Stable lower-case name for @p type, used in logs. */
[[nodiscard]] std::string_view to_string(EventType type) noexcept;

/**
 * @brief A user or lifecycle event that occurred during a measurement.
 */
struct Event final {
    TimePoint time{};
    EventType type{EventType::LifecycleStart};
    std::optional<std::string> value{};  /**< Payload such as the new modality name. */
};

}  // namespace data_capturing
