// === Measurement =============================================================
//
// One data capturing session, framed by a lifecycle start and stop. A
// measurement owns the tracks captured between pauses and the events the user
// triggered, and derives summary statistics (length, duration, average speed,
// accumulated ascent) from them.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "data_capturing/distance_calculation.hpp"
#include "data_capturing/track.hpp"
#include "data_capturing/types.hpp"

namespace data_capturing {

/**
 * @brief Noise filters for the accumulated ascent calculation.
 */
struct AscentConfig final {
    double ascend_threshold_m{2.0};             /**< Minimum GNSS altitude change counted as movement. */
    double vertical_accuracy_threshold_m{12.0}; /**< GNSS altitudes less accurate than this are skipped. */
    double altimeter_threshold_m{0.1};          /**< Minimum altimeter rise counted as ascent. */
};

/** @brief A captured session identified by a device-wide unique identifier. */
class Measurement final {
  public:
    explicit Measurement(std::uint64_t identifier, TimePoint time = SystemClock::now());

    [[nodiscard]] std::uint64_t identifier() const noexcept;
    [[nodiscard]] TimePoint time() const noexcept;

    /** @brief Whether the measurement is finished and may be synchronized. */
    [[nodiscard]] bool synchronizable() const noexcept;
    void set_synchronizable(bool synchronizable) noexcept;
    /** @brief Whether the measurement has been synchronized already. */
    [[nodiscard]] bool synchronized() const noexcept;
    void set_synchronized(bool synchronized) noexcept;

    [[nodiscard]] const std::vector<Track>& tracks() const noexcept;
    [[nodiscard]] const std::vector<Event>& events() const noexcept;

    void append_track(Track track);
    void append_event(Event event);

    /** @brief Mean speed over all valid locations; 0 if there are none. */
    [[nodiscard]] double average_speed() const;
    /** @brief Sum of the time spans between first and last location per track. */
    [[nodiscard]] Duration total_duration() const;
    /**
     * @brief Accumulated ascent in metres.
     *
     * Tracks with altimeter samples use those; other tracks fall back to the
     * altitude reported with each geo location.
     */
    [[nodiscard]] double summed_height(const AscentConfig& config = {}) const;
    /** @brief Length of all tracks in metres, measured with @p strategy. */
    [[nodiscard]] double track_length(const DistanceCalculationStrategy& strategy) const;

    friend bool operator==(const Measurement& lhs, const Measurement& rhs) noexcept {
        return lhs.identifier_ == rhs.identifier_;
    }

  private:
    std::uint64_t identifier_;
    TimePoint time_;
    bool synchronizable_{false};
    bool synchronized_{false};
    std::vector<Track> list_tracks_;
    std::vector<Event> list_events_;
};

}  // namespace data_capturing

template <>
struct std::hash<data_capturing::Measurement> {
    std::size_t operator()(const data_capturing::Measurement& measurement) const noexcept {
        return std::hash<std::uint64_t>{}(measurement.identifier());
    }
};
