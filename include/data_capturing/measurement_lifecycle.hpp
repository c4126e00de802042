// === Measurement Lifecycle ===================================================
//
// Drives a Measurement through start, pause, resume and stop. Every successful
// transition is recorded as an Event on the measurement; starting and resuming
// open a fresh Track that receives the locations and altitudes recorded until
// the next pause or stop. Illegal transitions throw DataCapturingError and
// leave the state untouched.
//
//   Idle --start--> Running --pause--> Paused --resume--> Running
//   Running|Paused --stop--> Stopped

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "data_capturing/measurement.hpp"
#include "data_capturing/track.hpp"
#include "data_capturing/types.hpp"

namespace data_capturing {

/** @brief Lifecycle states of a measurement. */
enum class LifecycleState {
    Idle,     /**< Created but not started. */
    Running,  /**< Capturing into the current track. */
    Paused,   /**< Temporarily not capturing; resume opens a new track. */
    Stopped   /**< Finished; no further transitions are possible. */
};

/** @brief Stable lower-case name for @p state, used in logs. */
[[nodiscard]] std::string_view to_string(LifecycleState state) noexcept;

/** @brief State machine owning the measurement it captures into. */
class MeasurementLifecycle final {
  public:
    explicit MeasurementLifecycle(Measurement measurement);

    [[nodiscard]] LifecycleState state() const noexcept;
    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] bool is_paused() const noexcept;

    /**
     * @brief The measurement with all completed tracks.
     *
     * The track being captured is only appended on pause or stop.
     */
    [[nodiscard]] const Measurement& measurement() const noexcept;
    /** @brief Track currently receiving data, empty unless running. */
    [[nodiscard]] const std::optional<Track>& current_track() const noexcept;

    /** @throws DataCapturingError (IsRunning, IsPaused, IsStopped) unless idle. */
    void start(TimePoint time = SystemClock::now());
    /** @throws DataCapturingError (NotRunning, IsPaused, IsStopped) unless running. */
    void pause(TimePoint time = SystemClock::now());
    /** @throws DataCapturingError (NotPaused, IsRunning, IsStopped) unless paused. */
    void resume(TimePoint time = SystemClock::now());
    /**
     * @brief Finish the measurement and mark it synchronizable.
     * @throws DataCapturingError (NotRunning, IsStopped) unless running or paused.
     */
    void stop(TimePoint time = SystemClock::now());
    /**
     * @brief Record a switch of transport mode, e.g. from "BICYCLE" to "CAR".
     * @throws DataCapturingError (NotRunning, IsStopped) unless running or paused.
     */
    void change_modality(const std::string& modality, TimePoint time = SystemClock::now());

    /** @throws DataCapturingError (NotRunning, IsPaused, IsStopped) unless running. */
    void record_location(const GeoLocation& location);
    /** @throws DataCapturingError (NotRunning, IsPaused, IsStopped) unless running. */
    void record_altitude(const Altitude& altitude);

    /**
     * @brief Hand out the measurement of a stopped lifecycle.
     * @throws DataCapturingError (NotRunning, IsRunning, IsPaused) unless stopped.
     */
    [[nodiscard]] Measurement release() &&;

  private:
    void require_running(std::string_view operation) const;
    void require_started(std::string_view operation) const;
    void close_current_track();
    void transition(LifecycleState next, EventType event_type, TimePoint time);

    Measurement measurement_;
    std::optional<Track> current_track_{};
    LifecycleState state_{LifecycleState::Idle};
};

}  // namespace data_capturing
