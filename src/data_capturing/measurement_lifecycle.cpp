#include "data_capturing/measurement_lifecycle.hpp"

#include <string>
#include <utility>

#include "data_capturing/errors.hpp"
#include "data_capturing/logging.hpp"

namespace data_capturing {

namespace {

[[noreturn]] void fail(DataCapturingErrorKind kind, std::string_view operation, LifecycleState state) {
    throw DataCapturingError(
        kind,
        "Cannot " + std::string{operation} + " a measurement that is " + std::string{to_string(state)}
    );
}

}  // namespace

std::string_view to_string(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Idle:
            return "idle";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::Paused:
            return "paused";
        case LifecycleState::Stopped:
            return "stopped";
    }
    return "unknown";
}

MeasurementLifecycle::MeasurementLifecycle(Measurement measurement)
    : measurement_(std::move(measurement)) {}

LifecycleState MeasurementLifecycle::state() const noexcept {
    return state_;
}

bool MeasurementLifecycle::is_running() const noexcept {
    return state_ == LifecycleState::Running;
}

bool MeasurementLifecycle::is_paused() const noexcept {
    return state_ == LifecycleState::Paused;
}

const Measurement& MeasurementLifecycle::measurement() const noexcept {
    return measurement_;
}

const std::optional<Track>& MeasurementLifecycle::current_track() const noexcept {
    return current_track_;
}

void MeasurementLifecycle::start(TimePoint time) {
    switch (state_) {
        case LifecycleState::Idle:
            break;
        case LifecycleState::Running:
            fail(DataCapturingErrorKind::IsRunning, "start", state_);
        case LifecycleState::Paused:
            fail(DataCapturingErrorKind::IsPaused, "start", state_);
        case LifecycleState::Stopped:
            fail(DataCapturingErrorKind::IsStopped, "start", state_);
    }
    current_track_.emplace();
    transition(LifecycleState::Running, EventType::LifecycleStart, time);
}

void MeasurementLifecycle::pause(TimePoint time) {
    require_running("pause");
    close_current_track();
    transition(LifecycleState::Paused, EventType::LifecyclePause, time);
}

void MeasurementLifecycle::resume(TimePoint time) {
    switch (state_) {
        case LifecycleState::Paused:
            break;
        case LifecycleState::Running:
            fail(DataCapturingErrorKind::IsRunning, "resume", state_);
        case LifecycleState::Idle:
            fail(DataCapturingErrorKind::NotPaused, "resume", state_);
        case LifecycleState::Stopped:
            fail(DataCapturingErrorKind::IsStopped, "resume", state_);
    }
    current_track_.emplace();
    transition(LifecycleState::Running, EventType::LifecycleResume, time);
}

void MeasurementLifecycle::stop(TimePoint time) {
    require_started("stop");
    close_current_track();
    measurement_.set_synchronizable(true);
    transition(LifecycleState::Stopped, EventType::LifecycleStop, time);
}

void MeasurementLifecycle::change_modality(const std::string& modality, TimePoint time) {
    require_started("change the modality of");
    measurement_.append_event(Event{time, EventType::ModalityTypeChange, modality});
    if (auto logger = find_logger()) {
        logger->info("Measurement {} modality changed to {}", measurement_.identifier(), modality);
    }
}

void MeasurementLifecycle::record_location(const GeoLocation& location) {
    require_running("record a location for");
    current_track_->append_location(location);
}

void MeasurementLifecycle::record_altitude(const Altitude& altitude) {
    require_running("record an altitude for");
    current_track_->append_altitude(altitude);
}

Measurement MeasurementLifecycle::release() && {
    switch (state_) {
        case LifecycleState::Stopped:
            break;
        case LifecycleState::Idle:
            fail(DataCapturingErrorKind::NotRunning, "release", state_);
        case LifecycleState::Running:
            fail(DataCapturingErrorKind::IsRunning, "release", state_);
        case LifecycleState::Paused:
            fail(DataCapturingErrorKind::IsPaused, "release", state_);
    }
    return std::move(measurement_);
}

void MeasurementLifecycle::require_running(std::string_view operation) const {
    switch (state_) {
        case LifecycleState::Running:
            return;
        case LifecycleState::Idle:
            fail(DataCapturingErrorKind::NotRunning, operation, state_);
        case LifecycleState::Paused:
            fail(DataCapturingErrorKind::IsPaused, operation, state_);
        case LifecycleState::Stopped:
            fail(DataCapturingErrorKind::IsStopped, operation, state_);
    }
}

void MeasurementLifecycle::require_started(std::string_view operation) const {
    switch (state_) {
        case LifecycleState::Running:
        case LifecycleState::Paused:
            return;
        case LifecycleState::Idle:
            fail(DataCapturingErrorKind::NotRunning, operation, state_);
        case LifecycleState::Stopped:
            fail(DataCapturingErrorKind::IsStopped, operation, state_);
    }
}

void MeasurementLifecycle::close_current_track() {
    if (current_track_) {
        measurement_.append_track(std::move(*current_track_));
        current_track_.reset();
    }
}

void MeasurementLifecycle::transition(LifecycleState next, EventType event_type, TimePoint time) {
    const LifecycleState previous = state_;
    state_ = next;
    measurement_.append_event(Event{time, event_type, std::nullopt});
    if (auto logger = find_logger()) {
        logger->info("Measurement {} {} -> {}", measurement_.identifier(), to_string(previous), to_string(next));
    }
}

}  // namespace data_capturing
