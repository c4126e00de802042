#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "data_capturing/errors.hpp"
#include "data_capturing/measurement_lifecycle.hpp"

using namespace data_capturing;

namespace {
[[maybe_unused]] const auto logger = data_capturing::test::test_logger();

const TimePoint k_start{std::chrono::seconds(1'700'000'000)};

TimePoint at(int seconds) {
    return k_start + std::chrono::seconds(seconds);
}

GeoLocation fix_at(int seconds) {
    GeoLocation location{};
    location.latitude_deg = 51.05;
    location.longitude_deg = 13.73;
    location.accuracy_m = 4.0;
    location.speed_mps = 5.0;
    location.time = at(seconds);
    return location;
}

std::vector<EventType> event_types(const Measurement& measurement) {
    std::vector<EventType> types{};
    for (const Event& event : measurement.events()) {
        types.push_back(event.type);
    }
    return types;
}

template <typename Operation>
void require_rejected(Operation&& operation, DataCapturingErrorKind expected_kind) {
    try {
        operation();
        FAIL("Lifecycle operation was accepted");
    } catch (const DataCapturingError& error) {
        REQUIRE(error.kind() == expected_kind);
    }
}

MeasurementLifecycle lifecycle_in(LifecycleState state) {
    MeasurementLifecycle lifecycle{Measurement{5, k_start}};
    if (state == LifecycleState::Idle) {
        return lifecycle;
    }
    lifecycle.start(at(0));
    if (state == LifecycleState::Paused) {
        lifecycle.pause(at(1));
    } else if (state == LifecycleState::Stopped) {
        lifecycle.stop(at(1));
    }
    return lifecycle;
}
}  // namespace

TEST_CASE("Lifecycle records events and opens a track per running segment") {
    MeasurementLifecycle lifecycle{Measurement{1, k_start}};
    REQUIRE(lifecycle.state() == LifecycleState::Idle);
    REQUIRE_FALSE(lifecycle.current_track().has_value());

    lifecycle.start(at(0));
    REQUIRE(lifecycle.is_running());
    lifecycle.record_location(fix_at(1));
    lifecycle.record_location(fix_at(2));
    lifecycle.record_altitude(Altitude{0.5, 101.0, at(2)});
    REQUIRE(lifecycle.current_track()->locations().size() == 2);

    lifecycle.pause(at(3));
    REQUIRE(lifecycle.is_paused());
    REQUIRE_FALSE(lifecycle.current_track().has_value());
    REQUIRE(lifecycle.measurement().tracks().size() == 1);

    lifecycle.change_modality("CAR", at(4));
    lifecycle.resume(at(5));
    lifecycle.record_location(fix_at(6));
    lifecycle.stop(at(7));

    REQUIRE(lifecycle.state() == LifecycleState::Stopped);
    const Measurement measurement = std::move(lifecycle).release();
    REQUIRE(measurement.synchronizable());
    REQUIRE(measurement.tracks().size() == 2);
    REQUIRE(measurement.tracks()[0].altitudes().size() == 1);
    REQUIRE(measurement.tracks()[1].locations().size() == 1);
    REQUIRE(event_types(measurement) == std::vector<EventType>{
        EventType::LifecycleStart,
        EventType::LifecyclePause,
        EventType::ModalityTypeChange,
        EventType::LifecycleResume,
        EventType::LifecycleStop,
    });
    REQUIRE(measurement.events()[2].value == std::string{"CAR"});
    REQUIRE(measurement.events()[4].time == at(7));
}

TEST_CASE("Stopping a paused measurement keeps all completed tracks") {
    MeasurementLifecycle lifecycle = lifecycle_in(LifecycleState::Paused);
    lifecycle.stop(at(2));
    REQUIRE(lifecycle.measurement().tracks().size() == 1);
    REQUIRE(lifecycle.measurement().events().back().type == EventType::LifecycleStop);
}

TEST_CASE("Lifecycle rejects illegal start") {
    MeasurementLifecycle running = lifecycle_in(LifecycleState::Running);
    require_rejected([&] { running.start(at(5)); }, DataCapturingErrorKind::IsRunning);
    MeasurementLifecycle paused = lifecycle_in(LifecycleState::Paused);
    require_rejected([&] { paused.start(at(5)); }, DataCapturingErrorKind::IsPaused);
    MeasurementLifecycle stopped = lifecycle_in(LifecycleState::Stopped);
    require_rejected([&] { stopped.start(at(5)); }, DataCapturingErrorKind::IsStopped);
}

TEST_CASE("Lifecycle rejects illegal pause") {
    MeasurementLifecycle idle = lifecycle_in(LifecycleState::Idle);
    require_rejected([&] { idle.pause(at(5)); }, DataCapturingErrorKind::NotRunning);
    MeasurementLifecycle paused = lifecycle_in(LifecycleState::Paused);
    require_rejected([&] { paused.pause(at(5)); }, DataCapturingErrorKind::IsPaused);
    MeasurementLifecycle stopped = lifecycle_in(LifecycleState::Stopped);
    require_rejected([&] { stopped.pause(at(5)); }, DataCapturingErrorKind::IsStopped);
}

TEST_CASE("Lifecycle rejects illegal resume") {
    MeasurementLifecycle idle = lifecycle_in(LifecycleState::Idle);
    require_rejected([&] { idle.resume(at(5)); }, DataCapturingErrorKind::NotPaused);
    MeasurementLifecycle running = lifecycle_in(LifecycleState::Running);
    require_rejected([&] { running.resume(at(5)); }, DataCapturingErrorKind::IsRunning);
    MeasurementLifecycle stopped = lifecycle_in(LifecycleState::Stopped);
    require_rejected([&] { stopped.resume(at(5)); }, DataCapturingErrorKind::IsStopped);
}

TEST_CASE("Lifecycle rejects illegal stop and modality change") {
    MeasurementLifecycle idle = lifecycle_in(LifecycleState::Idle);
    require_rejected([&] { idle.stop(at(5)); }, DataCapturingErrorKind::NotRunning);
    require_rejected([&] { idle.change_modality("WALKING", at(5)); }, DataCapturingErrorKind::NotRunning);
    MeasurementLifecycle stopped = lifecycle_in(LifecycleState::Stopped);
    require_rejected([&] { stopped.stop(at(5)); }, DataCapturingErrorKind::IsStopped);
    require_rejected([&] { stopped.change_modality("WALKING", at(5)); }, DataCapturingErrorKind::IsStopped);
}

TEST_CASE("Lifecycle only records data while running") {
    MeasurementLifecycle idle = lifecycle_in(LifecycleState::Idle);
    require_rejected([&] { idle.record_location(fix_at(5)); }, DataCapturingErrorKind::NotRunning);
    MeasurementLifecycle paused = lifecycle_in(LifecycleState::Paused);
    require_rejected([&] { paused.record_location(fix_at(5)); }, DataCapturingErrorKind::IsPaused);
    require_rejected([&] { paused.record_altitude(Altitude{1.0, 0.0, at(5)}); }, DataCapturingErrorKind::IsPaused);
    MeasurementLifecycle stopped = lifecycle_in(LifecycleState::Stopped);
    require_rejected([&] { stopped.record_altitude(Altitude{1.0, 0.0, at(5)}); }, DataCapturingErrorKind::IsStopped);
}

TEST_CASE("Lifecycle only releases stopped measurements") {
    require_rejected([] { (void)lifecycle_in(LifecycleState::Idle).release(); }, DataCapturingErrorKind::NotRunning);
    require_rejected([] { (void)lifecycle_in(LifecycleState::Running).release(); }, DataCapturingErrorKind::IsRunning);
    require_rejected([] { (void)lifecycle_in(LifecycleState::Paused).release(); }, DataCapturingErrorKind::IsPaused);
}

TEST_CASE("Rejected transitions leave state and events untouched") {
    MeasurementLifecycle lifecycle = lifecycle_in(LifecycleState::Paused);
    const auto event_count = lifecycle.measurement().events().size();
    REQUIRE_THROWS_AS(lifecycle.pause(at(5)), DataCapturingError);
    REQUIRE(lifecycle.state() == LifecycleState::Paused);
    REQUIRE(lifecycle.measurement().events().size() == event_count);
}
