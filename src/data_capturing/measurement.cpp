#include "data_capturing/measurement.hpp"

#include <cmath>
#include <optional>
#include <utility>

namespace data_capturing {

namespace {

double altimeter_ascent(const std::vector<Altitude>& altitudes, double threshold_m) {
    double sum{0.0};
    std::optional<double> previous_altitude{};
    for (const Altitude& altitude : altitudes) {
        if (previous_altitude) {
            const double change = altitude.relative_altitude_m - *previous_altitude;
            if (change > threshold_m) {
                sum += change;
            }
        }
        previous_altitude = altitude.relative_altitude_m;
    }
    return sum;
}

double location_ascent(const std::vector<GeoLocation>& locations, const AscentConfig& config) {
    if (locations.empty()) {
        return 0.0;
    }

    double sum{0.0};
    double previous_altitude = locations.front().altitude_m;
    for (std::size_t index = 1; index < locations.size(); ++index) {
        const GeoLocation& location = locations[index];
        if (location.vertical_accuracy_m > config.vertical_accuracy_threshold_m) {
            continue;
        }
        const double change = location.altitude_m - previous_altitude;
        // The reference only moves once the change exceeds the noise floor.
        if (std::fabs(change) > config.ascend_threshold_m) {
            if (change > 0.0) {
                sum += change;
            }
            previous_altitude = location.altitude_m;
        }
    }
    return sum;
}

}  // namespace

Measurement::Measurement(std::uint64_t identifier, TimePoint time)
    : identifier_(identifier),
      time_(time) {}

std::uint64_t Measurement::identifier() const noexcept {
    return identifier_;
}

TimePoint Measurement::time() const noexcept {
    return time_;
}

bool Measurement::synchronizable() const noexcept {
    return synchronizable_;
}

void Measurement::set_synchronizable(bool synchronizable) noexcept {
    synchronizable_ = synchronizable;
}

bool Measurement::synchronized() const noexcept {
    return synchronized_;
}

void Measurement::set_synchronized(bool synchronized) noexcept {
    synchronized_ = synchronized;
}

const std::vector<Track>& Measurement::tracks() const noexcept {
    return list_tracks_;
}

const std::vector<Event>& Measurement::events() const noexcept {
    return list_events_;
}

void Measurement::append_track(Track track) {
    list_tracks_.push_back(std::move(track));
}

void Measurement::append_event(Event event) {
    list_events_.push_back(std::move(event));
}

double Measurement::average_speed() const {
    double sum{0.0};
    std::size_t counter{0};
    for (const Track& track : list_tracks_) {
        for (const GeoLocation& location : track.locations()) {
            if (location.is_valid) {
                sum += location.speed_mps;
                ++counter;
            }
        }
    }
    return counter == 0 ? 0.0 : sum / static_cast<double>(counter);
}

Duration Measurement::total_duration() const {
    Duration total{0.0};
    for (const Track& track : list_tracks_) {
        const auto& locations = track.locations();
        if (locations.empty()) {
            continue;
        }
        total += std::chrono::duration_cast<Duration>(locations.back().time - locations.front().time);
    }
    return total;
}

double Measurement::summed_height(const AscentConfig& config) const {
    double sum{0.0};
    for (const Track& track : list_tracks_) {
        if (track.altitudes().empty()) {
            sum += location_ascent(track.locations(), config);
        } else {
            sum += altimeter_ascent(track.altitudes(), config.altimeter_threshold_m);
        }
    }
    return sum;
}

double Measurement::track_length(const DistanceCalculationStrategy& strategy) const {
    double length{0.0};
    for (const Track& track : list_tracks_) {
        const auto& locations = track.locations();
        for (std::size_t index = 1; index < locations.size(); ++index) {
            length += strategy.calculate_distance(locations[index - 1], locations[index]);
        }
    }
    return length;
}

}  // namespace data_capturing
