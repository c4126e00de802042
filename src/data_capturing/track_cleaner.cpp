#include "data_capturing/track_cleaner.hpp"

#include <cstddef>
#include <stdexcept>

#include "data_capturing/logging.hpp"

namespace data_capturing {

Track TrackCleaner::clean(const Track& track) const {
    Track cleaned{};
    std::size_t rejected_count{0};
    for (GeoLocation location : track.locations()) {
        location.is_valid = is_valid(location);
        if (!location.is_valid) {
            ++rejected_count;
        }
        cleaned.append_location(location);
    }
    for (const Altitude& altitude : track.altitudes()) {
        cleaned.append_altitude(altitude);
    }

    // Library-level callers may clean tracks without ever configuring logging.
    if (auto logger = find_logger()) {
        logger->debug("Cleaned track: {} of {} locations rejected", rejected_count, track.locations().size());
    }
    return cleaned;
}

DefaultTrackCleaner::DefaultTrackCleaner(TrackCleanerConfig config)
    : config_(config) {
    if (!(config_.max_speed_mps > config_.min_speed_mps)) {
        throw std::invalid_argument("DefaultTrackCleaner requires max_speed_mps above min_speed_mps");
    }
    if (!(config_.max_accuracy_m > 0.0)) {
        throw std::invalid_argument("DefaultTrackCleaner requires a positive max_accuracy_m");
    }
}

bool DefaultTrackCleaner::is_valid(const GeoLocation& location) const {
    return location.speed_mps > config_.min_speed_mps
        && location.speed_mps < config_.max_speed_mps
        && location.accuracy_m < config_.max_accuracy_m;
}

const TrackCleanerConfig& DefaultTrackCleaner::config() const noexcept {
    return config_;
}

}  // namespace data_capturing
