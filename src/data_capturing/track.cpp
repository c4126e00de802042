#include "data_capturing/track.hpp"

#include <string>

#include "data_capturing/errors.hpp"

namespace data_capturing {

void Track::append_location(const GeoLocation& location) {
    if (!list_locations_.empty() && location.time <= list_locations_.back().time) {
        throw InconsistentDataError(
            "Location order violated: location " + std::to_string(list_locations_.size())
            + " is not newer than its predecessor"
        );
    }
    list_locations_.push_back(location);
}

void Track::append_altitude(const Altitude& altitude) {
    list_altitudes_.push_back(altitude);
}

const std::vector<GeoLocation>& Track::locations() const noexcept {
    return list_locations_;
}

const std::vector<Altitude>& Track::altitudes() const noexcept {
    return list_altitudes_;
}

}  // namespace data_capturing
