#include "data_capturing/distance_calculation.hpp"

#include <cmath>
#include <numbers>

namespace data_capturing {

namespace {

constexpr double k_mean_earth_radius_m{6'371'008.8};  /**< IUGG mean Earth radius. */

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

}  // namespace

double DefaultDistanceCalculationStrategy::calculate_distance(const GeoLocation& from, const GeoLocation& to) const {
    return calculate_distance(from.coordinate(), to.coordinate());
}

double DefaultDistanceCalculationStrategy::calculate_distance(const Coordinate& from, const Coordinate& to) const {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_mean_earth_radius_m * c;
}

}  // namespace data_capturing
