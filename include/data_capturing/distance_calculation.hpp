// === Distance Calculation ====================================================
//
// Strategy interface for measuring the distance between two positions in
// metres. The default strategy uses the haversine great-circle formula, which
// stays well within one percent of ellipsoidal distances at city scale.

#pragma once

#include <memory>

#include "data_capturing/types.hpp"

namespace data_capturing {

/** @brief Computes the distance in metres between two positions. */
class DistanceCalculationStrategy {
  public:
    virtual ~DistanceCalculationStrategy() = default;

    /** @brief Distance from @p from to @p to, ignoring altitude. */
    [[nodiscard]] virtual double calculate_distance(const GeoLocation& from, const GeoLocation& to) const = 0;
    /** @brief Distance between two latitude/longitude pairs. */
    [[nodiscard]] virtual double calculate_distance(const Coordinate& from, const Coordinate& to) const = 0;
};

/** @brief Great-circle distance on a spherical Earth. */
class DefaultDistanceCalculationStrategy final : public DistanceCalculationStrategy {
  public:
    [[nodiscard]] double calculate_distance(const GeoLocation& from, const GeoLocation& to) const override;
    [[nodiscard]] double calculate_distance(const Coordinate& from, const Coordinate& to) const override;
};

using DistanceCalculationStrategyPtr = std::shared_ptr<const DistanceCalculationStrategy>;

}  // namespace data_capturing
