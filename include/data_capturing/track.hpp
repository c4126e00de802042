// === Track ===================================================================
//
// A single continuously captured stretch of a measurement. Pausing and
// resuming a measurement starts a new track, so every track holds an unbroken
// sequence of geo locations plus the altimeter samples recorded alongside.

#pragma once

#include <vector>

#include "data_capturing/types.hpp"

namespace data_capturing {

/** @brief Ordered geo locations and altitudes captured without interruption. */
class Track final {
  public:
    Track() = default;

    /**
     * @brief Append a location to the end of the track.
     *
     * @throws InconsistentDataError if @p location is not strictly newer than
     *         the current last location.
     */
    void append_location(const GeoLocation& location);
    /** @brief Append an altimeter sample to the end of the track. */
    void append_altitude(const Altitude& altitude);

    [[nodiscard]] const std::vector<GeoLocation>& locations() const noexcept;
    [[nodiscard]] const std::vector<Altitude>& altitudes() const noexcept;

  private:
    std::vector<GeoLocation> list_locations_;
    std::vector<Altitude> list_altitudes_;
};

}  // namespace data_capturing
