// === Track Cleaner ===========================================================
//
// Decides which geo locations belong to the cleaned track. Fixes taken while
// standing still, implausibly fast, or with poor accuracy are flagged invalid
// so statistics such as average speed ignore them.

#pragma once

#include <memory>

#include "data_capturing/track.hpp"
#include "data_capturing/types.hpp"

namespace data_capturing {

/** @brief Thresholds applied by DefaultTrackCleaner. */
struct TrackCleanerConfig final {
    double min_speed_mps{1.0};     /**< Fixes at or below this speed are rejected. */
    double max_speed_mps{100.0};   /**< Fixes at or above this speed are rejected. */
    double max_accuracy_m{20.0};   /**< Fixes with accuracy at or above this are rejected. */
};

/** @brief Validity filter applied to every captured location. */
class TrackCleaner {
  public:
    virtual ~TrackCleaner() = default;

    /** @brief Whether @p location belongs to the cleaned track. */
    [[nodiscard]] virtual bool is_valid(const GeoLocation& location) const = 0;

    /** @brief Copy of @p track with every location's validity recomputed. */
    [[nodiscard]] Track clean(const Track& track) const;
};

/** @brief Speed and accuracy threshold filter. */
class DefaultTrackCleaner final : public TrackCleaner {
  public:
    explicit DefaultTrackCleaner(TrackCleanerConfig config = {});

    [[nodiscard]] bool is_valid(const GeoLocation& location) const override;
    [[nodiscard]] const TrackCleanerConfig& config() const noexcept;

  private:
    TrackCleanerConfig config_;
};

using TrackCleanerPtr = std::shared_ptr<const TrackCleaner>;

}  // namespace data_capturing
