// === Configuration ===========================================================
//
// Exposes the strongly-typed settings consumed across the library: logging,
// track cleaning thresholds and ascent noise filters. `ConfigurationLoader`
// translates environment variables into these structures so downstream modules
// never touch `std::getenv` directly.

#pragma once

#include <string>

#include "data_capturing/measurement.hpp"
#include "data_capturing/track_cleaner.hpp"

namespace data_capturing {

/**
 * @brief Immutable bundle of runtime knobs for the capturing library.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};          /**< Destination directory for log files. */
    std::string log_level{};              /**< spdlog level name applied after startup. */
    TrackCleanerConfig track_cleaner{};   /**< Thresholds for the default track cleaner. */
    AscentConfig ascent{};                /**< Noise filters for accumulated height. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static TrackCleanerConfig load_track_cleaner();
    static AscentConfig load_ascent();
};

}  // namespace data_capturing
