// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of the environment-driven settings that
// tune logging, track cleaning and the ascent calculation.
//
// Responsibilities
// - Enforce defaults for every threshold and reject non-positive,
//   non-finite or unparsable values.
// - Surface diagnostics via the logging subsystem whenever user input cannot
//   be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Recognized variables (all optional):
//   DATA_CAPTURING_LOG_DIR, DATA_CAPTURING_LOG_LEVEL,
//   DATA_CAPTURING_MIN_SPEED_MPS, DATA_CAPTURING_MAX_SPEED_MPS,
//   DATA_CAPTURING_MAX_ACCURACY_M, DATA_CAPTURING_ASCEND_THRESHOLD_M,
//   DATA_CAPTURING_VERTICAL_ACCURACY_THRESHOLD_M

#include "data_capturing/configuration.hpp"

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "data_capturing/logging.hpp"

namespace data_capturing {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

double parse_double(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        std::size_t parsed_length{0};
        const double parsed_value = std::stod(raw_value, &parsed_length);
        if (raw_value[parsed_length] != '\0') {
            get_logger()->warn("{} has trailing characters; using fallback {}", variable_name, fallback);
            return fallback;
        }
        if (!std::isfinite(parsed_value) || parsed_value <= 0.0) {
            get_logger()->warn("{} must be positive; using fallback {}", variable_name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} from environment; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("DATA_CAPTURING_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string("DATA_CAPTURING_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.track_cleaner = load_track_cleaner();
    config.ascent = load_ascent();

    logger->info("Configuration loaded: min_speed_mps={} max_speed_mps={} max_accuracy_m={} ascend_threshold_m={}",
                 config.track_cleaner.min_speed_mps,
                 config.track_cleaner.max_speed_mps,
                 config.track_cleaner.max_accuracy_m,
                 config.ascent.ascend_threshold_m);

    return config;
}

TrackCleanerConfig ConfigurationLoader::load_track_cleaner() {
    const TrackCleanerConfig defaults{};
    TrackCleanerConfig config{};
    config.min_speed_mps = parse_double("DATA_CAPTURING_MIN_SPEED_MPS", defaults.min_speed_mps);
    config.max_speed_mps = parse_double("DATA_CAPTURING_MAX_SPEED_MPS", defaults.max_speed_mps);
    config.max_accuracy_m = parse_double("DATA_CAPTURING_MAX_ACCURACY_M", defaults.max_accuracy_m);

    if (!(config.max_speed_mps > config.min_speed_mps)) {
        get_logger()->warn("Speed bounds [{}, {}] are empty; restoring defaults [{}, {}]",
                           config.min_speed_mps,
                           config.max_speed_mps,
                           defaults.min_speed_mps,
                           defaults.max_speed_mps);
        config.min_speed_mps = defaults.min_speed_mps;
        config.max_speed_mps = defaults.max_speed_mps;
    }
    return config;
}

AscentConfig ConfigurationLoader::load_ascent() {
    const AscentConfig defaults{};
    AscentConfig config{};
    config.ascend_threshold_m = parse_double("DATA_CAPTURING_ASCEND_THRESHOLD_M", defaults.ascend_threshold_m);
    config.vertical_accuracy_threshold_m =
        parse_double("DATA_CAPTURING_VERTICAL_ACCURACY_THRESHOLD_M", defaults.vertical_accuracy_threshold_m);
    return config;
}

}  // namespace data_capturing
