#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace data_capturing {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

/** @brief The shared logger, or null when initialize_logger() has not run yet. */
std::shared_ptr<spdlog::logger> find_logger() noexcept;

void set_log_level(const std::string& str_level);

}  // namespace data_capturing
