/**
 * @file logging.hpp
 * @brief Library logger.
 */
#pragma once
#include "freediag/common/common.hpp"

#include <spdlog/logger.h>

namespace freediag
{

/// Name under which the library logger is registered with spdlog.
inline constexpr const char* kLoggerName = "freediag";

/**
 * @brief Get the library logger.
 *
 * @details
 * Returns the spdlog logger registered as `kLoggerName`. If the application
 * has not registered one, a logger sharing the default logger's sinks is
 * created and registered on first use, so its level can be adjusted through
 * `spdlog::cfg` like any other named logger.
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace freediag
