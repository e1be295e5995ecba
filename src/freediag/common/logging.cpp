/**
 * @file logging.cpp
 */
#include "freediag/common/logging.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace freediag
{

std::shared_ptr<spdlog::logger> get_logger()
{
    static std::mutex mutex;
    const std::lock_guard<std::mutex> lock{mutex};

    if (auto logger = spdlog::get(kLoggerName))
    {
        return logger;
    }
    const auto& default_sinks = spdlog::default_logger()->sinks();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, default_sinks.begin(), default_sinks.end());
    logger->set_level(spdlog::default_logger()->level());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace freediag
