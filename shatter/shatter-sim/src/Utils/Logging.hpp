// Ticket: 0003_logging

#ifndef SHATTER_SIM_LOGGING_HPP
#define SHATTER_SIM_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace shatter_sim
{

/// Name of the shared logger used by every shatter-sim component
inline constexpr const char* kLoggerName = "shatter";

/**
 * @brief Shared colour console logger for the destruction core
 *
 * Created on first use via spdlog::stdout_color_mt and registered in the
 * spdlog registry under kLoggerName, so host applications may replace the
 * sinks or level with the regular spdlog API. Falls back to the spdlog
 * default logger if the named logger cannot be created.
 *
 * @return Shared pointer to the logger (never null)
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the shared logger
 * @param level spdlog level name ("trace", "debug", "info", "warn", ...)
 */
void setLogLevel(const std::string& level);

}  // namespace shatter_sim

#endif  // SHATTER_SIM_LOGGING_HPP
