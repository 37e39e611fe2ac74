// Ticket: 0003_logging

#include "shatter-sim/src/Utils/Logging.hpp"

#include <iostream>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace shatter_sim
{

std::shared_ptr<spdlog::logger> logger()
{
  static std::mutex creationMutex;
  std::scoped_lock lock{creationMutex};

  if (auto existing = spdlog::get(kLoggerName))
  {
    return existing;
  }

  try
  {
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_level(spdlog::level::info);
    return created;
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return spdlog::default_logger();
  }
}

void setLogLevel(const std::string& level)
{
  logger()->set_level(spdlog::level::from_str(level));
}

}  // namespace shatter_sim
