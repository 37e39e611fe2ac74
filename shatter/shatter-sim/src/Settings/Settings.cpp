// Ticket: 0009_settings

#include "shatter-sim/src/Settings/Settings.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace shatter_sim
{

namespace
{

void requirePositive(double value, const char* field)
{
  if (!std::isfinite(value) || value <= 0.0)
  {
    throw std::invalid_argument{
      std::format("Settings.{} must be positive, got {}", field, value)};
  }
}

void requireNonNegative(double value, const char* field)
{
  if (!std::isfinite(value) || value < 0.0)
  {
    throw std::invalid_argument{
      std::format("Settings.{} must be non-negative, got {}", field, value)};
  }
}

void requireNonZero(uint32_t value, const char* field)
{
  if (value == 0)
  {
    throw std::invalid_argument{
      std::format("Settings.{} must be at least 1", field)};
  }
}

}  // namespace

void Settings::validate() const
{
  requirePositive(defaultGridSize, "defaultGridSize");
  requireNonNegative(defaultSmoothCleanupDelay, "defaultSmoothCleanupDelay");
  requireNonZero(gmWorkerCount, "gmWorkerCount");
  requireNonZero(gmTraversalsPerFrame, "gmTraversalsPerFrame");
  requireNonZero(gmPartCreationsPerFrame, "gmPartCreationsPerFrame");
  requireNonZero(maxDivisionsPerFrame, "maxDivisionsPerFrame");
  requireNonZero(maxOpsPerFrame, "maxOpsPerFrame");
  requireNonZero(puppetMaxCount, "puppetMaxCount");
  requirePositive(puppetReplicationFrequency, "puppetReplicationFrequency");
  requireNonNegative(puppetSleepVelocity, "puppetSleepVelocity");
  requireNonNegative(puppetAnchorTimeout, "puppetAnchorTimeout");
  requireNonNegative(clientTweenDistanceLimit, "clientTweenDistanceLimit");
}

}  // namespace shatter_sim
