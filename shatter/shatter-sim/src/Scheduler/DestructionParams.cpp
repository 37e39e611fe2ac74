// Ticket: 0011_destruction_scheduler

#include "shatter-sim/src/Scheduler/DestructionParams.hpp"

#include <cmath>
#include <format>

namespace shatter_sim
{

void DestructionParams::validate() const
{
  cuttingShape.validate();

  if (gridSize && (!std::isfinite(*gridSize) || *gridSize <= 0.0))
  {
    throw std::invalid_argument{
      std::format("gridSize must be positive, got {}", *gridSize)};
  }
  if (cleanupDelay && (!std::isfinite(*cleanupDelay) || *cleanupDelay < 0.0))
  {
    throw std::invalid_argument{
      std::format("cleanupDelay must be non-negative, got {}", *cleanupDelay)};
  }
}

JobCancelledError::JobCancelledError(JobId jobId)
  : std::runtime_error{std::format("Destruction job {} was cancelled", jobId)},
    jobId_{jobId}
{
}

}  // namespace shatter_sim
