// Ticket: 0011_destruction_scheduler

#ifndef SHATTER_SIM_SCHEDULER_DESTRUCTION_PARAMS_HPP
#define SHATTER_SIM_SCHEDULER_DESTRUCTION_PARAMS_HPP

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "shatter-sim/src/Effects/EffectRegistry.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

/// Called once when an incremental job completes
using DestructCompletedCallback =
  std::function<void(size_t destroyedCount,
                     const std::set<DirtyGroupId>& affectedGroups)>;

/**
 * @brief Everything one destroy / imaginaryVoxels request carries
 */
struct DestructionParams
{
  OrientedShape cuttingShape;
  std::vector<std::string> filterTagged;  // Empty: every object qualifies
  std::optional<double> cleanupDelay;     // Debris lifetime [s]
  std::string onVoxelDestruct{kDefaultEffectName};
  std::optional<double> gridSize;         // Falls back to Settings
  bool skipEncapsulatedVoxels{false};
  bool skipFloors{false};
  bool skipWalls{false};
  DestructCompletedCallback onDestructCompleted;
  std::any userData;
  std::vector<ObserverId> excludePlayersReplication;
  std::string id;  // Caller-chosen label, logged only

  /**
   * @throws std::invalid_argument for a degenerate cutting shape, a
   *         non-positive grid size or a negative cleanup delay
   */
  void validate() const;
};

enum class JobMode : uint8_t
{
  Incremental = 0,  // Budgeted across ticks, effects applied
  Imaginary = 1     // Finished on the next tick, destroyed voxels returned
};

enum class JobState : uint8_t
{
  Queued = 0,
  Processing = 1,
  Completed = 2,
  Cancelled = 3
};

[[nodiscard]] constexpr std::string_view toString(JobState state)
{
  switch (state)
  {
    case JobState::Queued:
      return "Queued";
    case JobState::Processing:
      return "Processing";
    case JobState::Completed:
      return "Completed";
    case JobState::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

/**
 * @brief Output of an imaginary job
 *
 * voxels are the destroyed voxels, never instantiated. existingDebris lists
 * debris blocks the cutting shape touched; they are left untouched.
 */
struct ImaginaryResult
{
  std::vector<Voxel> voxels;
  std::vector<SolidObjectId> existingDebris;
};

/**
 * @brief Stored in the future of an imaginary job cancelled before it ran
 */
class JobCancelledError : public std::runtime_error
{
public:
  explicit JobCancelledError(JobId jobId);

  [[nodiscard]] JobId jobId() const
  {
    return jobId_;
  }

private:
  JobId jobId_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_SCHEDULER_DESTRUCTION_PARAMS_HPP
