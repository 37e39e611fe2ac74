// Ticket: 0011_destruction_scheduler

#ifndef SHATTER_SIM_SCHEDULER_DESTRUCTION_JOB_HPP
#define SHATTER_SIM_SCHEDULER_DESTRUCTION_JOB_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <optional>
#include <set>
#include <vector>

#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Scheduler/DestructionParams.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

enum class WorkPhase : uint8_t
{
  Classify = 0,     // One op per voxel
  Instantiate = 1,  // One op per block created (detached)
  Commit = 2        // Registry swap and scene attach in one step
};

/**
 * @brief Division of one object, carried across ticks
 */
struct ObjectWork
{
  SolidObjectId sourceId{kInvalidObjectId};
  DirtyGroupId groupId{kInvalidObjectId};
  SolidObject source;
  bool fromLiveBlock{false};  // false: source is a freshly captured original
  bool capturedHere{false};   // Group was created for this division
  SolidObjectId lockId{kInvalidObjectId};

  std::vector<Voxel> voxels;
  Eigen::Vector3i gridDimensions{Eigen::Vector3i::Ones()};
  size_t nextVoxel{0};

  std::vector<Voxel> survivors;
  std::vector<bool> mergeable;  // Aligned with survivors
  std::vector<Voxel> debris;
  std::vector<SolidObjectId> createdSurvivors;
  std::vector<SolidObjectId> createdDebris;

  WorkPhase phase{WorkPhase::Classify};
};

/**
 * @brief One destroy or imaginaryVoxels invocation
 *
 * Holds a snapshot of the settings at submission so a later settings swap
 * does not change a running job.
 */
struct DestructionJob
{
  JobId id{0};
  JobMode mode{JobMode::Incremental};
  DestructionParams params;
  Settings settings;
  uint64_t submissionOrder{0};
  uint64_t submittedTick{0};
  JobState state{JobState::Queued};

  bool gathered{false};
  std::deque<SolidObjectId> pendingObjects;
  std::vector<SolidObjectId> deferred;  // Capture conflicts, retried next tick
  std::set<SolidObjectId> seen;         // Gathered or created by this job
  std::optional<ObjectWork> current;

  size_t destroyedCount{0};
  std::set<DirtyGroupId> affectedGroups;
  bool warnedUnknownEffect{false};

  ImaginaryResult imaginary;
  std::optional<std::promise<ImaginaryResult>> promise;

  [[nodiscard]] double gridSize() const
  {
    return params.gridSize.value_or(settings.defaultGridSize);
  }

  [[nodiscard]] bool isInstant() const
  {
    return mode == JobMode::Imaginary;
  }

  [[nodiscard]] bool hasWork() const
  {
    return !gathered || current.has_value() || !pendingObjects.empty() ||
           !deferred.empty();
  }
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_SCHEDULER_DESTRUCTION_JOB_HPP
