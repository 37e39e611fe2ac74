// Ticket: 0007_dirty_group_registry

#ifndef SHATTER_SIM_REGISTRY_DIRTY_GROUP_HPP
#define SHATTER_SIM_REGISTRY_DIRTY_GROUP_HPP

#include <cstdint>
#include <set>

#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

/**
 * @brief Provenance record of one original object
 *
 * Exists iff the original has been captured. The original is copied at
 * capture time and never modified afterwards; the scene keeps the object
 * itself detached until the group is restored.
 */
struct DirtyGroup
{
  DirtyGroupId id{kInvalidObjectId};
  SolidObject original;
  std::set<SolidObjectId> liveVoxels;  // Blocks currently standing in for it
  std::set<SolidObjectId> debris;      // Debris blocks spawned from it
};

enum class CaptureStatus : uint8_t
{
  Captured = 0,  // First capture: group created
  Existing = 1,  // Object already belongs to a group
  Conflict = 2,  // Object is locked by an in-flight operation
  Unknown = 3    // Object is not in the scene
};

struct CaptureResult
{
  CaptureStatus status{CaptureStatus::Unknown};
  DirtyGroupId groupId{kInvalidObjectId};
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REGISTRY_DIRTY_GROUP_HPP
