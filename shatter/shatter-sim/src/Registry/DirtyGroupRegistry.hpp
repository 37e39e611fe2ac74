// Ticket: 0007_dirty_group_registry

#ifndef SHATTER_SIM_REGISTRY_DIRTY_GROUP_REGISTRY_HPP
#define SHATTER_SIM_REGISTRY_DIRTY_GROUP_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "shatter-sim/src/Environment/SceneInterface.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Registry/DirtyGroup.hpp"

namespace shatter_sim
{

using ObserverId = uint32_t;

/**
 * @brief Single source of truth for object provenance
 *
 * Owns every DirtyGroup and the copies of the untouched originals. All
 * changes to a group's live voxel and debris sets go through this class.
 * Owned by DestructionWorld, so independent worlds keep independent
 * registries.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0007_dirty_group_registry
 */
class DirtyGroupRegistry
{
public:
  DirtyGroupRegistry() = default;

  /**
   * @brief Resolve the group an object belongs to, creating it if needed
   *
   * - Unknown object: Unknown
   * - Locked live block or locked original: Conflict
   * - Live block: Existing with its owning group
   * - Original of an existing group: Existing
   * - Otherwise the object is copied and a new group (id = object id) is
   *   created: Captured. The original is detached from the scene unless
   *   detachOriginal is false, in which case the caller detaches it once its
   *   replacement blocks are attached.
   *
   * Idempotent: capturing the same object again never creates a second
   * group.
   */
  CaptureResult capture(SolidObjectId objectId,
                        SceneInterface& scene,
                        bool detachOriginal = true);

  /// @return false if the group is unknown
  bool addVoxel(DirtyGroupId groupId, SolidObjectId blockId);

  /// @return false if the block is not a live voxel of the group
  bool removeVoxel(DirtyGroupId groupId, SolidObjectId blockId);

  /// @return false if the group is unknown
  bool addDebris(DirtyGroupId groupId, SolidObjectId debrisId);

  /// Forget a debris block of whichever group spawned it
  bool removeDebris(SolidObjectId debrisId);

  /**
   * @brief Atomically swap live voxels of a group
   *
   * Either every block of removed is dropped and every block of added is
   * inserted, or nothing changes.
   *
   * @throws std::invalid_argument if the group is unknown, a removed block
   *         is not live in the group, or an added block already belongs to a
   *         group
   */
  void replaceVoxels(DirtyGroupId groupId,
                     const std::vector<SolidObjectId>& removed,
                     const std::vector<SolidObjectId>& added);

  void lockVoxels(const std::vector<SolidObjectId>& ids);

  void unlockVoxels(const std::vector<SolidObjectId>& ids);

  [[nodiscard]] bool isLocked(SolidObjectId id) const;

  [[nodiscard]] std::optional<DirtyGroupId> groupOfBlock(
    SolidObjectId blockId) const;

  [[nodiscard]] std::optional<DirtyGroupId> groupOfDebris(
    SolidObjectId debrisId) const;

  [[nodiscard]] bool hasGroup(DirtyGroupId groupId) const;

  [[nodiscard]] std::optional<std::reference_wrapper<const DirtyGroup>>
  getGroup(DirtyGroupId groupId) const;

  /**
   * @brief Untouched copy of the object a group was created from
   */
  [[nodiscard]] std::optional<std::reference_wrapper<const SolidObject>>
  getOriginalPart(DirtyGroupId groupId) const;

  /**
   * @brief Restore a group that has nothing standing in for it
   *
   * If the group has no live voxels and no debris its original is
   * reattached and the group erased.
   *
   * @return true if the group was restored
   */
  bool restoreIfEmpty(DirtyGroupId groupId, SceneInterface& scene);

  /**
   * @brief Partially undo destruction inside a region
   *
   * Every group whose original or live voxels overlap region loses the live
   * voxels and debris that overlap it. Groups left with no live voxels are
   * restored: their original is reattached and the group erased. Groups
   * with live voxels elsewhere stay split. Never throws.
   *
   * @return Number of groups restored
   */
  size_t resetArea(const OrientedShape& region, SceneInterface& scene);

  /**
   * @brief Restore every group and clear the registry
   *
   * Removes every live voxel and debris block from the scene, reattaches
   * every original and erases all groups and locks. Ownership assignments
   * are cleared only when revertOwnership is true. Idempotent.
   */
  void reset(bool revertOwnership, SceneInterface& scene);

  void assignOwnership(DirtyGroupId groupId, ObserverId observerId);

  [[nodiscard]] std::optional<ObserverId> getOwnership(
    DirtyGroupId groupId) const;

  [[nodiscard]] size_t groupCount() const
  {
    return groups_.size();
  }

  [[nodiscard]] size_t liveVoxelCount() const
  {
    return blockToGroup_.size();
  }

  [[nodiscard]] size_t debrisCount() const
  {
    return debrisToGroup_.size();
  }

  [[nodiscard]] size_t lockedCount() const
  {
    return locked_.size();
  }

  /// Group ids in ascending order
  [[nodiscard]] std::vector<DirtyGroupId> groupIds() const;

  // Rule of Five
  DirtyGroupRegistry(const DirtyGroupRegistry&) = delete;
  DirtyGroupRegistry& operator=(const DirtyGroupRegistry&) = delete;
  DirtyGroupRegistry(DirtyGroupRegistry&&) noexcept = default;
  DirtyGroupRegistry& operator=(DirtyGroupRegistry&&) noexcept = default;
  ~DirtyGroupRegistry() = default;

private:
  void restoreOriginal(const DirtyGroup& group, SceneInterface& scene);

  std::unordered_map<DirtyGroupId, DirtyGroup> groups_;
  std::unordered_map<SolidObjectId, DirtyGroupId> blockToGroup_;
  std::unordered_map<SolidObjectId, DirtyGroupId> debrisToGroup_;
  std::unordered_set<SolidObjectId> locked_;
  std::unordered_map<DirtyGroupId, ObserverId> ownership_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REGISTRY_DIRTY_GROUP_REGISTRY_HPP
