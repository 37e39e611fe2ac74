// Ticket: 0007_dirty_group_registry

#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"
#include "shatter-sim/src/Utils/Logging.hpp"

namespace shatter_sim
{

CaptureResult DirtyGroupRegistry::capture(SolidObjectId objectId,
                                          SceneInterface& scene,
                                          bool detachOriginal)
{
  if (auto it = blockToGroup_.find(objectId); it != blockToGroup_.end())
  {
    const auto status =
      isLocked(objectId) ? CaptureStatus::Conflict : CaptureStatus::Existing;
    return CaptureResult{status, it->second};
  }

  if (groups_.contains(objectId))
  {
    const auto status =
      isLocked(objectId) ? CaptureStatus::Conflict : CaptureStatus::Existing;
    return CaptureResult{status, objectId};
  }

  auto object = scene.find(objectId);
  if (!object)
  {
    return CaptureResult{CaptureStatus::Unknown, kInvalidObjectId};
  }

  DirtyGroup group{};
  group.id = objectId;
  group.original = object->get();
  if (detachOriginal)
  {
    scene.detach(objectId);
  }
  groups_.emplace(objectId, std::move(group));
  return CaptureResult{CaptureStatus::Captured, objectId};
}

bool DirtyGroupRegistry::addVoxel(DirtyGroupId groupId, SolidObjectId blockId)
{
  auto it = groups_.find(groupId);
  if (it == groups_.end())
  {
    return false;
  }
  it->second.liveVoxels.insert(blockId);
  blockToGroup_[blockId] = groupId;
  return true;
}

bool DirtyGroupRegistry::removeVoxel(DirtyGroupId groupId,
                                     SolidObjectId blockId)
{
  auto it = groups_.find(groupId);
  if (it == groups_.end() || it->second.liveVoxels.erase(blockId) == 0)
  {
    return false;
  }
  blockToGroup_.erase(blockId);
  locked_.erase(blockId);
  return true;
}

bool DirtyGroupRegistry::addDebris(DirtyGroupId groupId, SolidObjectId debrisId)
{
  auto it = groups_.find(groupId);
  if (it == groups_.end())
  {
    return false;
  }
  it->second.debris.insert(debrisId);
  debrisToGroup_[debrisId] = groupId;
  return true;
}

bool DirtyGroupRegistry::removeDebris(SolidObjectId debrisId)
{
  auto it = debrisToGroup_.find(debrisId);
  if (it == debrisToGroup_.end())
  {
    return false;
  }
  if (auto group = groups_.find(it->second); group != groups_.end())
  {
    group->second.debris.erase(debrisId);
  }
  debrisToGroup_.erase(it);
  return true;
}

void DirtyGroupRegistry::replaceVoxels(DirtyGroupId groupId,
                                       const std::vector<SolidObjectId>& removed,
                                       const std::vector<SolidObjectId>& added)
{
  auto it = groups_.find(groupId);
  if (it == groups_.end())
  {
    throw std::invalid_argument{
      std::format("replaceVoxels: unknown dirty group {}", groupId)};
  }
  DirtyGroup& group = it->second;

  // Validate everything before touching any state
  for (const auto id : removed)
  {
    if (!group.liveVoxels.contains(id))
    {
      throw std::invalid_argument{std::format(
        "replaceVoxels: block {} is not live in group {}", id, groupId)};
    }
  }
  for (const auto id : added)
  {
    if (blockToGroup_.contains(id) &&
        std::find(removed.begin(), removed.end(), id) == removed.end())
    {
      throw std::invalid_argument{std::format(
        "replaceVoxels: block {} already belongs to group {}",
        id,
        blockToGroup_.at(id))};
    }
  }

  for (const auto id : removed)
  {
    group.liveVoxels.erase(id);
    blockToGroup_.erase(id);
    locked_.erase(id);
  }
  for (const auto id : added)
  {
    group.liveVoxels.insert(id);
    blockToGroup_[id] = groupId;
  }
}

void DirtyGroupRegistry::lockVoxels(const std::vector<SolidObjectId>& ids)
{
  locked_.insert(ids.begin(), ids.end());
}

void DirtyGroupRegistry::unlockVoxels(const std::vector<SolidObjectId>& ids)
{
  for (const auto id : ids)
  {
    locked_.erase(id);
  }
}

bool DirtyGroupRegistry::isLocked(SolidObjectId id) const
{
  return locked_.contains(id);
}

std::optional<DirtyGroupId> DirtyGroupRegistry::groupOfBlock(
  SolidObjectId blockId) const
{
  auto it = blockToGroup_.find(blockId);
  if (it == blockToGroup_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<DirtyGroupId> DirtyGroupRegistry::groupOfDebris(
  SolidObjectId debrisId) const
{
  auto it = debrisToGroup_.find(debrisId);
  if (it == debrisToGroup_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

bool DirtyGroupRegistry::hasGroup(DirtyGroupId groupId) const
{
  return groups_.contains(groupId);
}

std::optional<std::reference_wrapper<const DirtyGroup>>
DirtyGroupRegistry::getGroup(DirtyGroupId groupId) const
{
  auto it = groups_.find(groupId);
  if (it == groups_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second);
}

std::optional<std::reference_wrapper<const SolidObject>>
DirtyGroupRegistry::getOriginalPart(DirtyGroupId groupId) const
{
  auto it = groups_.find(groupId);
  if (it == groups_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second.original);
}

bool DirtyGroupRegistry::restoreIfEmpty(DirtyGroupId groupId,
                                        SceneInterface& scene)
{
  auto it = groups_.find(groupId);
  if (it == groups_.end() || !it->second.liveVoxels.empty() ||
      !it->second.debris.empty())
  {
    return false;
  }
  restoreOriginal(it->second, scene);
  locked_.erase(groupId);
  groups_.erase(it);
  return true;
}

size_t DirtyGroupRegistry::resetArea(const OrientedShape& region,
                                     SceneInterface& scene)
{
  auto overlaps = [&region](const SolidObject& object)
  {
    return GeometryKernel::shapeIntersectsBox(
      region, object.shape.frame, object.shape.extent);
  };

  size_t restored = 0;
  for (const auto groupId : groupIds())
  {
    DirtyGroup& group = groups_.at(groupId);

    // Blocks the scene no longer knows about are dropped as well
    std::vector<SolidObjectId> hitVoxels;
    for (const auto blockId : group.liveVoxels)
    {
      auto block = scene.find(blockId);
      if (!block || overlaps(block->get()))
      {
        hitVoxels.push_back(blockId);
      }
    }

    if (hitVoxels.empty() && !overlaps(group.original))
    {
      continue;
    }

    for (const auto blockId : hitVoxels)
    {
      scene.removeObject(blockId);
      group.liveVoxels.erase(blockId);
      blockToGroup_.erase(blockId);
      locked_.erase(blockId);
    }

    std::vector<SolidObjectId> hitDebris;
    for (const auto debrisId : group.debris)
    {
      auto debris = scene.find(debrisId);
      if (!debris || overlaps(debris->get()))
      {
        hitDebris.push_back(debrisId);
      }
    }
    for (const auto debrisId : hitDebris)
    {
      scene.removeObject(debrisId);
      group.debris.erase(debrisId);
      debrisToGroup_.erase(debrisId);
    }

    if (!group.liveVoxels.empty())
    {
      continue;
    }

    // Debris outside the region stays in the scene as plain objects
    for (const auto debrisId : group.debris)
    {
      debrisToGroup_.erase(debrisId);
    }
    restoreOriginal(group, scene);
    locked_.erase(groupId);
    groups_.erase(groupId);
    ++restored;
  }

  if (restored > 0)
  {
    logger()->info("resetArea restored {} dirty group(s)", restored);
  }
  return restored;
}

void DirtyGroupRegistry::reset(bool revertOwnership, SceneInterface& scene)
{
  const size_t groupTotal = groups_.size();
  for (const auto groupId : groupIds())
  {
    const DirtyGroup& group = groups_.at(groupId);
    for (const auto blockId : group.liveVoxels)
    {
      scene.removeObject(blockId);
    }
    for (const auto debrisId : group.debris)
    {
      scene.removeObject(debrisId);
    }
    restoreOriginal(group, scene);
  }

  groups_.clear();
  blockToGroup_.clear();
  debrisToGroup_.clear();
  locked_.clear();
  if (revertOwnership)
  {
    ownership_.clear();
  }

  if (groupTotal > 0)
  {
    logger()->info("reset restored {} dirty group(s)", groupTotal);
  }
}

void DirtyGroupRegistry::assignOwnership(DirtyGroupId groupId,
                                         ObserverId observerId)
{
  ownership_[groupId] = observerId;
}

std::optional<ObserverId> DirtyGroupRegistry::getOwnership(
  DirtyGroupId groupId) const
{
  auto it = ownership_.find(groupId);
  if (it == ownership_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DirtyGroupId> DirtyGroupRegistry::groupIds() const
{
  std::vector<DirtyGroupId> ids;
  ids.reserve(groups_.size());
  for (const auto& [id, group] : groups_)
  {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void DirtyGroupRegistry::restoreOriginal(const DirtyGroup& group,
                                         SceneInterface& scene)
{
  if (scene.attach(group.id))
  {
    return;
  }
  // The host removed the detached original; rebuild it from the copy
  const SolidObjectId replacement = scene.createObject(group.original, true);
  logger()->debug("Dirty group {} original was missing, recreated as {}",
                  group.id,
                  replacement);
}

}  // namespace shatter_sim
