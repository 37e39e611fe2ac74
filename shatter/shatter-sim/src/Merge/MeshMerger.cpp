// Ticket: 0010_greedy_mesh_merger

#include "shatter-sim/src/Merge/MeshMerger.hpp"

#include "shatter-sim/src/Utils/Logging.hpp"

namespace shatter_sim
{

MeshMerger::MeshMerger(SceneInterface& scene, DirtyGroupRegistry& registry)
  : scene_{scene}, registry_{registry}
{
}

void MeshMerger::submit(MeshRegion region)
{
  registry_.lockVoxels(region.blockIds());
  queue_.push_back(std::move(region));
}

MergeStats MeshMerger::tick(const Settings& settings)
{
  MergeStats stats{};

  // Workers beyond gmWorkerCount finish their region but take no new one
  if (workers_.size() < settings.gmWorkerCount)
  {
    workers_.resize(settings.gmWorkerCount);
  }

  for (size_t i = 0; i < workers_.size(); ++i)
  {
    Worker& worker = workers_[i];
    if (!worker.region && i < settings.gmWorkerCount && !queue_.empty())
    {
      worker.region.emplace(std::move(queue_.front()));
      queue_.pop_front();
      worker.nextBox = 0;
      worker.staged.clear();
    }
    if (worker.region)
    {
      advance(worker, settings, stats);
    }
  }

  while (workers_.size() > settings.gmWorkerCount && !workers_.back().region)
  {
    workers_.pop_back();
  }
  return stats;
}

void MeshMerger::advance(Worker& worker,
                         const Settings& settings,
                         MergeStats& stats)
{
  MeshRegion& region = *worker.region;

  for (uint32_t steps = 0;
       steps < settings.gmTraversalsPerFrame && !region.isTraversalComplete();
       ++steps)
  {
    region.step();
    ++stats.traversalSteps;
  }
  if (!region.isTraversalComplete())
  {
    return;
  }

  const auto& boxes = region.boxes();
  uint32_t created = 0;
  while (worker.nextBox < boxes.size() &&
         created < settings.gmPartCreationsPerFrame)
  {
    const MergedBox& box = boxes[worker.nextBox++];
    if (box.constituents.size() < 2)
    {
      worker.staged.push_back(kInvalidObjectId);
      continue;
    }

    SolidObject spec = region.blockTemplate();
    spec.id = kInvalidObjectId;
    spec.shape = OrientedShape{ShapeKind::Box, box.frame, box.extent};
    spec.shade = box.shade;
    worker.staged.push_back(scene_.createObject(spec, false));
    ++created;
    ++stats.partsCreated;
  }

  if (worker.nextBox < boxes.size())
  {
    return;
  }

  if (constituentsIntact(region))
  {
    commit(worker);
    ++stats.regionsCommitted;
  }
  else
  {
    logger()->warn("Merge of dirty group {} aborted: a constituent changed",
                   region.groupId());
    abort(worker);
    ++stats.regionsAborted;
  }
}

bool MeshMerger::constituentsIntact(const MeshRegion& region) const
{
  for (const auto& box : region.boxes())
  {
    if (box.constituents.size() < 2)
    {
      continue;
    }
    for (const auto blockId : box.constituents)
    {
      const auto group = registry_.groupOfBlock(blockId);
      if (!group || *group != region.groupId() || !scene_.find(blockId))
      {
        return false;
      }
    }
  }
  return true;
}

void MeshMerger::commit(Worker& worker)
{
  const MeshRegion& region = *worker.region;
  std::vector<SolidObjectId> removed;
  std::vector<SolidObjectId> added;

  const auto& boxes = region.boxes();
  for (size_t i = 0; i < boxes.size(); ++i)
  {
    if (worker.staged[i] == kInvalidObjectId)
    {
      continue;
    }
    removed.insert(
      removed.end(), boxes[i].constituents.begin(), boxes[i].constituents.end());
    added.push_back(worker.staged[i]);
  }

  if (!added.empty())
  {
    registry_.replaceVoxels(region.groupId(), removed, added);
    for (const auto id : added)
    {
      scene_.attach(id);
    }
    for (const auto id : removed)
    {
      scene_.removeObject(id);
    }
    logger()->debug("Dirty group {}: merged {} blocks into {}",
                    region.groupId(),
                    removed.size(),
                    added.size());
  }
  release(worker);
}

void MeshMerger::abort(Worker& worker)
{
  for (const auto id : worker.staged)
  {
    if (id != kInvalidObjectId)
    {
      scene_.removeObject(id);
    }
  }
  release(worker);
}

void MeshMerger::release(Worker& worker)
{
  registry_.unlockVoxels(worker.region->blockIds());
  worker.region.reset();
  worker.staged.clear();
  worker.nextBox = 0;
}

void MeshMerger::cancelAll()
{
  for (auto& worker : workers_)
  {
    if (worker.region)
    {
      abort(worker);
    }
  }
  for (const auto& region : queue_)
  {
    registry_.unlockVoxels(region.blockIds());
  }
  queue_.clear();
}

bool MeshMerger::isIdle() const
{
  return pendingRegionCount() == 0;
}

size_t MeshMerger::pendingRegionCount() const
{
  size_t count = queue_.size();
  for (const auto& worker : workers_)
  {
    if (worker.region)
    {
      ++count;
    }
  }
  return count;
}

}  // namespace shatter_sim
