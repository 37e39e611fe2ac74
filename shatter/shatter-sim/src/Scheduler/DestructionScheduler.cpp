// Ticket: 0011_destruction_scheduler

#include "shatter-sim/src/Scheduler/DestructionScheduler.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"
#include "shatter-sim/src/Utils/Logging.hpp"
#include "shatter-sim/src/Utils/utils.hpp"
#include "shatter-sim/src/Voxel/Voxelizer.hpp"

namespace shatter_sim
{

namespace
{

/// Finished job states remembered for jobState()
constexpr size_t kFinishedHistory = 1024;

class TickScope
{
public:
  explicit TickScope(bool& flag) : flag_{flag}
  {
    flag_ = true;
  }

  ~TickScope()
  {
    flag_ = false;
  }

  TickScope(const TickScope&) = delete;
  TickScope& operator=(const TickScope&) = delete;

private:
  bool& flag_;
};

bool sameGeometry(const Voxel& a, const Voxel& b)
{
  const double dot =
    a.frame.getOrientation().eigen().dot(b.frame.getOrientation().eigen());
  return (a.frame.getOrigin() - b.frame.getOrigin()).norm() < kGeometryEpsilon &&
         (a.extent - b.extent).norm() < kGeometryEpsilon &&
         std::abs(dot) > 1.0 - 1e-9;
}

SolidObject blockSpec(const SolidObject& source, const Voxel& voxel, bool debris)
{
  SolidObject spec{};
  spec.shape = voxel.shape();
  spec.tags = source.tags;
  if (debris)
  {
    spec.tags.emplace(kDebrisTag);
  }
  spec.divisible = source.divisible;
  spec.anchored = voxel.anchored;
  spec.shade = voxel.shade;
  return spec;
}

}  // namespace

DestructionScheduler::DestructionScheduler(SceneInterface& scene,
                                           DirtyGroupRegistry& registry,
                                           const EffectRegistry& effects,
                                           MeshMerger& merger,
                                           SchedulerHooks hooks)
  : scene_{scene},
    registry_{registry},
    effects_{effects},
    merger_{merger},
    hooks_{std::move(hooks)}
{
}

JobId DestructionScheduler::submit(DestructionParams params,
                                   const Settings& settings)
{
  return enqueue(std::move(params), settings, JobMode::Incremental, std::nullopt);
}

std::future<ImaginaryResult> DestructionScheduler::submitImaginary(
  DestructionParams params,
  const Settings& settings)
{
  std::promise<ImaginaryResult> promise;
  auto future = promise.get_future();
  enqueue(std::move(params), settings, JobMode::Imaginary, std::move(promise));
  return future;
}

JobId DestructionScheduler::enqueue(
  DestructionParams params,
  const Settings& settings,
  JobMode mode,
  std::optional<std::promise<ImaginaryResult>> promise)
{
  params.validate();

  DestructionJob job{};
  job.id = nextJobId_++;
  job.mode = mode;
  job.params = std::move(params);
  job.settings = settings;
  job.submissionOrder = nextSubmissionOrder_++;
  job.submittedTick = tickCount_;
  job.promise = std::move(promise);

  logger()->debug("Queued {} job {} '{}' ({}, grid {})",
                  mode == JobMode::Imaginary ? "imaginary" : "incremental",
                  job.id,
                  job.params.id,
                  toString(job.params.cuttingShape.kind),
                  job.gridSize());

  const JobId id = job.id;
  jobs_.emplace(id, std::move(job));
  return id;
}

FrameStats DestructionScheduler::tick(const Settings& settings)
{
  TickScope scope{inTick_};
  FrameStats stats{};
  ++tickCount_;

  // Imaginary jobs submitted before this tick run to completion
  std::vector<JobId> instantIds;
  for (const auto& [id, job] : jobs_)
  {
    if (job.isInstant() && job.submittedTick < tickCount_)
    {
      instantIds.push_back(id);
    }
  }
  for (const auto id : instantIds)
  {
    auto it = jobs_.find(id);
    if (it == jobs_.end() || clearRequested_)
    {
      continue;
    }
    Budget unlimited{};
    unlimited.limited = false;
    process(it->second, unlimited);
    stats.instantOperations += unlimited.operations;
    ++stats.instantJobs;
    if (!it->second.hasWork() && !clearRequested_)
    {
      finish(it->second, JobState::Completed);
      ++stats.completedJobs;
    }
  }

  Budget budget{};
  budget.maxDivisions = settings.maxDivisionsPerFrame;
  budget.maxOps = settings.maxOpsPerFrame;
  for (const auto id : incrementalOrder(settings))
  {
    auto it = jobs_.find(id);
    if (it == jobs_.end() || clearRequested_)
    {
      continue;
    }
    DestructionJob& job = it->second;
    retryDeferred(job);
    if (budget.hasOps())
    {
      process(job, budget);
    }
    if (job.gathered && !job.hasWork() && !clearRequested_)
    {
      finish(job, JobState::Completed);
      ++stats.completedJobs;
    }
  }
  stats.divisions = budget.divisions;
  stats.operations = budget.operations;

  if (clearRequested_)
  {
    clearRequested_ = false;
    cancelAll();
  }

  stats.activeJobs = static_cast<uint32_t>(jobs_.size());
  lastStats_ = stats;
  return stats;
}

std::vector<JobId> DestructionScheduler::incrementalOrder(
  const Settings& settings) const
{
  std::vector<const DestructionJob*> active;
  for (const auto& [id, job] : jobs_)
  {
    if (!job.isInstant())
    {
      active.push_back(&job);
    }
  }
  std::sort(active.begin(),
            active.end(),
            [](const DestructionJob* a, const DestructionJob* b)
            { return a->submissionOrder < b->submissionOrder; });

  // Tier 0: the most recent jobs; tier 1: the rest. FIFO within a tier.
  const size_t recent =
    settings.usePriorityQueue
      ? std::min<size_t>(settings.prioritizeRecentN, active.size())
      : active.size();
  const size_t recentStart = active.size() - recent;

  std::vector<JobId> order;
  order.reserve(active.size());
  for (size_t i = recentStart; i < active.size(); ++i)
  {
    order.push_back(active[i]->id);
  }
  for (size_t i = 0; i < recentStart; ++i)
  {
    order.push_back(active[i]->id);
  }
  return order;
}

void DestructionScheduler::process(DestructionJob& job, Budget& budget)
{
  if (job.state == JobState::Queued)
  {
    job.state = JobState::Processing;
  }
  if (!job.gathered)
  {
    gather(job);
  }

  while (job.state == JobState::Processing && !clearRequested_)
  {
    if (job.current)
    {
      advanceWork(job, budget);
      if (job.current)
      {
        return;
      }
      continue;
    }
    if (job.pendingObjects.empty())
    {
      return;
    }

    const SolidObjectId objectId = job.pendingObjects.front();
    const StartResult result = startObject(job, objectId, budget);
    if (result == StartResult::NoBudget)
    {
      return;
    }
    job.pendingObjects.pop_front();
    if (result == StartResult::Deferred)
    {
      job.deferred.push_back(objectId);
    }
  }
}

void DestructionScheduler::gather(DestructionJob& job)
{
  job.gathered = true;
  const Aabb region = GeometryKernel::computeAabb(job.params.cuttingShape);
  for (const auto id : scene_.queryRegion(region, job.params.filterTagged))
  {
    if (job.seen.insert(id).second)
    {
      job.pendingObjects.push_back(id);
    }
  }
}

void DestructionScheduler::retryDeferred(DestructionJob& job)
{
  if (job.deferred.empty())
  {
    return;
  }

  bool missing = false;
  for (auto it = job.deferred.rbegin(); it != job.deferred.rend(); ++it)
  {
    if (scene_.find(*it) && scene_.isAttached(*it))
    {
      job.pendingObjects.push_front(*it);
    }
    else
    {
      missing = true;
    }
  }
  job.deferred.clear();

  // A conflicting block was replaced (e.g. merged); pick up its successors
  if (missing)
  {
    gather(job);
  }
}

DestructionScheduler::StartResult DestructionScheduler::startObject(
  DestructionJob& job,
  SolidObjectId objectId,
  Budget& budget)
{
  auto found = scene_.find(objectId);
  if (!found || !scene_.isAttached(objectId))
  {
    return StartResult::Handled;
  }
  const SolidObject object = found->get();

  if (job.settings.skipInstanceCheck && job.settings.skipInstanceCheck(object))
  {
    return StartResult::Handled;
  }

  const OrientedShape& cut = job.params.cuttingShape;
  if (!GeometryKernel::shapeIntersectsBox(cut, object.frame(), object.extent()))
  {
    return StartResult::Handled;
  }

  if (object.hasTag(kDebrisTag))
  {
    if (!budget.hasOps())
    {
      return StartResult::NoBudget;
    }
    ++budget.operations;
    handleExistingDebris(job, object);
    return StartResult::Handled;
  }

  if (!object.divisible)
  {
    if (!budget.hasOps())
    {
      return StartResult::NoBudget;
    }
    ++budget.operations;
    handleNonDivisible(job, object);
    return StartResult::Handled;
  }

  if (job.params.skipEncapsulatedVoxels &&
      GeometryKernel::partEncapsulatesBox(cut, object.frame(), object.extent()))
  {
    if (!budget.hasOps())
    {
      return StartResult::NoBudget;
    }
    ++budget.operations;
    return destroyWhole(job, object);
  }

  if (!budget.hasDivisions() || !budget.hasOps())
  {
    return StartResult::NoBudget;
  }
  const StartResult result = beginDivision(job, object);
  if (result == StartResult::Started)
  {
    ++budget.divisions;
  }
  return result;
}

void DestructionScheduler::expandGroup(DestructionJob& job,
                                       DirtyGroupId groupId)
{
  auto group = registry_.getGroup(groupId);
  if (!group)
  {
    return;
  }
  for (const auto blockId : group->get().liveVoxels)
  {
    if (scene_.isAttached(blockId) && job.seen.insert(blockId).second)
    {
      job.pendingObjects.push_back(blockId);
    }
  }
}

void DestructionScheduler::handleExistingDebris(DestructionJob& job,
                                                const SolidObject& object)
{
  if (job.isInstant())
  {
    job.imaginary.existingDebris.push_back(object.id);
    return;
  }

  const DirtyGroupId groupId =
    registry_.groupOfDebris(object.id).value_or(kInvalidObjectId);
  const OrientedShape& cut = job.params.cuttingShape;
  const bool encapsulated =
    GeometryKernel::partEncapsulatesBox(cut, object.frame(), object.extent());

  Voxel voxel = Voxelizer::wholeObjectVoxel(object, groupId);
  voxel.jobId = job.id;
  voxel.voxelClass = encapsulated ? VoxelClass::Interior : VoxelClass::Edge;

  const DestroyedVoxelInfo info{
    groupId, cut, !encapsulated, true, job.params.userData};
  applyEffect(job, voxel, info);

  switch (voxel.fate)
  {
    case VoxelFate::Destroyed:
      registry_.removeDebris(object.id);
      scene_.removeObject(object.id);
      ++job.destroyedCount;
      break;
    case VoxelFate::Puppet:
      if (hooks_.puppeteer)
      {
        hooks_.puppeteer(object.id,
                         voxel.linearVelocity,
                         voxel.angularVelocity,
                         job.params.excludePlayersReplication);
      }
      break;
    case VoxelFate::Kept:
    case VoxelFate::Debris:
      break;
  }

  if (groupId != kInvalidObjectId)
  {
    job.affectedGroups.insert(groupId);
  }
}

void DestructionScheduler::handleNonDivisible(DestructionJob& job,
                                              const SolidObject& object)
{
  switch (job.settings.nonDivisibleInteraction)
  {
    case NonDivisibleInteraction::None:
      return;
    case NonDivisibleInteraction::Fall:
      scene_.setAnchored(object.id, false);
      return;
    case NonDivisibleInteraction::Remove:
      scene_.removeObject(object.id);
      ++job.destroyedCount;
      return;
  }
}

DestructionScheduler::StartResult DestructionScheduler::destroyWhole(
  DestructionJob& job,
  const SolidObject& object)
{
  const CaptureResult captured = registry_.capture(object.id, scene_);
  switch (captured.status)
  {
    case CaptureStatus::Unknown:
      return StartResult::Handled;
    case CaptureStatus::Conflict:
      logger()->debug("Job {}: object {} is locked", job.id, object.id);
      return job.isInstant() ? StartResult::Handled : StartResult::Deferred;
    case CaptureStatus::Existing:
      if (!registry_.groupOfBlock(object.id))
      {
        expandGroup(job, captured.groupId);
        return StartResult::Handled;
      }
      registry_.replaceVoxels(captured.groupId, {object.id}, {});
      scene_.removeObject(object.id);
      break;
    case CaptureStatus::Captured:
      break;
  }

  if (job.isInstant())
  {
    Voxel voxel = Voxelizer::wholeObjectVoxel(object, captured.groupId);
    voxel.jobId = job.id;
    voxel.voxelClass = VoxelClass::Interior;
    job.imaginary.voxels.push_back(std::move(voxel));
  }
  ++job.destroyedCount;
  job.affectedGroups.insert(captured.groupId);
  return StartResult::Handled;
}

DestructionScheduler::StartResult DestructionScheduler::beginDivision(
  DestructionJob& job,
  const SolidObject& object)
{
  // The original stays in the scene, locked, until the division commits
  const CaptureResult captured = registry_.capture(object.id, scene_, false);
  ObjectWork work{};
  switch (captured.status)
  {
    case CaptureStatus::Unknown:
      return StartResult::Handled;
    case CaptureStatus::Conflict:
      logger()->debug("Job {}: object {} is locked", job.id, object.id);
      return job.isInstant() ? StartResult::Handled : StartResult::Deferred;
    case CaptureStatus::Existing:
      if (!registry_.groupOfBlock(object.id))
      {
        expandGroup(job, captured.groupId);
        return StartResult::Handled;
      }
      work.fromLiveBlock = true;
      work.lockId = object.id;
      break;
    case CaptureStatus::Captured:
      work.capturedHere = true;
      work.lockId = captured.groupId;
      break;
  }

  work.sourceId = object.id;
  work.groupId = captured.groupId;
  work.source = object;
  work.voxels = Voxelizer::voxelize(object, job.gridSize(), captured.groupId);
  for (auto& voxel : work.voxels)
  {
    voxel.jobId = job.id;
    work.gridDimensions =
      work.gridDimensions.cwiseMax(voxel.cell + Eigen::Vector3i::Ones());
  }

  registry_.lockVoxels({work.lockId});
  job.current = std::move(work);
  return StartResult::Started;
}

void DestructionScheduler::advanceWork(DestructionJob& job, Budget& budget)
{
  ObjectWork& work = *job.current;

  while (work.phase == WorkPhase::Classify)
  {
    if (work.nextVoxel >= work.voxels.size())
    {
      work.phase = WorkPhase::Instantiate;
      break;
    }
    if (!budget.hasOps() || clearRequested_)
    {
      return;
    }
    classifyNext(job, work);
    ++budget.operations;
  }

  while (work.phase == WorkPhase::Instantiate)
  {
    const size_t survivorsLeft =
      work.survivors.size() - work.createdSurvivors.size();
    const size_t debrisLeft = work.debris.size() - work.createdDebris.size();
    if (survivorsLeft == 0 && debrisLeft == 0)
    {
      work.phase = WorkPhase::Commit;
      break;
    }
    if (!budget.hasOps())
    {
      return;
    }

    SolidObjectId created = kInvalidObjectId;
    if (survivorsLeft > 0)
    {
      const Voxel& voxel = work.survivors[work.createdSurvivors.size()];
      created = scene_.createObject(blockSpec(work.source, voxel, false), false);
      work.createdSurvivors.push_back(created);
    }
    else
    {
      const Voxel& voxel = work.debris[work.createdDebris.size()];
      created = scene_.createObject(blockSpec(work.source, voxel, true), false);
      work.createdDebris.push_back(created);
    }
    job.seen.insert(created);
    ++budget.operations;
  }

  commit(job, work);
  job.current.reset();
}

void DestructionScheduler::classifyNext(DestructionJob& job, ObjectWork& work)
{
  Voxel& voxel = work.voxels[work.nextVoxel++];
  const DestructionParams& params = job.params;
  const VoxelClassification result =
    Voxelizer::classifyVoxel(voxel,
                             params.cuttingShape,
                             params.skipEncapsulatedVoxels,
                             params.skipFloors,
                             params.skipWalls);
  voxel.voxelClass = result.voxelClass;

  switch (result.voxelClass)
  {
    case VoxelClass::Exterior:
    case VoxelClass::Skip:
      work.survivors.push_back(voxel);
      work.mergeable.push_back(true);
      return;
    case VoxelClass::Interior:
    case VoxelClass::Edge:
      break;
  }

  if (!result.emit || job.isInstant())
  {
    if (job.isInstant() && result.emit)
    {
      job.imaginary.voxels.push_back(voxel);
    }
    ++job.destroyedCount;
    return;
  }

  const Voxel before = voxel;
  const DestroyedVoxelInfo info{work.groupId,
                                params.cuttingShape,
                                voxel.isEdge(),
                                voxel.isAlreadyDebris,
                                params.userData};
  applyEffect(job, voxel, info);

  switch (voxel.fate)
  {
    case VoxelFate::Destroyed:
      ++job.destroyedCount;
      break;
    case VoxelFate::Kept:
      work.survivors.push_back(voxel);
      work.mergeable.push_back(sameGeometry(before, voxel));
      break;
    case VoxelFate::Debris:
    case VoxelFate::Puppet:
      work.debris.push_back(voxel);
      ++job.destroyedCount;
      break;
  }
}

void DestructionScheduler::applyEffect(DestructionJob& job,
                                       Voxel& voxel,
                                       const DestroyedVoxelInfo& info)
{
  // A hook that leaves the fate alone destroys the voxel
  voxel.fate = VoxelFate::Destroyed;
  if (effects_.invoke(job.params.onVoxelDestruct, voxel, info))
  {
    return;
  }
  if (!job.warnedUnknownEffect)
  {
    logger()->warn("Job {}: effect '{}' is not registered, using '{}'",
                   job.id,
                   job.params.onVoxelDestruct,
                   kDefaultEffectName);
    job.warnedUnknownEffect = true;
  }
  voxel.fate = VoxelFate::Destroyed;
}

void DestructionScheduler::commit(DestructionJob& job, ObjectWork& work)
{
  const bool intact =
    registry_.hasGroup(work.groupId) &&
    (!work.fromLiveBlock ||
     registry_.groupOfBlock(work.sourceId) == std::optional{work.groupId});
  if (!intact)
  {
    logger()->debug("Job {}: object {} changed while in flight, division dropped",
                    job.id,
                    work.sourceId);
    rollback(work);
    return;
  }

  std::vector<SolidObjectId> removed;
  if (work.fromLiveBlock)
  {
    removed.push_back(work.sourceId);
  }
  registry_.replaceVoxels(work.groupId, removed, work.createdSurvivors);
  registry_.unlockVoxels({work.lockId});

  for (const auto id : work.createdSurvivors)
  {
    scene_.attach(id);
  }
  if (work.fromLiveBlock)
  {
    scene_.removeObject(work.sourceId);
  }
  else
  {
    scene_.detach(work.sourceId);
  }

  for (size_t i = 0; i < work.createdDebris.size(); ++i)
  {
    const SolidObjectId id = work.createdDebris[i];
    const Voxel& voxel = work.debris[i];
    scene_.attach(id);
    registry_.addDebris(work.groupId, id);

    if (voxel.fate == VoxelFate::Puppet && hooks_.puppeteer)
    {
      hooks_.puppeteer(id,
                       voxel.linearVelocity,
                       voxel.angularVelocity,
                       job.params.excludePlayersReplication);
    }
    else if (!voxel.anchored)
    {
      scene_.setVelocity(id, voxel.linearVelocity, voxel.angularVelocity);
    }

    if (auto delay = cleanupDelayFor(job, voxel); delay && hooks_.scheduleCleanup)
    {
      hooks_.scheduleCleanup(id, *delay);
    }
  }
  job.affectedGroups.insert(work.groupId);

  if (!job.settings.useGreedyMeshing)
  {
    return;
  }

  MeshRegion region{work.groupId, work.source, work.gridDimensions};
  const ReferenceFrame& sourceFrame = work.source.frame();
  for (size_t i = 0; i < work.survivors.size(); ++i)
  {
    if (!work.mergeable[i])
    {
      continue;
    }
    const Voxel& voxel = work.survivors[i];
    const Eigen::Vector3d centre = sourceFrame.globalToLocal(voxel.frame.getOrigin());
    const Eigen::Vector3d half = 0.5 * voxel.extent;
    region.addCell(voxel.cell,
                   MeshCell{work.createdSurvivors[i],
                            voxel.voxelClass,
                            voxel.shade,
                            centre - half,
                            centre + half});
  }
  if (region.cellCount() > 1)
  {
    merger_.submit(std::move(region));
  }
}

void DestructionScheduler::rollback(ObjectWork& work)
{
  for (const auto id : work.createdSurvivors)
  {
    scene_.removeObject(id);
  }
  for (const auto id : work.createdDebris)
  {
    scene_.removeObject(id);
  }
  registry_.unlockVoxels({work.lockId});
  if (work.capturedHere)
  {
    registry_.restoreIfEmpty(work.groupId, scene_);
  }
}

std::optional<double> DestructionScheduler::cleanupDelayFor(
  const DestructionJob& job,
  const Voxel& voxel) const
{
  if (voxel.cleanupDelay)
  {
    return voxel.cleanupDelay;
  }
  if (job.params.cleanupDelay)
  {
    return job.params.cleanupDelay;
  }
  if (job.settings.useSmoothCleanup)
  {
    return job.settings.defaultSmoothCleanupDelay;
  }
  return std::nullopt;
}

void DestructionScheduler::finish(DestructionJob& job, JobState state)
{
  job.state = state;
  if (hooks_.onJobFinished)
  {
    hooks_.onJobFinished(job);
  }

  if (state == JobState::Completed)
  {
    logger()->info("Destruction job {} completed: {} voxel(s) destroyed in {} "
                   "group(s)",
                   job.id,
                   job.destroyedCount,
                   job.affectedGroups.size());
  }
  else
  {
    logger()->info("Destruction job {} cancelled", job.id);
  }

  const JobId id = job.id;
  const bool instant = job.isInstant();
  const size_t destroyed = job.destroyedCount;
  std::set<DirtyGroupId> groups = std::move(job.affectedGroups);
  DestructCompletedCallback callback = std::move(job.params.onDestructCompleted);
  std::optional<std::promise<ImaginaryResult>> promise = std::move(job.promise);
  ImaginaryResult imaginary = std::move(job.imaginary);

  jobs_.erase(id);
  finished_[id] = state;
  if (finished_.size() > kFinishedHistory)
  {
    finished_.erase(finished_.begin());
  }

  if (promise)
  {
    if (state == JobState::Completed)
    {
      promise->set_value(std::move(imaginary));
    }
    else
    {
      promise->set_exception(std::make_exception_ptr(JobCancelledError{id}));
    }
  }
  if (state == JobState::Completed && !instant && callback)
  {
    callback(destroyed, groups);
  }
}

void DestructionScheduler::clearQueue()
{
  if (inTick_)
  {
    clearRequested_ = true;
    return;
  }
  cancelAll();
}

void DestructionScheduler::cancelAll()
{
  std::vector<JobId> ids;
  ids.reserve(jobs_.size());
  for (const auto& [id, job] : jobs_)
  {
    ids.push_back(id);
  }
  for (const auto id : ids)
  {
    auto it = jobs_.find(id);
    if (it == jobs_.end())
    {
      continue;
    }
    DestructionJob& job = it->second;
    if (job.current)
    {
      rollback(*job.current);
      job.current.reset();
    }
    finish(job, JobState::Cancelled);
  }
}

std::optional<JobState> DestructionScheduler::jobState(JobId id) const
{
  if (auto it = jobs_.find(id); it != jobs_.end())
  {
    return it->second.state;
  }
  if (auto it = finished_.find(id); it != finished_.end())
  {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace shatter_sim
