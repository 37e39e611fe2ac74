// Ticket: 0015_destruction_world

#include "shatter-sim/src/DestructionWorld.hpp"

#include <format>
#include <stdexcept>

#include "shatter-sim/src/DataRecorder/DataRecorder.hpp"
#include "shatter-sim/src/Effects/BuiltinEffects.hpp"
#include "shatter-sim/src/Geometry/GeometryKernel.hpp"
#include "shatter-sim/src/Utils/Logging.hpp"
#include "shatter-sim/src/Voxel/Voxelizer.hpp"

namespace shatter_sim
{

namespace
{

const Settings& validated(const Settings& settings)
{
  settings.validate();
  return settings;
}

class HitboxPassScope
{
public:
  explicit HitboxPassScope(bool& flag) : flag_{flag}
  {
    flag_ = true;
  }

  ~HitboxPassScope()
  {
    flag_ = false;
  }

  HitboxPassScope(const HitboxPassScope&) = delete;
  HitboxPassScope& operator=(const HitboxPassScope&) = delete;

private:
  bool& flag_;
};

}  // namespace

DestructionWorld::DestructionWorld(SceneInterface& scene,
                                   const Settings& settings,
                                   ReplicationTransport* transport)
  : scene_{scene},
    settings_{validated(settings)},
    merger_{scene_, registry_},
    replicator_{scene_, transport, settings_},
    scheduler_{scene_, registry_, effects_, merger_, makeHooks()}
{
  BuiltinEffects::registerBuiltinEffects(effects_, registry_);

  replicator_.setSnapshotObserver(
    [this](const PuppetSnapshot& snapshot)
    {
      if (recorder_)
      {
        emittedSnapshots_.push_back(snapshot);
      }
    });
}

DestructionWorld::~DestructionWorld() = default;

SchedulerHooks DestructionWorld::makeHooks()
{
  SchedulerHooks hooks{};
  hooks.puppeteer = [this](SolidObjectId id,
                           const Velocity& linear,
                           const Vector3D& angular,
                           const std::vector<ObserverId>& excluded)
  { replicator_.puppeteer(id, linear, angular, excluded); };
  hooks.scheduleCleanup = [this](SolidObjectId id, double delay)
  { scheduleCleanup(id, delay); };
  hooks.onJobFinished = [this](const DestructionJob& job)
  {
    if (recorder_)
    {
      finishedJobs_.push_back(DataRecorder::makeJobRecord(job));
    }
  };
  return hooks;
}

JobId DestructionWorld::destroy(DestructionParams params)
{
  return scheduler_.submit(std::move(params), settings_);
}

std::future<ImaginaryResult> DestructionWorld::imaginaryVoxels(
  DestructionParams params)
{
  return scheduler_.submitImaginary(std::move(params), settings_);
}

SolidObjectId DestructionWorld::instantiateImaginaryVoxel(const Voxel& voxel,
                                                          bool doNotGiveDebrisTag)
{
  SolidObject spec{};
  spec.shape = voxel.shape();
  if (auto original = registry_.getOriginalPart(voxel.groupId))
  {
    spec.tags = original->get().tags;
    spec.divisible = original->get().divisible;
  }
  if (!doNotGiveDebrisTag)
  {
    spec.tags.emplace(kDebrisTag);
  }
  spec.anchored = voxel.anchored;
  spec.shade = voxel.shade;

  const SolidObjectId id = scene_.createObject(spec, true);
  if (!registry_.addDebris(voxel.groupId, id))
  {
    logger()->debug("Imaginary voxel {} instantiated without a dirty group", id);
  }
  return id;
}

PuppetId DestructionWorld::puppeteer(SolidObjectId objectId,
                                     const Velocity& linearVelocity,
                                     const Vector3D& angularVelocity,
                                     const std::vector<ObserverId>& excludedObservers)
{
  return replicator_.puppeteer(
    objectId, linearVelocity, angularVelocity, excludedObservers);
}

Hitbox& DestructionWorld::createHitbox(const OrientedShape& shape)
{
  auto hitbox = std::make_unique<Hitbox>(nextHitboxId_, *this, shape);
  auto [it, inserted] = hitboxes_.emplace(nextHitboxId_++, std::move(hitbox));
  return *it->second;
}

bool DestructionWorld::destroyHitbox(HitboxId id)
{
  auto it = hitboxes_.find(id);
  if (it == hitboxes_.end() || it->second->isDestroyed())
  {
    return false;
  }
  it->second->markDestroyed();
  if (iteratingHitboxes_)
  {
    retiredHitboxes_.push_back(id);
  }
  else
  {
    hitboxes_.erase(it);
  }
  return true;
}

std::optional<std::reference_wrapper<Hitbox>> DestructionWorld::findHitbox(
  HitboxId id)
{
  auto it = hitboxes_.find(id);
  if (it == hitboxes_.end() || it->second->isDestroyed())
  {
    return std::nullopt;
  }
  return std::ref(*it->second);
}

size_t DestructionWorld::resetArea(const OrientedShape& area)
{
  area.validate();
  merger_.cancelAll();
  return registry_.resetArea(area, scene_);
}

void DestructionWorld::reset(bool revertOwnership)
{
  scheduler_.clearQueue();
  merger_.cancelAll();
  replicator_.clear();
  cleanup_.clear();
  registry_.reset(revertOwnership, scene_);
}

void DestructionWorld::clearQueue()
{
  scheduler_.clearQueue();
}

std::optional<std::reference_wrapper<const SolidObject>>
DestructionWorld::getOriginalPart(DirtyGroupId groupId) const
{
  return registry_.getOriginalPart(groupId);
}

Vector3D DestructionWorld::voxelDistanceVector(const Voxel& voxel,
                                               const Coordinate& point)
{
  return Voxelizer::voxelDistanceVector(voxel, point);
}

Vector3D DestructionWorld::voxelCountVector(const Voxel& voxel,
                                            const Vector3D& extent)
{
  return Voxelizer::voxelCountVector(voxel, extent);
}

bool DestructionWorld::partEncapsulatesBox(const OrientedShape& part,
                                           const OrientedShape& box)
{
  return GeometryKernel::partEncapsulatesBox(part, box.frame, box.extent);
}

void DestructionWorld::registerOnVoxelDestruct(const std::string& name,
                                               EffectHook hook)
{
  effects_.registerEffect(name, std::move(hook));
}

bool DestructionWorld::onVoxelDestruct(std::string_view name,
                                       Voxel& voxel,
                                       const DestroyedVoxelInfo& info) const
{
  return effects_.invoke(name, voxel, info);
}

std::vector<Voxel> DestructionWorld::voxelize(SolidObjectId objectId,
                                              double gridSize) const
{
  auto object = scene_.find(objectId);
  if (!object)
  {
    throw std::invalid_argument{
      std::format("Cannot voxelize unknown object {}", objectId)};
  }
  const DirtyGroupId groupId =
    registry_.groupOfBlock(objectId).value_or(objectId);
  return Voxelizer::voxelize(object->get(), gridSize, groupId);
}

void DestructionWorld::printState() const
{
  const auto& stats = scheduler_.lastFrameStats();
  logger()->info("DestructionWorld state:");
  logger()->info("  jobs: {} active (last tick: {} divisions, {} ops)",
                 scheduler_.activeJobCount(),
                 stats.divisions,
                 stats.operations);
  logger()->info("  dirty groups: {}, live voxels: {}, debris: {}, locked: {}",
                 registry_.groupCount(),
                 registry_.liveVoxelCount(),
                 registry_.debrisCount(),
                 registry_.lockedCount());
  logger()->info("  merge regions pending: {} ({} workers)",
                 merger_.pendingRegionCount(),
                 merger_.workerCount());
  logger()->info("  puppets: {}, batches sent: {}",
                 replicator_.activeCount(),
                 replicator_.batchesSent());
  logger()->info("  hitboxes: {}, pending cleanups: {}, recording: {}",
                 hitboxes_.size(),
                 cleanup_.size(),
                 isRecording());
  std::string names;
  for (const auto& name : effects_.names())
  {
    names += names.empty() ? name : ", " + name;
  }
  logger()->info("  effects: {}", names);
}

void DestructionWorld::useSettings(const Settings& settings)
{
  settings.validate();
  settings_ = settings;
  replicator_.updateSettings(settings_);
}

void DestructionWorld::enableRecording(const std::string& databasePath,
                                       std::chrono::milliseconds flushInterval)
{
  DataRecorder::Config config{};
  config.databasePath = databasePath;
  config.flushInterval = flushInterval;
  recorder_ = std::make_unique<DataRecorder>(config);
  logger()->info("Recording destruction data to {}", databasePath);
}

void DestructionWorld::disableRecording()
{
  recorder_.reset();
  finishedJobs_.clear();
  emittedSnapshots_.clear();
}

FrameStats DestructionWorld::tick(std::chrono::milliseconds simTime)
{
  simTime_ = std::chrono::duration<double>{simTime}.count();

  {
    HitboxPassScope pass{iteratingHitboxes_};
    for (auto& [id, hitbox] : hitboxes_)
    {
      if (!hitbox->isDestroyed())
      {
        hitbox->update(simTime_);
      }
    }
  }

  const FrameStats stats = scheduler_.tick(settings_);

  {
    HitboxPassScope pass{iteratingHitboxes_};
    for (auto& [id, hitbox] : hitboxes_)
    {
      if (!hitbox->isDestroyed())
      {
        hitbox->collectResults();
      }
    }
  }
  for (const HitboxId id : retiredHitboxes_)
  {
    hitboxes_.erase(id);
  }
  retiredHitboxes_.clear();

  if (settings_.useGreedyMeshing || !merger_.isIdle())
  {
    merger_.tick(settings_);
  }
  replicator_.tick(simTime_);
  runCleanup();

  if (recorder_)
  {
    record(stats);
  }
  return stats;
}

void DestructionWorld::scheduleCleanup(SolidObjectId objectId, double delay)
{
  cleanup_.emplace(simTime_ + delay, objectId);
}

void DestructionWorld::runCleanup()
{
  while (!cleanup_.empty() && cleanup_.begin()->first <= simTime_)
  {
    const SolidObjectId id = cleanup_.begin()->second;
    cleanup_.erase(cleanup_.begin());

    if (auto puppet = replicator_.puppetOf(id))
    {
      replicator_.removePuppet(*puppet);
    }
    registry_.removeDebris(id);
    if (!scene_.removeObject(id))
    {
      logger()->debug("Debris {} already gone before cleanup", id);
    }
  }
}

void DestructionWorld::record(const FrameStats& stats)
{
  const uint32_t frameId = recorder_->recordFrame(
    simTime_, stats, static_cast<uint32_t>(replicator_.activeCount()));
  for (auto& job : finishedJobs_)
  {
    recorder_->recordJob(frameId, std::move(job));
  }
  for (const auto& snapshot : emittedSnapshots_)
  {
    recorder_->recordPuppetSnapshot(frameId, snapshot);
  }
  finishedJobs_.clear();
  emittedSnapshots_.clear();
}

}  // namespace shatter_sim
