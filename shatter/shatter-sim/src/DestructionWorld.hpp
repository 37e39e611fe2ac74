// Ticket: 0015_destruction_world

#ifndef SHATTER_SIM_DESTRUCTION_WORLD_HPP
#define SHATTER_SIM_DESTRUCTION_WORLD_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shatter-sim/src/Effects/EffectRegistry.hpp"
#include "shatter-sim/src/Environment/SceneInterface.hpp"
#include "shatter-sim/src/Hitbox/Hitbox.hpp"
#include "shatter-sim/src/Merge/MeshMerger.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"
#include "shatter-sim/src/Replication/PuppetReplicator.hpp"
#include "shatter-sim/src/Replication/ReplicationTransport.hpp"
#include "shatter-sim/src/Scheduler/DestructionScheduler.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"
#include "shatter-transfer/src/DestructionJobRecord.hpp"

namespace shatter_sim
{

class DataRecorder;

/**
 * @brief Top-level destruction context bound to one scene
 *
 * Owns the dirty-group registry, effect registry (built-in effects
 * pre-registered), mesh merger, scheduler, puppet replicator, hitboxes and
 * the optional data recorder. Several worlds may coexist, each with its own
 * state.
 *
 * tick() runs, in order: hitboxes, scheduler, hitbox results, merger,
 * replicator, debris cleanup, recording.
 *
 * @note Not thread-safe (single-threaded simulation)
 *
 * @ticket 0015_destruction_world
 */
class DestructionWorld
{
public:
  /**
   * @param scene Scene collaborator, not owned; must outlive the world
   * @param settings Initial settings
   * @param transport Optional replication transport, not owned
   * @throws std::invalid_argument if settings fail validation
   */
  explicit DestructionWorld(SceneInterface& scene,
                            const Settings& settings = Settings{},
                            ReplicationTransport* transport = nullptr);

  ~DestructionWorld();

  DestructionWorld(const DestructionWorld&) = delete;
  DestructionWorld& operator=(const DestructionWorld&) = delete;
  DestructionWorld(DestructionWorld&&) = delete;
  DestructionWorld& operator=(DestructionWorld&&) = delete;

  /**
   * @brief Queue incremental destruction
   * @throws std::invalid_argument if params fail validation
   */
  JobId destroy(DestructionParams params);

  /**
   * @brief Queue instant destruction; resolved during the next tick
   * @throws std::invalid_argument if params fail validation
   */
  std::future<ImaginaryResult> imaginaryVoxels(DestructionParams params);

  /**
   * @brief Create a scene block from an imaginary voxel
   *
   * The block is attached, tagged as debris unless doNotGiveDebrisTag, and
   * recorded as debris of its dirty group when the group still exists.
   */
  SolidObjectId instantiateImaginaryVoxel(const Voxel& voxel,
                                          bool doNotGiveDebrisTag = false);

  /**
   * @throws std::invalid_argument if the object is unknown
   */
  PuppetId puppeteer(SolidObjectId objectId,
                     const Velocity& linearVelocity = Velocity{},
                     const Vector3D& angularVelocity = Vector3D{},
                     const std::vector<ObserverId>& excludedObservers = {});

  /**
   * @brief Create a stopped hitbox cutting with shape
   * @throws std::invalid_argument if shape fails validation
   */
  Hitbox& createHitbox(const OrientedShape& shape);

  /**
   * @brief Stop and forget a hitbox; false if unknown
   *
   * Safe from hitbox callbacks. During tick() the hitbox is released once
   * the hitbox passes are done.
   */
  bool destroyHitbox(HitboxId id);

  [[nodiscard]] std::optional<std::reference_wrapper<Hitbox>> findHitbox(
    HitboxId id);

  /**
   * @brief Undo destruction inside an area
   *
   * In-flight merges are cancelled first so no staged block survives.
   * @return Number of dirty groups fully restored
   */
  size_t resetArea(const OrientedShape& area);

  /**
   * @brief Cancel all work and restore every dirty group
   * @param revertOwnership Also forget ownership assignments
   */
  void reset(bool revertOwnership = true);

  /// Cancel every queued job; committed work stands
  void clearQueue();

  [[nodiscard]] std::optional<std::reference_wrapper<const SolidObject>>
  getOriginalPart(DirtyGroupId groupId) const;

  [[nodiscard]] static Vector3D voxelDistanceVector(const Voxel& voxel,
                                                    const Coordinate& point);

  [[nodiscard]] static Vector3D voxelCountVector(const Voxel& voxel,
                                                 const Vector3D& extent);

  [[nodiscard]] static bool partEncapsulatesBox(const OrientedShape& part,
                                                const OrientedShape& box);

  /**
   * @throws std::invalid_argument on an empty or duplicate name
   */
  void registerOnVoxelDestruct(const std::string& name, EffectHook hook);

  /**
   * @brief Run a registered effect on a voxel outside any job
   * @return false if no effect is registered under name
   */
  bool onVoxelDestruct(std::string_view name,
                       Voxel& voxel,
                       const DestroyedVoxelInfo& info = DestroyedVoxelInfo{}) const;

  /**
   * @brief Voxels an object would be cut into, without touching the scene
   * @throws std::invalid_argument if the object is unknown or gridSize is
   *         not positive
   */
  [[nodiscard]] std::vector<Voxel> voxelize(SolidObjectId objectId,
                                            double gridSize) const;

  /// Log queue, registry, merger and puppet counts
  void printState() const;

  /**
   * @brief Replace the settings; running jobs keep their snapshot
   * @throws std::invalid_argument if settings fail validation
   */
  void useSettings(const Settings& settings);

  [[nodiscard]] const Settings& settings() const
  {
    return settings_;
  }

  /**
   * @brief Start recording frames, jobs and puppet snapshots
   * @throws std::runtime_error if the database cannot be opened
   */
  void enableRecording(const std::string& databasePath,
                       std::chrono::milliseconds flushInterval =
                         std::chrono::milliseconds{100});

  /// Flush and close the recording database
  void disableRecording();

  [[nodiscard]] bool isRecording() const
  {
    return recorder_ != nullptr;
  }

  /**
   * @brief Advance the world to the given absolute simulation time
   * @param simTime Absolute time, non-decreasing between calls
   */
  FrameStats tick(std::chrono::milliseconds simTime);

  [[nodiscard]] size_t pendingCleanupCount() const
  {
    return cleanup_.size();
  }

  SceneInterface& scene()
  {
    return scene_;
  }

  [[nodiscard]] const DirtyGroupRegistry& registry() const
  {
    return registry_;
  }

  [[nodiscard]] const EffectRegistry& effects() const
  {
    return effects_;
  }

  [[nodiscard]] const MeshMerger& merger() const
  {
    return merger_;
  }

  [[nodiscard]] const DestructionScheduler& scheduler() const
  {
    return scheduler_;
  }

  [[nodiscard]] const PuppetReplicator& replicator() const
  {
    return replicator_;
  }

private:
  SchedulerHooks makeHooks();

  void scheduleCleanup(SolidObjectId objectId, double delay);

  void runCleanup();

  void record(const FrameStats& stats);

  SceneInterface& scene_;
  Settings settings_;
  DirtyGroupRegistry registry_;
  EffectRegistry effects_;
  MeshMerger merger_;
  PuppetReplicator replicator_;
  DestructionScheduler scheduler_;

  std::map<HitboxId, std::unique_ptr<Hitbox>> hitboxes_;
  HitboxId nextHitboxId_{1};
  bool iteratingHitboxes_{false};
  std::vector<HitboxId> retiredHitboxes_;

  std::multimap<double, SolidObjectId> cleanup_;  // Due time [s] -> debris
  double simTime_{0.0};

  std::unique_ptr<DataRecorder> recorder_;
  std::vector<shatter_transfer::DestructionJobRecord> finishedJobs_;
  std::vector<PuppetSnapshot> emittedSnapshots_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_DESTRUCTION_WORLD_HPP
