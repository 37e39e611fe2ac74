// Ticket: 0011_destruction_scheduler

#ifndef SHATTER_SIM_SCHEDULER_DESTRUCTION_SCHEDULER_HPP
#define SHATTER_SIM_SCHEDULER_DESTRUCTION_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <vector>

#include "shatter-sim/src/Effects/EffectRegistry.hpp"
#include "shatter-sim/src/Environment/SceneInterface.hpp"
#include "shatter-sim/src/Merge/MeshMerger.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"
#include "shatter-sim/src/Scheduler/DestructionJob.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"

namespace shatter_sim
{

/**
 * @brief Work done by the scheduler during one tick
 *
 * divisions and operations count incremental work only and never exceed
 * maxDivisionsPerFrame / maxOpsPerFrame. Imaginary jobs ignore the caps and
 * are counted separately.
 */
struct FrameStats
{
  uint32_t divisions{0};
  uint32_t operations{0};
  uint32_t activeJobs{0};  // Queued or processing after the tick
  uint32_t completedJobs{0};
  uint32_t instantJobs{0};
  uint32_t instantOperations{0};
};

/**
 * @brief Side effects the scheduler delegates to its owner
 */
struct SchedulerHooks
{
  /// Turn a freshly attached debris block into a replicated puppet
  std::function<void(SolidObjectId,
                     const Velocity&,
                     const Vector3D&,
                     const std::vector<ObserverId>&)>
    puppeteer;

  /// Remove a debris block after the given delay [s]
  std::function<void(SolidObjectId, double)> scheduleCleanup;

  /// Called after a job completed or was cancelled
  std::function<void(const DestructionJob&)> onJobFinished;
};

/**
 * @brief Frame-budgeted processing of destruction jobs
 *
 * Incremental jobs are ordered by tier then submission order. With
 * usePriorityQueue the prioritizeRecentN most recently submitted active jobs
 * form tier 0 and the rest tier 1. Older jobs can starve while newer ones
 * keep arriving.
 *
 * Per tick at most maxDivisionsPerFrame objects are voxelized and at most
 * maxOpsPerFrame voxel classifications and block creations are performed
 * for incremental jobs. Each object's division is committed to the registry
 * and scene in a single step once every voxel has been classified and
 * instantiated, so an interrupted job never leaves a half-swapped object.
 *
 * Imaginary jobs are processed on the tick after submission and run to
 * completion regardless of the caps.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0011_destruction_scheduler
 */
class DestructionScheduler
{
public:
  DestructionScheduler(SceneInterface& scene,
                       DirtyGroupRegistry& registry,
                       const EffectRegistry& effects,
                       MeshMerger& merger,
                       SchedulerHooks hooks = {});

  /**
   * @brief Queue an incremental job
   * @throws std::invalid_argument if params fail validation
   */
  JobId submit(DestructionParams params, const Settings& settings);

  /**
   * @brief Queue an imaginary job
   *
   * The future is resolved during the next tick, or holds a
   * JobCancelledError if clearQueue() runs first.
   *
   * @throws std::invalid_argument if params fail validation
   */
  std::future<ImaginaryResult> submitImaginary(DestructionParams params,
                                               const Settings& settings);

  /**
   * @brief Advance queued work within the per-tick caps
   * @param settings Current caps; each job keeps its own settings snapshot
   */
  FrameStats tick(const Settings& settings);

  /**
   * @brief Cancel every queued and processing job
   *
   * Work already committed stands. In-flight divisions are rolled back.
   */
  void clearQueue();

  [[nodiscard]] size_t activeJobCount() const
  {
    return jobs_.size();
  }

  /// State of a known job; finished jobs are remembered
  [[nodiscard]] std::optional<JobState> jobState(JobId id) const;

  [[nodiscard]] const FrameStats& lastFrameStats() const
  {
    return lastStats_;
  }

  // Rule of Five
  DestructionScheduler(const DestructionScheduler&) = delete;
  DestructionScheduler& operator=(const DestructionScheduler&) = delete;
  DestructionScheduler(DestructionScheduler&&) noexcept = default;
  DestructionScheduler& operator=(DestructionScheduler&&) noexcept = delete;
  ~DestructionScheduler() = default;

private:
  /// Per-tick allowance; instant jobs run with an unlimited one
  struct Budget
  {
    bool limited{true};
    uint32_t maxDivisions{0};
    uint32_t maxOps{0};
    uint32_t divisions{0};
    uint32_t operations{0};

    [[nodiscard]] bool hasOps() const
    {
      return !limited || operations < maxOps;
    }

    [[nodiscard]] bool hasDivisions() const
    {
      return !limited || divisions < maxDivisions;
    }
  };

  JobId enqueue(DestructionParams params,
                const Settings& settings,
                JobMode mode,
                std::optional<std::promise<ImaginaryResult>> promise);

  [[nodiscard]] std::vector<JobId> incrementalOrder(
    const Settings& settings) const;

  /// Work on job until it finishes or the budget runs out
  void process(DestructionJob& job, Budget& budget);

  void gather(DestructionJob& job);

  void retryDeferred(DestructionJob& job);

  enum class StartResult : uint8_t
  {
    Handled,   // Skipped or finished without a division
    Started,   // job.current now holds a division
    Deferred,  // Capture conflict, retried next tick
    NoBudget   // Needs a division or op the budget cannot give
  };

  StartResult startObject(DestructionJob& job,
                          SolidObjectId objectId,
                          Budget& budget);

  /// Queue the attached live blocks of a group whose original was hit
  void expandGroup(DestructionJob& job, DirtyGroupId groupId);

  void handleExistingDebris(DestructionJob& job, const SolidObject& object);

  void handleNonDivisible(DestructionJob& job, const SolidObject& object);

  StartResult destroyWhole(DestructionJob& job, const SolidObject& object);

  StartResult beginDivision(DestructionJob& job, const SolidObject& object);

  void advanceWork(DestructionJob& job, Budget& budget);

  void classifyNext(DestructionJob& job, ObjectWork& work);

  void applyEffect(DestructionJob& job,
                   Voxel& voxel,
                   const DestroyedVoxelInfo& info);

  void commit(DestructionJob& job, ObjectWork& work);

  void rollback(ObjectWork& work);

  [[nodiscard]] std::optional<double> cleanupDelayFor(
    const DestructionJob& job,
    const Voxel& voxel) const;

  void finish(DestructionJob& job, JobState state);

  void cancelAll();

  SceneInterface& scene_;
  DirtyGroupRegistry& registry_;
  const EffectRegistry& effects_;
  MeshMerger& merger_;
  SchedulerHooks hooks_;

  std::map<JobId, DestructionJob> jobs_;
  std::map<JobId, JobState> finished_;
  JobId nextJobId_{1};
  uint64_t nextSubmissionOrder_{0};
  uint64_t tickCount_{0};
  FrameStats lastStats_{};
  bool inTick_{false};
  bool clearRequested_{false};  // clearQueue() called from inside tick()
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_SCHEDULER_DESTRUCTION_SCHEDULER_HPP
