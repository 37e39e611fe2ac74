// Ticket: 0010_greedy_mesh_merger

#ifndef SHATTER_SIM_MERGE_MESH_MERGER_HPP
#define SHATTER_SIM_MERGE_MESH_MERGER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "shatter-sim/src/Environment/SceneInterface.hpp"
#include "shatter-sim/src/Merge/MeshRegion.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"

namespace shatter_sim
{

/**
 * @brief Work done by the merger during one tick
 */
struct MergeStats
{
  uint32_t traversalSteps{0};
  uint32_t partsCreated{0};
  uint32_t regionsCommitted{0};
  uint32_t regionsAborted{0};
};

/**
 * @brief Cooperative greedy merging of surviving voxels
 *
 * Regions are processed by gmWorkerCount interleaved workers. Each worker
 * owns at most one region and per tick spends at most gmTraversalsPerFrame
 * traversal steps and gmPartCreationsPerFrame block creations on it. Merged
 * blocks are created detached and swapped in by a single commit once every
 * box of the region exists.
 *
 * Blocks of a region stay locked in the registry from submit() until the
 * region commits or aborts. A commit aborts, removing its staged blocks,
 * when a constituent no longer belongs to the region's group.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0010_greedy_mesh_merger
 */
class MeshMerger
{
public:
  MeshMerger(SceneInterface& scene, DirtyGroupRegistry& registry);

  /**
   * @brief Queue a region for merging and lock its blocks
   */
  void submit(MeshRegion region);

  /**
   * @brief Advance every worker by one tick's budget
   */
  MergeStats tick(const Settings& settings);

  /**
   * @brief Drop every queued and in-flight region
   *
   * Staged blocks are removed from the scene and every lock is released.
   * Committed merges stand.
   */
  void cancelAll();

  [[nodiscard]] bool isIdle() const;

  /// Queued plus in-flight regions
  [[nodiscard]] size_t pendingRegionCount() const;

  [[nodiscard]] size_t workerCount() const
  {
    return workers_.size();
  }

  // Rule of Five
  MeshMerger(const MeshMerger&) = delete;
  MeshMerger& operator=(const MeshMerger&) = delete;
  MeshMerger(MeshMerger&&) noexcept = default;
  MeshMerger& operator=(MeshMerger&&) noexcept = delete;
  ~MeshMerger() = default;

private:
  struct Worker
  {
    std::optional<MeshRegion> region;
    size_t nextBox{0};
    // Aligned with region->boxes(); kInvalidObjectId for single-cell boxes
    std::vector<SolidObjectId> staged;
  };

  void advance(Worker& worker, const Settings& settings, MergeStats& stats);

  [[nodiscard]] bool constituentsIntact(const MeshRegion& region) const;

  void commit(Worker& worker);

  void abort(Worker& worker);

  void release(Worker& worker);

  SceneInterface& scene_;
  DirtyGroupRegistry& registry_;
  std::deque<MeshRegion> queue_;
  std::vector<Worker> workers_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_MERGE_MESH_MERGER_HPP
