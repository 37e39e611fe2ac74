// Ticket: 0010_greedy_mesh_merger

#ifndef SHATTER_SIM_MERGE_MESH_REGION_HPP
#define SHATTER_SIM_MERGE_MESH_REGION_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_set>
#include <vector>

#include <Eigen/Dense>

#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

/**
 * @brief One surviving block placed on a region's grid
 *
 * Bounds are expressed in the frame of the object the region was cut from.
 */
struct MeshCell
{
  SolidObjectId blockId{kInvalidObjectId};
  VoxelClass voxelClass{VoxelClass::Exterior};
  double shade{0.0};
  Eigen::Vector3d localMin{Eigen::Vector3d::Zero()};
  Eigen::Vector3d localMax{Eigen::Vector3d::Zero()};
};

/**
 * @brief Output of one greedy expansion
 */
struct MergedBox
{
  std::vector<SolidObjectId> constituents;
  Eigen::Vector3i minCell{Eigen::Vector3i::Zero()};
  Eigen::Vector3i maxCell{Eigen::Vector3i::Zero()};
  ReferenceFrame frame;
  Vector3D extent;
  VoxelClass voxelClass{VoxelClass::Exterior};
  double shade{0.0};
};

/**
 * @brief Survivors of one voxelized block, merged greedily step by step
 *
 * Cells are scanned X fastest, then Y, then Z. At the first unvisited cell a
 * box is grown along X, then the row along Y, then the rectangle along Z,
 * while every swept cell exists, is unvisited and has the same
 * classification and shade. One call to step() handles one occupied scan
 * position so the merger can bound the work done per tick.
 *
 * @ticket 0010_greedy_mesh_merger
 */
class MeshRegion
{
public:
  /**
   * @param groupId Dirty group owning every block of the region
   * @param blockTemplate Source object: its frame anchors the cell bounds,
   *        its tags and flags are copied to merged blocks
   * @param dimensions Cell counts along X, Y, Z
   * @throws std::invalid_argument if any dimension is not positive
   */
  MeshRegion(DirtyGroupId groupId,
             SolidObject blockTemplate,
             const Eigen::Vector3i& dimensions);

  /**
   * @brief Place a surviving block on the grid
   * @throws std::invalid_argument if cell is out of range or already filled
   * @throws std::runtime_error if traversal has already started
   */
  void addCell(const Eigen::Vector3i& cell, const MeshCell& data);

  /**
   * @brief Process one occupied scan position
   * @return true if a box was emitted by this step
   */
  bool step();

  /// Run every remaining step
  void runToCompletion();

  [[nodiscard]] bool isTraversalComplete() const;

  [[nodiscard]] const std::vector<MergedBox>& boxes() const
  {
    return boxes_;
  }

  /// Every block placed on the grid
  [[nodiscard]] std::vector<SolidObjectId> blockIds() const;

  [[nodiscard]] size_t cellCount() const
  {
    return cells_.size();
  }

  [[nodiscard]] DirtyGroupId groupId() const
  {
    return groupId_;
  }

  [[nodiscard]] const SolidObject& blockTemplate() const
  {
    return blockTemplate_;
  }

private:
  [[nodiscard]] int64_t linearIndex(const Eigen::Vector3i& cell) const;

  [[nodiscard]] bool inRange(const Eigen::Vector3i& cell) const;

  /// Cell exists, is unvisited and matches the seed's class and shade
  [[nodiscard]] bool canJoin(const Eigen::Vector3i& cell,
                             const MeshCell& seed) const;

  [[nodiscard]] MergedBox growFrom(const Eigen::Vector3i& seedCell,
                                   const MeshCell& seed);

  DirtyGroupId groupId_;
  SolidObject blockTemplate_;
  Eigen::Vector3i dimensions_;

  std::map<int64_t, MeshCell> cells_;  // Ordered by scan position
  int64_t scanFrom_{0};                // Next scan position to examine
  bool started_{false};
  std::unordered_set<int64_t> visited_;
  std::vector<MergedBox> boxes_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_MERGE_MESH_REGION_HPP
