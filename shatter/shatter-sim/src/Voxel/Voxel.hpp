// Ticket: 0006_voxelizer

#ifndef SHATTER_SIM_VOXEL_VOXEL_HPP
#define SHATTER_SIM_VOXEL_VOXEL_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include <Eigen/Dense>

#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/DataTypes/Velocity.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"

namespace shatter_sim
{

/// A dirty group is identified by the id of the original object it records
using DirtyGroupId = SolidObjectId;

using JobId = uint64_t;

enum class VoxelClass : uint8_t
{
  Interior = 0,  // Consumed by the cutting shape
  Edge = 1,      // Touched by the cutting shape
  Exterior = 2,  // Untouched
  Skip = 3       // Touched, but protected by a floor/wall skip flag
};

/**
 * @brief Outcome of a destroyed voxel, written by effect hooks
 */
enum class VoxelFate : uint8_t
{
  Destroyed = 0,  // Removed from the scene
  Kept = 1,       // Survives as a live block of its group
  Debris = 2,     // Spawned as a free block tagged as debris
  Puppet = 3      // Spawned as debris and replicated as a falling puppet
};

[[nodiscard]] constexpr std::string_view toString(VoxelClass voxelClass)
{
  switch (voxelClass)
  {
    case VoxelClass::Interior:
      return "Interior";
    case VoxelClass::Edge:
      return "Edge";
    case VoxelClass::Exterior:
      return "Exterior";
    case VoxelClass::Skip:
      return "Skip";
  }
  return "Unknown";
}

/**
 * @brief One cell of a voxelized object
 *
 * Produced by the Voxelizer, classified against a cutting shape, then either
 * handed to an effect hook (Interior/Edge) or instantiated as a surviving
 * block. Effect hooks may edit the frame, extent, fate, velocities, shade
 * and cleanup delay.
 */
struct Voxel
{
  ReferenceFrame frame;
  Vector3D extent;
  DirtyGroupId groupId{kInvalidObjectId};
  SolidObjectId sourceId{kInvalidObjectId};  // Object this voxel was cut from
  JobId jobId{0};
  Eigen::Vector3i cell{Eigen::Vector3i::Zero()};
  double gridSize{0.0};
  VoxelClass voxelClass{VoxelClass::Exterior};
  Vector3D dominantNormal{0.0, 1.0, 0.0};  // World space
  bool isAlreadyDebris{false};

  VoxelFate fate{VoxelFate::Kept};
  bool anchored{true};
  Velocity linearVelocity;
  Vector3D angularVelocity;
  double shade{0.0};
  std::optional<double> cleanupDelay;  // [s], overrides the job delay

  [[nodiscard]] OrientedShape shape() const
  {
    return OrientedShape{ShapeKind::Box, frame, extent};
  }

  [[nodiscard]] bool isEdge() const
  {
    return voxelClass == VoxelClass::Edge;
  }
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_VOXEL_VOXEL_HPP
