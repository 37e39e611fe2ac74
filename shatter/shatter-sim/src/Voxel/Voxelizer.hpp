// Ticket: 0006_voxelizer

#ifndef SHATTER_SIM_VOXEL_VOXELIZER_HPP
#define SHATTER_SIM_VOXEL_VOXELIZER_HPP

#include <vector>

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

/**
 * @brief Result of classifying a voxel against a cutting shape
 *
 * emit is false for voxels that are consumed silently (fully encapsulated
 * voxels when skipEncapsulated is requested) and for voxels that survive.
 */
struct VoxelClassification
{
  VoxelClass voxelClass{VoxelClass::Exterior};
  bool emit{false};
};

/**
 * @brief Grid decomposition of solid objects and voxel classification
 *
 * @ticket 0006_voxelizer
 */
namespace Voxelizer
{

/// Smallest cell side accepted [units]
inline constexpr double kMinGridSize = 0.05;

/// Cells per axis before the grid is coarsened
inline constexpr int kMaxCellsPerAxis = 256;

/// Angular tolerance for floor/wall detection [degrees]
inline constexpr double kSurfaceAngleTolerance = 10.0;

/**
 * @brief Cell side actually used for an object
 *
 * gridSize clamped to kMinGridSize, then grown until no axis of extent needs
 * more than kMaxCellsPerAxis cells.
 *
 * @throws std::invalid_argument if gridSize is not positive and finite
 */
double effectiveGridSize(const Vector3D& extent, double gridSize);

/**
 * @brief Partition an object into a regular grid of voxels
 *
 * Voxels are aligned with the object's frame. The last cell on each axis is
 * shrunk to fit the extent. For non-box objects, voxels whose centre lies
 * outside the object shape are dropped. Every voxel records its cell index,
 * the grid size, groupId and the world-space outward normal of the object
 * face nearest its centre (ties prefer faces closest to vertical normals).
 *
 * @param object Object to decompose
 * @param gridSize Requested cell side [units]
 * @param groupId Dirty group the voxels belong to
 * @return Voxels ordered X fastest, then Y, then Z
 * @throws std::invalid_argument if gridSize is not positive and finite
 */
std::vector<Voxel> voxelize(const SolidObject& object,
                            double gridSize,
                            DirtyGroupId groupId);

/**
 * @brief A single voxel covering a whole object
 *
 * Used for debris and encapsulated objects that are handled without
 * subdivision.
 */
Voxel wholeObjectVoxel(const SolidObject& object, DirtyGroupId groupId);

/**
 * @brief Classify a voxel against a cutting shape
 *
 * - Interior: all 8 corners are contained, or the voxel centre is contained
 *   (a voxel is consumed once the cut reaches its centre)
 * - Edge: otherwise, at least one corner is contained or the kernel reports
 *   an intersection
 * - Exterior: no overlap
 *
 * With skipFloors/skipWalls, Interior and Edge voxels whose dominant normal
 * is within kSurfaceAngleTolerance of up (floor) or of horizontal (wall)
 * become Skip. With skipEncapsulated, voxels whose 8 corners are all
 * contained stay Interior but are not emitted.
 */
VoxelClassification classifyVoxel(const Voxel& voxel,
                                  const OrientedShape& cuttingShape,
                                  bool skipEncapsulated,
                                  bool skipFloors,
                                  bool skipWalls);

/**
 * @brief Offset from the voxel centre to point, in voxel units
 *
 * Computed in the voxel's local frame and divided component-wise by the
 * voxel extent, so results are independent of grid size and orientation.
 */
Vector3D voxelDistanceVector(const Voxel& voxel, const Coordinate& point);

/**
 * @brief How many voxels of this voxel's grid fit along each axis of extent
 *
 * Component-wise max(1, extent / cell side). The cell side is the voxel's
 * grid size when known, otherwise its extent. Never below 1.
 */
Vector3D voxelCountVector(const Voxel& voxel, const Vector3D& extent);

}  // namespace Voxelizer

}  // namespace shatter_sim

#endif  // SHATTER_SIM_VOXEL_VOXELIZER_HPP
