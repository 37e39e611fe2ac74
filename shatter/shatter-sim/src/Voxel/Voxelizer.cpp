// Ticket: 0006_voxelizer

#include "shatter-sim/src/Voxel/Voxelizer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <stdexcept>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"

namespace shatter_sim::Voxelizer
{

namespace
{

// Guards ceil() against extents that are an exact multiple of the grid
constexpr double kCellCountSlack = 1e-9;

// Face distances closer than this are ties
constexpr double kFaceTieTolerance = 1e-9;

int cellCount(double axisExtent, double grid)
{
  const int count =
    static_cast<int>(std::ceil(axisExtent / grid - kCellCountSlack));
  return std::max(count, 1);
}

Vector3D nearestFaceNormal(const SolidObject& object,
                           const Eigen::Vector3d& localCentre)
{
  const auto planes =
    GeometryKernel::getLocalFacePlanes(object.shape.kind, object.shape.extent);

  const FacePlane* best = nullptr;
  double bestDistance = std::numeric_limits<double>::max();
  for (const auto& plane : planes)
  {
    const double distance = plane.offset - plane.normal.dot(localCentre);
    if (best == nullptr || distance < bestDistance - kFaceTieTolerance)
    {
      best = &plane;
      bestDistance = distance;
    }
    else if (std::abs(distance - bestDistance) <= kFaceTieTolerance &&
             std::abs(plane.normal.y()) > std::abs(best->normal.y()))
    {
      best = &plane;
      bestDistance = std::min(bestDistance, distance);
    }
  }

  if (best == nullptr)
  {
    return Vector3D{0.0, 1.0, 0.0};
  }
  return object.shape.frame.localToGlobalRelative(best->normal);
}

}  // namespace

double effectiveGridSize(const Vector3D& extent, double gridSize)
{
  if (!std::isfinite(gridSize) || gridSize <= 0.0)
  {
    throw std::invalid_argument{
      std::format("Grid size must be positive and finite, got {}", gridSize)};
  }

  double grid = std::max(gridSize, kMinGridSize);
  const double longest = extent.maxCoeff();
  if (longest / grid > static_cast<double>(kMaxCellsPerAxis))
  {
    grid = longest / static_cast<double>(kMaxCellsPerAxis);
  }
  return grid;
}

std::vector<Voxel> voxelize(const SolidObject& object,
                            double gridSize,
                            DirtyGroupId groupId)
{
  const Vector3D& extent = object.shape.extent;
  const double grid = effectiveGridSize(extent, gridSize);
  const Eigen::Vector3i counts{cellCount(extent.x(), grid),
                               cellCount(extent.y(), grid),
                               cellCount(extent.z(), grid)};
  const Eigen::Vector3d half = 0.5 * extent;
  const ReferenceFrame& frame = object.shape.frame;
  const bool filterByShape = object.shape.kind != ShapeKind::Box;

  std::vector<Voxel> voxels;
  voxels.reserve(static_cast<size_t>(counts.prod()));

  for (int k = 0; k < counts.z(); ++k)
  {
    for (int j = 0; j < counts.y(); ++j)
    {
      for (int i = 0; i < counts.x(); ++i)
      {
        const Eigen::Vector3i cell{i, j, k};
        Eigen::Vector3d cellMin;
        Eigen::Vector3d cellSize;
        for (Eigen::Index a = 0; a < 3; ++a)
        {
          cellMin[a] = -half[a] + cell[a] * grid;
          // Last cell shrinks to fit the extent
          cellSize[a] = cell[a] == counts[a] - 1
                          ? extent[a] - cell[a] * grid
                          : grid;
        }
        const Eigen::Vector3d localCentre = cellMin + 0.5 * cellSize;
        const Coordinate worldCentre =
          frame.localToGlobal(Coordinate{localCentre});

        if (filterByShape &&
            !GeometryKernel::containsPoint(object.shape, worldCentre))
        {
          continue;
        }

        Voxel voxel;
        voxel.frame = ReferenceFrame{worldCentre, frame.getOrientation()};
        voxel.extent = Vector3D{cellSize};
        voxel.groupId = groupId;
        voxel.sourceId = object.id;
        voxel.cell = cell;
        voxel.gridSize = grid;
        voxel.dominantNormal = nearestFaceNormal(object, localCentre);
        voxel.anchored = object.anchored;
        voxel.shade = object.shade;
        voxels.push_back(std::move(voxel));
      }
    }
  }
  return voxels;
}

Voxel wholeObjectVoxel(const SolidObject& object, DirtyGroupId groupId)
{
  Voxel voxel;
  voxel.frame = object.shape.frame;
  voxel.extent = object.shape.extent;
  voxel.groupId = groupId;
  voxel.sourceId = object.id;
  voxel.gridSize = object.shape.extent.maxCoeff();
  voxel.dominantNormal = nearestFaceNormal(object, Eigen::Vector3d::Zero());
  voxel.isAlreadyDebris = object.hasTag(kDebrisTag);
  voxel.anchored = object.anchored;
  voxel.shade = object.shade;
  return voxel;
}

VoxelClassification classifyVoxel(const Voxel& voxel,
                                  const OrientedShape& cuttingShape,
                                  bool skipEncapsulated,
                                  bool skipFloors,
                                  bool skipWalls)
{
  const auto corners =
    GeometryKernel::getVertices(ShapeKind::Box, voxel.frame, voxel.extent);
  const bool encapsulated =
    GeometryKernel::partContainsAllVerts(cuttingShape, corners);

  VoxelClassification result;
  // A contained centre also counts as Interior so a ball cut keeps its
  // expected interior voxel count
  if (encapsulated ||
      GeometryKernel::containsPoint(cuttingShape, voxel.frame.getOrigin()))
  {
    result.voxelClass = VoxelClass::Interior;
  }
  else if (GeometryKernel::partContainsAVert(cuttingShape, corners) ||
           GeometryKernel::shapeIntersectsBox(
             cuttingShape, voxel.frame, voxel.extent))
  {
    result.voxelClass = VoxelClass::Edge;
  }
  else
  {
    return result;
  }

  const double cosTolerance =
    std::cos(kSurfaceAngleTolerance * std::numbers::pi / 180.0);
  const double sinTolerance =
    std::sin(kSurfaceAngleTolerance * std::numbers::pi / 180.0);
  const double upness = voxel.dominantNormal.normalized().y();

  if ((skipFloors && upness >= cosTolerance) ||
      (skipWalls && std::abs(upness) <= sinTolerance))
  {
    result.voxelClass = VoxelClass::Skip;
    return result;
  }

  result.emit = !(skipEncapsulated && encapsulated);
  return result;
}

Vector3D voxelDistanceVector(const Voxel& voxel, const Coordinate& point)
{
  const Coordinate local = voxel.frame.globalToLocal(point);
  return Vector3D{local.cwiseQuotient(voxel.extent)};
}

Vector3D voxelCountVector(const Voxel& voxel, const Vector3D& extent)
{
  Eigen::Vector3d cellSide = voxel.extent;
  if (voxel.gridSize > 0.0)
  {
    cellSide.setConstant(voxel.gridSize);
  }
  const Eigen::Vector3d ratio = extent.cwiseQuotient(cellSide);
  Vector3D result;
  for (Eigen::Index a = 0; a < 3; ++a)
  {
    // NaN and negative ratios fall back to 1 as well
    result[a] = ratio[a] >= 1.0 ? ratio[a] : 1.0;
  }
  return result;
}

}  // namespace shatter_sim::Voxelizer
