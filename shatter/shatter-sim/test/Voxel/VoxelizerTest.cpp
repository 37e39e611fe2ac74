// Ticket: 0006_voxelizer
// Test: Voxelizer grid decomposition and classification

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "shatter-sim/src/Voxel/Voxelizer.hpp"

namespace shatter_sim
{
namespace test
{

namespace
{

SolidObject makeObject(ShapeKind kind,
                       const Coordinate& origin,
                       const Vector3D& extent)
{
  SolidObject object;
  object.id = 7;
  object.shape = OrientedShape{kind, ReferenceFrame{origin}, extent};
  return object;
}

size_t countClass(const std::vector<Voxel>& voxels,
                  const OrientedShape& cut,
                  VoxelClass voxelClass)
{
  return static_cast<size_t>(
    std::count_if(voxels.begin(),
                  voxels.end(),
                  [&](const Voxel& v)
                  {
                    return Voxelizer::classifyVoxel(v, cut, false, false, false)
                             .voxelClass == voxelClass;
                  }));
}

}  // namespace

// ========== Grid decomposition ==========

TEST(VoxelizerTest, Voxelize_TenCubeGridTwo_Yields125)
{
  const auto object =
    makeObject(ShapeKind::Box, Coordinate{0, 0, 0}, Vector3D{10, 10, 10});
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  ASSERT_EQ(voxels.size(), 125u);
  for (const auto& v : voxels)
  {
    EXPECT_NEAR(v.extent.x(), 2.0, 1e-12);
    EXPECT_EQ(v.groupId, object.id);
    EXPECT_EQ(v.sourceId, object.id);
    EXPECT_DOUBLE_EQ(v.gridSize, 2.0);
  }
  // X fastest
  EXPECT_EQ(voxels[1].cell, Eigen::Vector3i(1, 0, 0));
  EXPECT_EQ(voxels[5].cell, Eigen::Vector3i(0, 1, 0));
}

TEST(VoxelizerTest, Voxelize_TenCubeFullyContained_AllInterior)
{
  const auto object =
    makeObject(ShapeKind::Box, Coordinate{0, 0, 0}, Vector3D{10, 10, 10});
  const OrientedShape cut{ShapeKind::Box, ReferenceFrame{}, Vector3D{12, 12, 12}};
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  EXPECT_EQ(countClass(voxels, cut, VoxelClass::Interior), 125u);
  for (const auto& v : voxels)
  {
    EXPECT_TRUE(Voxelizer::classifyVoxel(v, cut, false, false, false).emit);
  }
}

TEST(VoxelizerTest, Voxelize_LastCellShrinksToFit)
{
  const auto object =
    makeObject(ShapeKind::Box, Coordinate{0, 0, 0}, Vector3D{5, 2, 2});
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  ASSERT_EQ(voxels.size(), 3u);
  EXPECT_NEAR(voxels[2].extent.x(), 1.0, 1e-12);
  EXPECT_NEAR(voxels[2].frame.getOrigin().x(), 2.0, 1e-12);
  EXPECT_NEAR(voxels[0].frame.getOrigin().x(), -1.5, 1e-12);
}

TEST(VoxelizerTest, EffectiveGridSize_ClampsToMinimum)
{
  EXPECT_DOUBLE_EQ(Voxelizer::effectiveGridSize(Vector3D{1, 1, 1}, 0.001),
                   Voxelizer::kMinGridSize);
}

TEST(VoxelizerTest, EffectiveGridSize_CoarsensHugeObjects)
{
  const double grid = Voxelizer::effectiveGridSize(Vector3D{1024, 4, 4}, 1.0);
  EXPECT_DOUBLE_EQ(grid, 4.0);
}

TEST(VoxelizerTest, EffectiveGridSize_RejectsNonPositive)
{
  EXPECT_THROW(Voxelizer::effectiveGridSize(Vector3D{1, 1, 1}, 0.0),
               std::invalid_argument);
  EXPECT_THROW(Voxelizer::effectiveGridSize(Vector3D{1, 1, 1}, -1.0),
               std::invalid_argument);
  EXPECT_THROW(Voxelizer::effectiveGridSize(
                 Vector3D{1, 1, 1}, std::numeric_limits<double>::infinity()),
               std::invalid_argument);
}

TEST(VoxelizerTest, Voxelize_BallObjectDropsOutsideCells)
{
  const auto object =
    makeObject(ShapeKind::Ball, Coordinate{0, 0, 0}, Vector3D{10, 10, 10});
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  EXPECT_LT(voxels.size(), 125u);
  EXPECT_GT(voxels.size(), 0u);
}

// ========== Classification ==========

TEST(VoxelizerTest, Classify_BallInBox_InteriorAndEdge)
{
  const auto object =
    makeObject(ShapeKind::Box, Coordinate{0, 0, 0}, Vector3D{20, 20, 20});
  const OrientedShape ball{ShapeKind::Ball, ReferenceFrame{}, Vector3D{8, 8, 8}};
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  ASSERT_EQ(voxels.size(), 1000u);
  const size_t interior = countClass(voxels, ball, VoxelClass::Interior);
  const size_t edge = countClass(voxels, ball, VoxelClass::Edge);

  EXPECT_NEAR(static_cast<double>(interior), 33.0, 33.0 * 0.2);
  EXPECT_GT(edge, 0u);
  EXPECT_GT(countClass(voxels, ball, VoxelClass::Exterior), 0u);
}

TEST(VoxelizerTest, Classify_DistantVoxel_Exterior)
{
  Voxel voxel;
  voxel.frame = ReferenceFrame{Coordinate{50, 0, 0}};
  voxel.extent = Vector3D{1, 1, 1};
  const OrientedShape cut{ShapeKind::Box, ReferenceFrame{}, Vector3D{4, 4, 4}};

  const auto result = Voxelizer::classifyVoxel(voxel, cut, false, false, false);
  EXPECT_EQ(result.voxelClass, VoxelClass::Exterior);
  EXPECT_FALSE(result.emit);
}

TEST(VoxelizerTest, Classify_PartialOverlap_Edge)
{
  Voxel voxel;
  voxel.frame = ReferenceFrame{Coordinate{2.25, 0, 0}};
  voxel.extent = Vector3D{1, 1, 1};
  const OrientedShape cut{ShapeKind::Box, ReferenceFrame{}, Vector3D{4, 4, 4}};

  const auto result = Voxelizer::classifyVoxel(voxel, cut, false, false, false);
  EXPECT_EQ(result.voxelClass, VoxelClass::Edge);
  EXPECT_TRUE(result.emit);
}

TEST(VoxelizerTest, Classify_SkipEncapsulated_InteriorNotEmitted)
{
  Voxel voxel;
  voxel.extent = Vector3D{1, 1, 1};
  const OrientedShape cut{ShapeKind::Box, ReferenceFrame{}, Vector3D{4, 4, 4}};

  const auto result = Voxelizer::classifyVoxel(voxel, cut, true, false, false);
  EXPECT_EQ(result.voxelClass, VoxelClass::Interior);
  EXPECT_FALSE(result.emit);
}

TEST(VoxelizerTest, Classify_FloorAndWallSkips)
{
  const OrientedShape cut{ShapeKind::Box, ReferenceFrame{}, Vector3D{4, 4, 4}};

  Voxel floor;
  floor.extent = Vector3D{1, 1, 1};
  floor.dominantNormal = Vector3D{0, 1, 0};
  EXPECT_EQ(Voxelizer::classifyVoxel(floor, cut, false, true, false).voxelClass,
            VoxelClass::Skip);
  EXPECT_EQ(Voxelizer::classifyVoxel(floor, cut, false, false, true).voxelClass,
            VoxelClass::Interior);

  Voxel wall = floor;
  wall.dominantNormal = Vector3D{0, 0, -1};
  EXPECT_EQ(Voxelizer::classifyVoxel(wall, cut, false, false, true).voxelClass,
            VoxelClass::Skip);
  EXPECT_EQ(Voxelizer::classifyVoxel(wall, cut, false, true, false).voxelClass,
            VoxelClass::Interior);

  // A slope between the two tolerances is neither
  Voxel slope = floor;
  slope.dominantNormal = Vector3D{0, 1, 1};
  EXPECT_EQ(Voxelizer::classifyVoxel(slope, cut, false, true, true).voxelClass,
            VoxelClass::Interior);
}

TEST(VoxelizerTest, Voxelize_DominantNormalPrefersVertical)
{
  const auto object =
    makeObject(ShapeKind::Box, Coordinate{0, 0, 0}, Vector3D{6, 6, 6});
  const auto voxels = Voxelizer::voxelize(object, 2.0, object.id);

  // Corner cell (0, 2, 0) is equally close to -X, +Y and -Z
  const auto corner =
    std::find_if(voxels.begin(),
                 voxels.end(),
                 [](const Voxel& v) { return v.cell == Eigen::Vector3i(0, 2, 0); });
  ASSERT_NE(corner, voxels.end());
  EXPECT_NEAR(corner->dominantNormal.y(), 1.0, 1e-12);
}

// ========== Helpers ==========

TEST(VoxelizerTest, VoxelCountVector_NeverBelowOne)
{
  Voxel voxel;
  voxel.extent = Vector3D{2, 2, 2};
  voxel.gridSize = 2.0;

  const Vector3D counts = Voxelizer::voxelCountVector(voxel, Vector3D{0.5, 4, 10});
  EXPECT_DOUBLE_EQ(counts.x(), 1.0);
  EXPECT_DOUBLE_EQ(counts.y(), 2.0);
  EXPECT_DOUBLE_EQ(counts.z(), 5.0);

  const Vector3D tiny = Voxelizer::voxelCountVector(voxel, Vector3D{0, -1, 1e-9});
  EXPECT_GE(tiny.minCoeff(), 1.0);
}

TEST(VoxelizerTest, VoxelCountVector_UsesGridSizeForShrunkCells)
{
  Voxel voxel;
  voxel.extent = Vector3D{1, 2, 2};  // Last cell of its row
  voxel.gridSize = 2.0;

  EXPECT_DOUBLE_EQ(Voxelizer::voxelCountVector(voxel, Vector3D{4, 4, 4}).x(), 2.0);
}

TEST(VoxelizerTest, VoxelDistanceVector_InVoxelUnits)
{
  Voxel voxel;
  voxel.frame = ReferenceFrame{Coordinate{1, 1, 1}};
  voxel.extent = Vector3D{2, 2, 2};

  const Vector3D d =
    Voxelizer::voxelDistanceVector(voxel, Coordinate{3, 1, 0});
  EXPECT_NEAR(d.x(), 1.0, 1e-12);
  EXPECT_NEAR(d.y(), 0.0, 1e-12);
  EXPECT_NEAR(d.z(), -0.5, 1e-12);
}

TEST(VoxelizerTest, WholeObjectVoxel_CarriesDebrisTag)
{
  auto object =
    makeObject(ShapeKind::Box, Coordinate{3, 0, 0}, Vector3D{1, 2, 3});
  object.tags.emplace(kDebrisTag);

  const Voxel voxel = Voxelizer::wholeObjectVoxel(object, 11);
  EXPECT_TRUE(voxel.isAlreadyDebris);
  EXPECT_EQ(voxel.groupId, 11u);
  EXPECT_NEAR(voxel.frame.getOrigin().x(), 3.0, 1e-12);
  EXPECT_NEAR(voxel.extent.z(), 3.0, 1e-12);
}

}  // namespace test
}  // namespace shatter_sim
