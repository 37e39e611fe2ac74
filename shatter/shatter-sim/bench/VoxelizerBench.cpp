// Ticket: 0006_voxelizer

#include <benchmark/benchmark.h>

#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Voxel/Voxelizer.hpp"

using namespace shatter_sim;

namespace
{

SolidObject wallObject()
{
  SolidObject wall;
  wall.id = 1;
  wall.shape = OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D{16.0, 8.0, 2.0}};
  return wall;
}

}  // namespace

/**
 * @brief Voxelize a 16x8x2 wall; range is the number of cells per unit
 *
 * @ticket 0006_voxelizer
 */
static void BM_Voxelize(benchmark::State& state)
{
  const SolidObject wall = wallObject();
  const double gridSize = 1.0 / static_cast<double>(state.range(0));

  for (auto _ : state)
  {
    auto voxels = Voxelizer::voxelize(wall, gridSize, wall.id);
    benchmark::DoNotOptimize(voxels.data());
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Voxelize)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Complexity();

/**
 * @brief Classify every voxel of the wall against a ball cut
 *
 * This is the per-operation cost the scheduler budgets with maxOpsPerFrame.
 *
 * @ticket 0006_voxelizer
 */
static void BM_ClassifyVoxels(benchmark::State& state)
{
  const SolidObject wall = wallObject();
  const double gridSize = 1.0 / static_cast<double>(state.range(0));
  auto voxels = Voxelizer::voxelize(wall, gridSize, wall.id);
  const OrientedShape cut{
    ShapeKind::Ball, ReferenceFrame{Coordinate{2.0, 1.0, 0.0}}, Vector3D::uniform(6.0)};

  for (auto _ : state)
  {
    size_t destroyed = 0;
    for (auto& voxel : voxels)
    {
      const auto result = Voxelizer::classifyVoxel(voxel, cut, false, false, false);
      destroyed += result.emit ? 1 : 0;
    }
    benchmark::DoNotOptimize(destroyed);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(voxels.size()));
}
BENCHMARK(BM_ClassifyVoxels)->Arg(1)->Arg(2)->Arg(4);
