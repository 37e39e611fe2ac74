// Ticket: 0004_geometry_kernel

#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <vector>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"

using namespace shatter_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Boxes scattered around the origin with random orientation
std::vector<OrientedShape> generateRandomBoxes(size_t count)
{
  static std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<double> position{-4.0, 4.0};
  std::uniform_real_distribution<double> size{0.5, 3.0};
  std::uniform_real_distribution<double> angle{0.0, 3.14159};

  std::vector<OrientedShape> boxes;
  boxes.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    const Eigen::Vector3d axis{position(rng), position(rng), position(rng) + 5.0};
    boxes.push_back(OrientedShape{
      ShapeKind::Box,
      ReferenceFrame{Coordinate{position(rng), position(rng), position(rng)},
                     QuaternionD::fromAxisAngle(axis, angle(rng))},
      Vector3D{size(rng), size(rng), size(rng)}});
  }
  return boxes;
}

OrientedShape cuttingShape(ShapeKind kind)
{
  return OrientedShape{kind,
                       ReferenceFrame{Coordinate{0.5, 0.0, 0.0}},
                       Vector3D{4.0, 3.0, 3.0}};
}

}  // namespace

// ============================================================================
// Intersection
// ============================================================================

/**
 * @brief Cutting shape against a batch of randomly oriented boxes
 *
 * The range argument selects the ShapeKind of the cutting shape.
 *
 * @ticket 0004_geometry_kernel
 */
static void BM_ShapeIntersectsBox(benchmark::State& state)
{
  const auto kind = static_cast<ShapeKind>(state.range(0));
  const OrientedShape cut = cuttingShape(kind);
  const auto boxes = generateRandomBoxes(256);

  for (auto _ : state)
  {
    size_t hits = 0;
    for (const auto& box : boxes)
    {
      hits += GeometryKernel::shapeIntersectsBox(cut, box.frame, box.extent) ? 1 : 0;
    }
    benchmark::DoNotOptimize(hits);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(boxes.size()));
  state.SetLabel(std::string{toString(kind)});
}
BENCHMARK(BM_ShapeIntersectsBox)
  ->Arg(static_cast<int>(ShapeKind::Box))
  ->Arg(static_cast<int>(ShapeKind::Ball))
  ->Arg(static_cast<int>(ShapeKind::Cylinder))
  ->Arg(static_cast<int>(ShapeKind::Wedge))
  ->Arg(static_cast<int>(ShapeKind::CornerWedge));

// ============================================================================
// Containment
// ============================================================================

/**
 * @brief Full-containment test used for Interior classification
 *
 * @ticket 0004_geometry_kernel
 */
static void BM_PartEncapsulatesBox(benchmark::State& state)
{
  const auto kind = static_cast<ShapeKind>(state.range(0));
  const OrientedShape cut = cuttingShape(kind);
  const auto boxes = generateRandomBoxes(256);

  for (auto _ : state)
  {
    size_t inside = 0;
    for (const auto& box : boxes)
    {
      inside += GeometryKernel::partEncapsulatesBox(cut, box.frame, box.extent) ? 1 : 0;
    }
    benchmark::DoNotOptimize(inside);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(boxes.size()));
}
BENCHMARK(BM_PartEncapsulatesBox)
  ->Arg(static_cast<int>(ShapeKind::Box))
  ->Arg(static_cast<int>(ShapeKind::Ball))
  ->Arg(static_cast<int>(ShapeKind::Cylinder));
