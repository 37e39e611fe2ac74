#ifndef SHATTER_SIM_UTILS_HPP
#define SHATTER_SIM_UTILS_HPP

#include <cmath>
#include <concepts>

namespace shatter_sim
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

// Near-tangent configurations closer than this are treated as separated,
// so voxel faces that merely touch a cutting shape do not flicker between
// Edge and Exterior from float noise. [world units]
constexpr double kGeometryEpsilon = 1e-4;

}  // namespace shatter_sim

#endif  // SHATTER_SIM_UTILS_HPP
