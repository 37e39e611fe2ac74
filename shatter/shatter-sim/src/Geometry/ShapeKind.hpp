// Ticket: 0004_geometry_kernel

#ifndef SHATTER_SIM_GEOMETRY_SHAPE_KIND_HPP
#define SHATTER_SIM_GEOMETRY_SHAPE_KIND_HPP

#include <array>
#include <cstdint>
#include <string_view>

namespace shatter_sim
{

/**
 * @brief Closed set of primitive shapes used for scene objects and cutting
 * volumes
 *
 * Local conventions (half extents hx, hy, hz):
 * - Box: |x| <= hx, |y| <= hy, |z| <= hz
 * - Ball: sphere of radius min(extent) / 2
 * - Cylinder: axis along local X, radius min(extent.y, extent.z) / 2
 * - Wedge: full bottom and back (+Z) faces, slope rising from the bottom
 *   front edge to the top back edge
 * - CornerWedge: full bottom face, apex above the (+X, -Z) corner
 */
enum class ShapeKind : uint8_t
{
  Box = 0,
  Ball = 1,
  Cylinder = 2,
  Wedge = 3,
  CornerWedge = 4
};

inline constexpr std::array<ShapeKind, 5> kAllShapeKinds{ShapeKind::Box,
                                                         ShapeKind::Ball,
                                                         ShapeKind::Cylinder,
                                                         ShapeKind::Wedge,
                                                         ShapeKind::CornerWedge};

[[nodiscard]] constexpr std::string_view toString(ShapeKind kind)
{
  switch (kind)
  {
    case ShapeKind::Box:
      return "Box";
    case ShapeKind::Ball:
      return "Ball";
    case ShapeKind::Cylinder:
      return "Cylinder";
    case ShapeKind::Wedge:
      return "Wedge";
    case ShapeKind::CornerWedge:
      return "CornerWedge";
  }
  return "Unknown";
}

/// True for shapes whose boundary is a convex polyhedron with explicit
/// vertices (Box, Wedge, CornerWedge)
[[nodiscard]] constexpr bool isPolyhedral(ShapeKind kind)
{
  switch (kind)
  {
    case ShapeKind::Box:
    case ShapeKind::Wedge:
    case ShapeKind::CornerWedge:
      return true;
    case ShapeKind::Ball:
    case ShapeKind::Cylinder:
      return false;
  }
  return false;
}

}  // namespace shatter_sim

#endif  // SHATTER_SIM_GEOMETRY_SHAPE_KIND_HPP
