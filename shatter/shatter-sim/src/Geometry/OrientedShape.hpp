// Ticket: 0004_geometry_kernel

#ifndef SHATTER_SIM_GEOMETRY_ORIENTED_SHAPE_HPP
#define SHATTER_SIM_GEOMETRY_ORIENTED_SHAPE_HPP

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Geometry/ShapeKind.hpp"

namespace shatter_sim
{

/**
 * @brief World-space axis-aligned bounding box
 */
struct Aabb
{
  Coordinate min;
  Coordinate max;

  [[nodiscard]] bool intersects(const Aabb& other) const;

  [[nodiscard]] bool contains(const Coordinate& point) const;

  /// Box grown by margin on every side
  [[nodiscard]] Aabb expanded(double margin) const;
};

/**
 * @brief A primitive shape placed in the world
 *
 * Used both as a cutting volume and as the geometric description of a scene
 * object. Immutable for the duration of one destruction job.
 */
struct OrientedShape
{
  ShapeKind kind{ShapeKind::Box};
  ReferenceFrame frame;
  Vector3D extent{1.0, 1.0, 1.0};  ///< Full size along local X, Y, Z [units]

  /**
   * @brief Reject shapes the kernel cannot reason about
   * @throws std::invalid_argument if any extent component is non-positive or
   *         non-finite, or the frame is non-finite or has a degenerate
   *         rotation
   */
  void validate() const;

  [[nodiscard]] Vector3D halfExtent() const
  {
    return Vector3D{extent * 0.5};
  }
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_GEOMETRY_ORIENTED_SHAPE_HPP
