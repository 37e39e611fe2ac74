// Ticket: 0004_geometry_kernel

#include "shatter-sim/src/Geometry/OrientedShape.hpp"

#include <format>
#include <stdexcept>

namespace shatter_sim
{

bool Aabb::intersects(const Aabb& other) const
{
  return (min.array() <= other.max.array()).all() &&
         (other.min.array() <= max.array()).all();
}

bool Aabb::contains(const Coordinate& point) const
{
  return (min.array() <= point.array()).all() &&
         (point.array() <= max.array()).all();
}

Aabb Aabb::expanded(double margin) const
{
  const Eigen::Vector3d grow = Eigen::Vector3d::Constant(margin);
  return Aabb{Coordinate{min - grow}, Coordinate{max + grow}};
}

void OrientedShape::validate() const
{
  if (!extent.allFinite() || (extent.array() <= 0.0).any())
  {
    throw std::invalid_argument{std::format(
      "{} extent must be positive and finite, got {}", toString(kind), extent)};
  }
  if (!frame.isValid())
  {
    throw std::invalid_argument{std::format(
      "{} frame is degenerate (origin {}, orientation {})",
      toString(kind),
      frame.getOrigin(),
      frame.getOrientation())};
  }
}

}  // namespace shatter_sim
