#ifndef SHATTER_SIM_VECTOR3D_HPP
#define SHATTER_SIM_VECTOR3D_HPP

#include "shatter-sim/src/DataTypes/ComponentFormatter.hpp"
#include "shatter-sim/src/DataTypes/Vec3DBase.hpp"
#include "shatter-transfer/src/Vector3DRecord.hpp"

namespace shatter_sim
{

/**
 * @brief Generic 3D vector type with transfer object support
 *
 * Used for directions, face normals, object extents and angular rates.
 * For positions prefer Coordinate; for linear velocities prefer Velocity.
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;

  [[nodiscard]] shatter_transfer::Vector3DRecord toRecord() const
  {
    shatter_transfer::Vector3DRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace shatter_sim

template <>
struct std::formatter<shatter_sim::Vector3D>
  : shatter_sim::detail::ComponentFormatter<shatter_sim::Vector3D>
{
  auto format(const shatter_sim::Vector3D& vec, std::format_context& ctx) const
  {
    return formatComponents(
      vec, [](const auto& v) { return std::tuple{v.x(), v.y(), v.z()}; }, ctx);
  }
};

#endif  // SHATTER_SIM_VECTOR3D_HPP
