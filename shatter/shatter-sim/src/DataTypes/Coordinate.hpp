// Ticket: 0002_core_datatypes

#ifndef SHATTER_SIM_COORDINATE_HPP
#define SHATTER_SIM_COORDINATE_HPP

#include "shatter-sim/src/DataTypes/ComponentFormatter.hpp"
#include "shatter-sim/src/DataTypes/Vec3DBase.hpp"
#include "shatter-transfer/src/CoordinateRecord.hpp"

namespace shatter_sim
{

/**
 * @brief 3D point in world or object-local space [units]
 *
 * Thin wrapper around Vec3DBase providing:
 * - Full Eigen matrix operation compatibility
 * - fromRecord/toRecord for database serialization
 * - std::format support
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;

  static Coordinate fromRecord(const shatter_transfer::CoordinateRecord& record)
  {
    return Coordinate{record.x, record.y, record.z};
  }

  [[nodiscard]] shatter_transfer::CoordinateRecord toRecord() const
  {
    shatter_transfer::CoordinateRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace shatter_sim

template <>
struct std::formatter<shatter_sim::Coordinate>
  : shatter_sim::detail::ComponentFormatter<shatter_sim::Coordinate>
{
  auto format(const shatter_sim::Coordinate& vec, std::format_context& ctx) const
  {
    return formatComponents(
      vec, [](const auto& v) { return std::tuple{v.x(), v.y(), v.z()}; }, ctx);
  }
};

#endif  // SHATTER_SIM_COORDINATE_HPP
