#ifndef SHATTER_SIM_VELOCITY_HPP
#define SHATTER_SIM_VELOCITY_HPP

#include "shatter-sim/src/DataTypes/ComponentFormatter.hpp"
#include "shatter-sim/src/DataTypes/Vec3DBase.hpp"
#include "shatter-transfer/src/VelocityRecord.hpp"

namespace shatter_sim
{

/**
 * @brief Linear velocity [units/s]
 */
struct Velocity final : detail::Vec3DBase<Velocity>
{
  using Vec3DBase::Vec3DBase;

  [[nodiscard]] shatter_transfer::VelocityRecord toRecord() const
  {
    shatter_transfer::VelocityRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace shatter_sim

template <>
struct std::formatter<shatter_sim::Velocity>
  : shatter_sim::detail::ComponentFormatter<shatter_sim::Velocity>
{
  auto format(const shatter_sim::Velocity& vec, std::format_context& ctx) const
  {
    return formatComponents(
      vec, [](const auto& v) { return std::tuple{v.x(), v.y(), v.z()}; }, ctx);
  }
};

#endif  // SHATTER_SIM_VELOCITY_HPP
