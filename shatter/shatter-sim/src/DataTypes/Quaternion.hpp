// Ticket: 0002_core_datatypes

#ifndef SHATTER_SIM_QUATERNION_HPP
#define SHATTER_SIM_QUATERNION_HPP

#include <utility>

#include <Eigen/Geometry>

#include "shatter-sim/src/DataTypes/ComponentFormatter.hpp"
#include "shatter-transfer/src/QuaternionDRecord.hpp"

namespace shatter_sim
{

/**
 * @brief Orientation quaternion with transfer object support
 *
 * Wraps Eigen::Quaterniond via composition (Eigen::Quaterniond is not a
 * matrix type, so the Vec3DBase inheritance trick does not apply).
 *
 * Uses Eigen/Hamilton convention: q = w + xi + yj + zk
 *
 * Memory footprint: 32 bytes (same as Eigen::Quaterniond)
 */
struct QuaternionD final
{
  // Identity quaternion (w=1, x=y=z=0)
  QuaternionD() : quat_{Eigen::Quaterniond::Identity()}
  {
  }

  // Construct from components (w, x, y, z) - Eigen convention
  QuaternionD(double w, double x, double y, double z) : quat_{w, x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  QuaternionD(Eigen::Quaterniond quat) : quat_{std::move(quat)}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  QuaternionD(const Eigen::AngleAxisd& angleAxis) : quat_{angleAxis}
  {
  }

  [[nodiscard]] double w() const
  {
    return quat_.w();
  }
  [[nodiscard]] double x() const
  {
    return quat_.x();
  }
  [[nodiscard]] double y() const
  {
    return quat_.y();
  }
  [[nodiscard]] double z() const
  {
    return quat_.z();
  }

  [[nodiscard]] const Eigen::Quaterniond& eigen() const
  {
    return quat_;
  }

  [[nodiscard]] Eigen::Quaterniond& eigen()
  {
    return quat_;
  }

  [[nodiscard]] QuaternionD operator*(const QuaternionD& other) const
  {
    return QuaternionD{quat_ * other.quat_};
  }

  [[nodiscard]] Eigen::Vector3d operator*(const Eigen::Vector3d& v) const
  {
    return quat_ * v;
  }

  [[nodiscard]] Eigen::Matrix3d toRotationMatrix() const
  {
    return quat_.toRotationMatrix();
  }

  [[nodiscard]] QuaternionD normalized() const
  {
    return QuaternionD{quat_.normalized()};
  }

  [[nodiscard]] QuaternionD conjugate() const
  {
    return QuaternionD{quat_.conjugate()};
  }

  [[nodiscard]] double norm() const
  {
    return quat_.norm();
  }

  /// Spherical interpolation toward other, t in [0, 1]
  [[nodiscard]] QuaternionD slerp(double t, const QuaternionD& other) const
  {
    return QuaternionD{quat_.slerp(t, other.quat_)};
  }

  /// Rotation about a world axis (normalized internally) by angle [rad]
  static QuaternionD fromAxisAngle(const Eigen::Vector3d& axis, double angle)
  {
    return QuaternionD{Eigen::AngleAxisd{angle, axis.normalized()}};
  }

  static QuaternionD fromRecord(const shatter_transfer::QuaternionDRecord& record)
  {
    return QuaternionD{record.w, record.x, record.y, record.z};
  }

  [[nodiscard]] shatter_transfer::QuaternionDRecord toRecord() const
  {
    shatter_transfer::QuaternionDRecord record;
    record.w = w();
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }

private:
  Eigen::Quaterniond quat_;
};

}  // namespace shatter_sim

template <>
struct std::formatter<shatter_sim::QuaternionD>
  : shatter_sim::detail::ComponentFormatter<shatter_sim::QuaternionD>
{
  auto format(const shatter_sim::QuaternionD& quat,
              std::format_context& ctx) const
  {
    return formatComponents(
      quat,
      [](const auto& q) { return std::tuple{q.w(), q.x(), q.y(), q.z()}; },
      ctx);
  }
};

#endif  // SHATTER_SIM_QUATERNION_HPP
