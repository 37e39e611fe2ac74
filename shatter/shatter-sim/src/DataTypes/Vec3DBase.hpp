// Ticket: 0002_core_datatypes
// Base CRTP template for 3D vector types

#ifndef SHATTER_SIM_VEC3D_BASE_HPP
#define SHATTER_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace shatter_sim::detail
{

/**
 * @brief CRTP base class for 3D vector types
 *
 * Inherits from Eigen::Vector3d so every semantic vector (positions,
 * extents, velocities) keeps full Eigen expression support. Derived types
 * inherit the constructors and convert implicitly from Eigen expressions,
 * so assigning an expression to one needs no extra operator:
 *
 *   struct MyVec3Type final : Vec3DBase<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  /// Implicit from any Eigen 3-vector expression
  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  /// Vector with all three components set to value
  static Derived uniform(double value)
  {
    return Derived{value, value, value};
  }
};

}  // namespace shatter_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // SHATTER_SIM_VEC3D_BASE_HPP
