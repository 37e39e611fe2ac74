// Ticket: 0005_scene_collaborator

#ifndef SHATTER_SIM_ENVIRONMENT_SOLID_OBJECT_HPP
#define SHATTER_SIM_ENVIRONMENT_SOLID_OBJECT_HPP

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/DataTypes/Velocity.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"

namespace shatter_sim
{

using SolidObjectId = uint32_t;

/// Never assigned to a scene object
inline constexpr SolidObjectId kInvalidObjectId = 0;

/// Tag carried by every block spawned as debris
inline constexpr std::string_view kDebrisTag = "ShatterDebris";

/**
 * @brief A scene object eligible for destruction
 *
 * The destruction core never mutates a SolidObject in place. It asks the
 * scene to detach, create or remove objects instead.
 */
struct SolidObject
{
  SolidObjectId id{kInvalidObjectId};
  OrientedShape shape;
  std::set<std::string, std::less<>> tags;
  bool divisible{true};
  bool anchored{true};
  double shade{0.0};  // 0 = original colour, 1 = black

  [[nodiscard]] bool hasTag(std::string_view tag) const
  {
    return tags.find(tag) != tags.end();
  }

  [[nodiscard]] const ReferenceFrame& frame() const
  {
    return shape.frame;
  }

  [[nodiscard]] const Vector3D& extent() const
  {
    return shape.extent;
  }
};

/**
 * @brief Rigid body state reported by the physics collaborator
 */
struct BodyState
{
  ReferenceFrame frame;
  Velocity linearVelocity;
  Vector3D angularVelocity;  // [rad/s]
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_ENVIRONMENT_SOLID_OBJECT_HPP
