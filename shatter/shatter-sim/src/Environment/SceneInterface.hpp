// Ticket: 0005_scene_collaborator

#ifndef SHATTER_SIM_ENVIRONMENT_SCENE_INTERFACE_HPP
#define SHATTER_SIM_ENVIRONMENT_SCENE_INTERFACE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"

namespace shatter_sim
{

/**
 * @brief Scene graph and physics collaborator used by the destruction core
 *
 * The core only asks for atomic primitives (detach, attach, create, remove,
 * anchor) and reads body state back. Integration, collision response and
 * rendering stay on the other side of this interface.
 *
 * Detached objects still exist (find() returns them) but are not part of
 * the active scene: they are not returned by queryRegion() and are not
 * simulated.
 */
class SceneInterface
{
public:
  virtual ~SceneInterface() = default;

  /**
   * @brief Look up an object, attached or detached
   * @return Reference to the object, or nullopt if the id is unknown
   */
  [[nodiscard]] virtual std::optional<std::reference_wrapper<const SolidObject>>
  find(SolidObjectId id) const = 0;

  [[nodiscard]] virtual bool isAttached(SolidObjectId id) const = 0;

  /**
   * @brief Attached objects whose bounds overlap region
   * @param region World-space query box
   * @param tagFilter If non-empty, only objects carrying at least one of
   *        these tags are returned
   * @return Matching object ids in ascending order
   */
  [[nodiscard]] virtual std::vector<SolidObjectId> queryRegion(
    const Aabb& region,
    const std::vector<std::string>& tagFilter) const = 0;

  /// Remove from the active scene without destroying. False if unknown.
  virtual bool detach(SolidObjectId id) = 0;

  /// Return a detached object to the active scene. False if unknown.
  virtual bool attach(SolidObjectId id) = 0;

  /**
   * @brief Instantiate a new object
   * @param spec Object description (spec.id is ignored)
   * @param attached Whether the object enters the active scene immediately
   * @return Id assigned to the new object
   */
  virtual SolidObjectId createObject(const SolidObject& spec, bool attached) = 0;

  /// Destroy an object permanently. False if unknown.
  virtual bool removeObject(SolidObjectId id) = 0;

  virtual bool setAnchored(SolidObjectId id, bool anchored) = 0;

  virtual bool setVelocity(SolidObjectId id,
                           const Velocity& linear,
                           const Vector3D& angular) = 0;

  [[nodiscard]] virtual std::optional<BodyState> getBodyState(
    SolidObjectId id) const = 0;

protected:
  SceneInterface() = default;
  SceneInterface(const SceneInterface&) = default;
  SceneInterface& operator=(const SceneInterface&) = default;
  SceneInterface(SceneInterface&&) noexcept = default;
  SceneInterface& operator=(SceneInterface&&) noexcept = default;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_ENVIRONMENT_SCENE_INTERFACE_HPP
