// Ticket: 0005_scene_collaborator

#ifndef SHATTER_SIM_ENVIRONMENT_WORLD_SCENE_HPP
#define SHATTER_SIM_ENVIRONMENT_WORLD_SCENE_HPP

#include <cstddef>
#include <map>

#include "shatter-sim/src/Environment/SceneInterface.hpp"

namespace shatter_sim
{

/**
 * @brief Headless in-memory scene
 *
 * Stores objects in id order and integrates free (unanchored) bodies with
 * constant velocity and optional exponential damping. There is no gravity
 * and no collision; it exists so the destruction core can be exercised by
 * tests, benchmarks and the demo without a physics engine.
 */
class WorldScene final : public SceneInterface
{
public:
  /**
   * @param linearDamping Exponential velocity decay rate [1/s] applied to
   *        unanchored bodies in advance()
   * @throws std::invalid_argument if linearDamping is negative
   */
  explicit WorldScene(double linearDamping = 0.0);

  [[nodiscard]] std::optional<std::reference_wrapper<const SolidObject>> find(
    SolidObjectId id) const override;

  [[nodiscard]] bool isAttached(SolidObjectId id) const override;

  [[nodiscard]] std::vector<SolidObjectId> queryRegion(
    const Aabb& region,
    const std::vector<std::string>& tagFilter) const override;

  bool detach(SolidObjectId id) override;

  bool attach(SolidObjectId id) override;

  SolidObjectId createObject(const SolidObject& spec, bool attached) override;

  bool removeObject(SolidObjectId id) override;

  bool setAnchored(SolidObjectId id, bool anchored) override;

  bool setVelocity(SolidObjectId id,
                   const Velocity& linear,
                   const Vector3D& angular) override;

  [[nodiscard]] std::optional<BodyState> getBodyState(
    SolidObjectId id) const override;

  /**
   * @brief Integrate every attached, unanchored body by dt seconds
   */
  void advance(double dt);

  /// Convenience for tests and the demo: attached box with the given tags
  SolidObjectId addBox(const Coordinate& position,
                       const Vector3D& extent,
                       std::set<std::string, std::less<>> tags = {});

  [[nodiscard]] size_t objectCount() const
  {
    return objects_.size();
  }

  [[nodiscard]] size_t attachedCount() const;

  /// Ids of every attached object in ascending order
  [[nodiscard]] std::vector<SolidObjectId> attachedIds() const;

  ~WorldScene() override = default;

  WorldScene(const WorldScene&) = delete;
  WorldScene& operator=(const WorldScene&) = delete;
  WorldScene(WorldScene&&) noexcept = default;
  WorldScene& operator=(WorldScene&&) noexcept = default;

private:
  struct Entry
  {
    SolidObject object;
    bool attached{true};
    Velocity linearVelocity;
    Vector3D angularVelocity;
  };

  std::map<SolidObjectId, Entry> objects_;
  SolidObjectId nextId_{1};
  double linearDamping_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_ENVIRONMENT_WORLD_SCENE_HPP
