// Ticket: 0008_effect_hooks

#ifndef SHATTER_SIM_EFFECTS_EFFECT_REGISTRY_HPP
#define SHATTER_SIM_EFFECTS_EFFECT_REGISTRY_HPP

#include <any>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Voxel/Voxel.hpp"

namespace shatter_sim
{

/// Effect applied when a job names no hook or an unknown one
inline constexpr std::string_view kDefaultEffectName = "Default";

/**
 * @brief Context handed to an effect hook with each destroyed voxel
 */
struct DestroyedVoxelInfo
{
  DirtyGroupId groupId{kInvalidObjectId};
  OrientedShape cuttingShape;
  bool isEdge{false};
  bool isAlreadyDebris{false};
  std::any userData;
};

/**
 * @brief Callback deciding the fate of one destroyed voxel
 *
 * Runs synchronously. May read and write the voxel it is given (fate,
 * frame, extent, velocities, shade, cleanup delay) and nothing else is
 * assumed about its side effects.
 */
using EffectHook = std::function<void(Voxel&, const DestroyedVoxelInfo&)>;

/**
 * @brief Named dispatch table of effect hooks
 *
 * @ticket 0008_effect_hooks
 */
class EffectRegistry
{
public:
  EffectRegistry() = default;

  /**
   * @brief Register a hook under a unique name
   * @throws std::invalid_argument if name is empty, already registered, or
   *         hook is empty
   */
  void registerEffect(const std::string& name, EffectHook hook);

  /**
   * @brief Run the hook registered under name
   * @return false if no hook is registered under name (voxel untouched)
   */
  bool invoke(std::string_view name,
              Voxel& voxel,
              const DestroyedVoxelInfo& info) const;

  [[nodiscard]] bool contains(std::string_view name) const;

  /// Registered names in lexicographic order
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] size_t size() const
  {
    return hooks_.size();
  }

private:
  std::map<std::string, EffectHook, std::less<>> hooks_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_EFFECTS_EFFECT_REGISTRY_HPP
