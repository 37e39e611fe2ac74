// Ticket: 0008_effect_hooks

#ifndef SHATTER_SIM_EFFECTS_BUILTIN_EFFECTS_HPP
#define SHATTER_SIM_EFFECTS_BUILTIN_EFFECTS_HPP

#include <cstdint>
#include <string_view>

#include "shatter-sim/src/Effects/EffectRegistry.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"

namespace shatter_sim
{

/**
 * @brief Effect hooks shipped with the library
 *
 * @ticket 0008_effect_hooks
 */
namespace BuiltinEffects
{

inline constexpr std::string_view kRoughName = "Rough";
inline constexpr std::string_view kMapVoxelSpaceName = "MapVoxelSpace";
inline constexpr std::string_view kBumpyFloorBreakWallsName = "BumpyFloorBreakWalls";

inline constexpr uint32_t kDefaultSeed = 5489u;

/// Fraction of edge voxels Rough turns into edge debris
inline constexpr double kRoughEdgeDebrisChance = 0.8;

/// Fraction of remaining voxels Rough turns into flying debris
inline constexpr double kRoughFlyingChance = 0.05;

/// Lifetime of Rough's flying debris [s]
inline constexpr double kRoughFlyingLifetime = 3.0;

/// Inner fraction of the ball MapVoxelSpace removes
inline constexpr double kMapVoxelSpaceThreshold = 0.33;

/// Per-component tolerance for a hit normal to count as facing up
inline constexpr double kFloorNormalTolerance = 0.01;

/// Floor voxels move vertically by up to half of this [m]
inline constexpr double kFloorBumpRange = 1.0;

/// Wall voxels fly at kWallMinSpeed plus up to kWallSpeedRange [m/s]
inline constexpr double kWallMinSpeed = 50.0;
inline constexpr double kWallSpeedRange = 25.0;

/**
 * @brief Destroy the voxel
 */
void defaultEffect(Voxel& voxel, const DestroyedVoxelInfo& info);

/**
 * @brief Rough craters with scattered debris
 *
 * Already-debris voxels are destroyed unless they are on the edge. Edge
 * voxels mostly become enlarged, randomly rotated edge debris. Most other
 * voxels are destroyed; a small share is thrown as short-lived flying debris.
 *
 * @param seed Seed of the generator owned by the returned hook
 */
EffectHook makeRough(uint32_t seed);

/**
 * @brief Ball crater shaded in voxel space
 *
 * Assumes a Ball cutting shape. Voxels whose normalized voxel-space distance
 * from the ball centre is below kMapVoxelSpaceThreshold are destroyed; the
 * rest are kept and darkened from black at the threshold to their original
 * shade at the ball surface. Works the same for any grid size or
 * orientation.
 */
void mapVoxelSpace(Voxel& voxel, const DestroyedVoxelInfo& info);

/**
 * @brief Bumpy floors, broken walls
 *
 * Casts from the cut origin through the voxel against the untouched
 * original part of the voxel's group. userData holding a Coordinate
 * replaces the cut origin. If the first face hit points up the voxel is a
 * floor voxel: it is kept with a random vertical offset. Otherwise it
 * becomes a puppet flying away from the cast origin. Already-debris voxels
 * are left alone.
 *
 * @param groups Registry the original parts are read from; must outlive the
 *        returned hook
 * @param seed Seed of the generator owned by the returned hook
 */
EffectHook makeBumpyFloorBreakWalls(const DirtyGroupRegistry& groups,
                                    uint32_t seed);

/**
 * @brief Register Default, Rough, MapVoxelSpace and BumpyFloorBreakWalls
 * @param groups Passed to makeBumpyFloorBreakWalls
 * @throws std::invalid_argument if any of the names is already registered
 */
void registerBuiltinEffects(EffectRegistry& registry,
                            const DirtyGroupRegistry& groups,
                            uint32_t seed = kDefaultSeed);

}  // namespace BuiltinEffects

}  // namespace shatter_sim

#endif  // SHATTER_SIM_EFFECTS_BUILTIN_EFFECTS_HPP
