// Ticket: 0008_effect_hooks

#include "shatter-sim/src/Effects/BuiltinEffects.hpp"

#include <algorithm>
#include <any>
#include <memory>
#include <numbers>
#include <optional>
#include <random>
#include <string>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"
#include "shatter-sim/src/Utils/utils.hpp"
#include "shatter-sim/src/Voxel/Voxelizer.hpp"

namespace shatter_sim::BuiltinEffects
{

namespace
{

double mapRange(double x, double a0, double a1, double b0, double b1)
{
  return b0 + (b1 - b0) * (x - a0) / (a1 - a0);
}

}  // namespace

void defaultEffect(Voxel& voxel, const DestroyedVoxelInfo& /* info */)
{
  voxel.fate = VoxelFate::Destroyed;
}

EffectHook makeRough(uint32_t seed)
{
  auto generator = std::make_shared<std::mt19937>(seed);

  return [generator](Voxel& voxel, const DestroyedVoxelInfo& info)
  {
    std::uniform_real_distribution<double> unit{0.0, 1.0};
    auto& rng = *generator;

    if (info.isAlreadyDebris)
    {
      voxel.fate = info.isEdge ? VoxelFate::Kept : VoxelFate::Destroyed;
      return;
    }

    const double roll = unit(rng);

    if (info.isEdge && roll < kRoughEdgeDebrisChance)
    {
      const double tau = 2.0 * std::numbers::pi;
      const QuaternionD tumble =
        QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitX(), unit(rng) * tau) *
        QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitY(), unit(rng) * tau) *
        QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitZ(), unit(rng) * tau);
      voxel.frame.setOrientation(voxel.frame.getOrientation() * tumble);
      voxel.extent = Vector3D{voxel.extent * (unit(rng) + 1.0)};
      voxel.fate = VoxelFate::Debris;
      return;
    }

    if (roll > kRoughFlyingChance)
    {
      voxel.fate = VoxelFate::Destroyed;
      return;
    }

    auto centredRandom = [&unit, &rng]()
    {
      return Eigen::Vector3d{unit(rng), unit(rng), unit(rng)} -
             Eigen::Vector3d::Constant(0.5);
    };
    voxel.fate = VoxelFate::Debris;
    voxel.anchored = false;
    voxel.linearVelocity = Velocity{centredRandom() * 80.0};
    voxel.angularVelocity = Vector3D{centredRandom() * 20.0};
    voxel.cleanupDelay = kRoughFlyingLifetime;
  };
}

void mapVoxelSpace(Voxel& voxel, const DestroyedVoxelInfo& info)
{
  if (info.isAlreadyDebris)
  {
    return;
  }

  const double radius = 0.5 * info.cuttingShape.extent.minCoeff();

  // Voxels from the ball centre to its surface along each local axis
  const Vector3D maxVoxelDist =
    Voxelizer::voxelCountVector(voxel, Vector3D::uniform(radius));

  const Eigen::Vector3d voxelDist =
    Voxelizer::voxelDistanceVector(voxel, info.cuttingShape.frame.getOrigin())
      .cwiseAbs()
      .cwiseMin(maxVoxelDist);

  const double normalDist = voxelDist.cwiseQuotient(maxVoxelDist).norm();
  if (normalDist < kMapVoxelSpaceThreshold)
  {
    voxel.fate = VoxelFate::Destroyed;
    return;
  }

  const double darkness = std::clamp(
    mapRange(normalDist, kMapVoxelSpaceThreshold, 1.0, 1.0, 0.0), 0.0, 1.0);
  voxel.shade += (1.0 - voxel.shade) * darkness;
  voxel.fate = VoxelFate::Kept;
}

EffectHook makeBumpyFloorBreakWalls(const DirtyGroupRegistry& groups,
                                    uint32_t seed)
{
  auto generator = std::make_shared<std::mt19937>(seed);

  return [generator, &groups](Voxel& voxel, const DestroyedVoxelInfo& info)
  {
    if (info.isAlreadyDebris)
    {
      return;
    }

    std::uniform_real_distribution<double> unit{0.0, 1.0};
    auto& rng = *generator;

    const auto* castOrigin = std::any_cast<Coordinate>(&info.userData);
    const Coordinate origin =
      castOrigin ? *castOrigin : info.cuttingShape.frame.getOrigin();
    const Eigen::Vector3d toVoxel = voxel.frame.getOrigin() - origin;

    std::optional<GeometryKernel::RayHit> hit;
    if (auto original = groups.getOriginalPart(info.groupId))
    {
      hit = GeometryKernel::raycast(original->get().shape,
                                    Coordinate{origin - toVoxel * 0.01},
                                    Vector3D{toVoxel * 1.01});
    }

    const bool floor =
      hit && (hit->normal - Eigen::Vector3d::UnitY()).cwiseAbs().maxCoeff() <=
               kFloorNormalTolerance;
    if (floor)
    {
      const double bump = (unit(rng) - 0.5) * kFloorBumpRange;
      voxel.frame.setOrigin(
        Coordinate{voxel.frame.getOrigin() + Eigen::Vector3d::UnitY() * bump});
      voxel.fate = VoxelFate::Kept;
      return;
    }

    const Eigen::Vector3d away = toVoxel.norm() > kGeometryEpsilon
                                   ? Eigen::Vector3d{toVoxel.normalized()}
                                   : Eigen::Vector3d::UnitY();
    voxel.fate = VoxelFate::Puppet;
    voxel.anchored = false;
    voxel.linearVelocity =
      Velocity{away * (kWallMinSpeed + unit(rng) * kWallSpeedRange)};
  };
}

void registerBuiltinEffects(EffectRegistry& registry,
                            const DirtyGroupRegistry& groups,
                            uint32_t seed)
{
  registry.registerEffect(std::string{kDefaultEffectName}, &defaultEffect);
  registry.registerEffect(std::string{kRoughName}, makeRough(seed));
  registry.registerEffect(std::string{kMapVoxelSpaceName}, &mapVoxelSpace);
  registry.registerEffect(std::string{kBumpyFloorBreakWallsName},
                          makeBumpyFloorBreakWalls(groups, seed));
}

}  // namespace shatter_sim::BuiltinEffects
