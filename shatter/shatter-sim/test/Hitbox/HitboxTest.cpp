// Ticket: 0013_hitbox
// Test: Hitbox continuous destruction, welding and imaginary results

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "shatter-sim/src/DestructionWorld.hpp"
#include "shatter-sim/src/Environment/WorldScene.hpp"

namespace shatter_sim
{
namespace test
{

using std::chrono::milliseconds;

class HitboxTest : public ::testing::Test
{
protected:
  HitboxTest()
    : wall_{scene_.addBox(Coordinate{0, 0, 0}, Vector3D::uniform(10.0))},
      world_{scene_, makeSettings()}
  {
  }

  static Settings makeSettings()
  {
    Settings settings;
    settings.defaultGridSize = 2.0;
    settings.useGreedyMeshing = false;
    return settings;
  }

  /// Hitbox whose cut covers the wall; every completed job bumps completions_
  Hitbox& coveringHitbox()
  {
    Hitbox& hitbox = world_.createHitbox(
      OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D::uniform(12.0)});
    hitbox.config().params.onDestructCompleted =
      [this](size_t, const std::set<DirtyGroupId>&) { ++completions_; };
    return hitbox;
  }

  static OrientedShape unitBox()
  {
    return OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D::uniform(1.0)};
  }

  WorldScene scene_;
  SolidObjectId wall_;
  DestructionWorld world_;
  int completions_{0};
};

// ========== Lifecycle ==========

TEST_F(HitboxTest, CreateFindDestroy)
{
  Hitbox& first = world_.createHitbox(unitBox());
  Hitbox& second = world_.createHitbox(unitBox());
  const HitboxId firstId = first.id();

  EXPECT_NE(firstId, second.id());
  ASSERT_TRUE(world_.findHitbox(firstId).has_value());
  EXPECT_EQ(&world_.findHitbox(firstId)->get(), &first);

  EXPECT_TRUE(world_.destroyHitbox(firstId));
  EXPECT_FALSE(world_.findHitbox(firstId).has_value());
  EXPECT_FALSE(world_.destroyHitbox(firstId));
}

TEST_F(HitboxTest, CreateHitbox_InvalidShape_Throws)
{
  const OrientedShape flat{ShapeKind::Box, ReferenceFrame{}, Vector3D{0, 1, 1}};

  EXPECT_THROW(world_.createHitbox(flat), std::invalid_argument);

  Hitbox& hitbox = world_.createHitbox(unitBox());
  EXPECT_EQ(hitbox.id(), 1u);
  EXPECT_FALSE(world_.findHitbox(2).has_value());
}

TEST_F(HitboxTest, DestroyedHitbox_RejectsRequests)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.start();
  hitbox.markDestroyed();

  EXPECT_FALSE(hitbox.isRunning());
  EXPECT_TRUE(hitbox.isDestroyed());
  EXPECT_THROW(hitbox.destroy(), std::runtime_error);
  EXPECT_THROW(hitbox.imaginaryVoxels(), std::runtime_error);
  EXPECT_THROW(hitbox.start(), std::runtime_error);
}

// ========== One-shot requests ==========

TEST_F(HitboxTest, Destroy_SubmitsJobWithCurrentCut)
{
  Hitbox& hitbox = coveringHitbox();
  const JobId id = hitbox.destroy();

  world_.tick(milliseconds{0});

  EXPECT_EQ(world_.scheduler().jobState(id), std::optional{JobState::Completed});
  EXPECT_EQ(completions_, 1);
  EXPECT_FALSE(scene_.isAttached(wall_));
}

TEST_F(HitboxTest, SetShape_InvalidShape_KeepsPrevious)
{
  Hitbox& hitbox = coveringHitbox();

  EXPECT_THROW(
    hitbox.setShape(OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D{0, 1, 1}}),
    std::invalid_argument);
  EXPECT_NEAR(hitbox.shape().extent.x(), 12.0, 1e-12);

  hitbox.destroy();
  world_.tick(milliseconds{0});
  EXPECT_EQ(completions_, 1);
}

TEST_F(HitboxTest, Destroy_InvalidParams_Throws)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.config().params.gridSize = -1.0;

  EXPECT_THROW(hitbox.destroy(), std::invalid_argument);
  EXPECT_THROW(hitbox.start(), std::invalid_argument);
  EXPECT_FALSE(hitbox.isRunning());
}

// ========== Continuous destruction ==========

TEST_F(HitboxTest, Start_FiresEveryTickWithZeroDelay)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.start();

  world_.tick(milliseconds{0});
  world_.tick(milliseconds{16});
  world_.tick(milliseconds{32});

  EXPECT_EQ(completions_, 3);
  EXPECT_FALSE(scene_.isAttached(wall_));
}

TEST_F(HitboxTest, Start_HonoursDestructDelay)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.config().destructDelay = 1.0;
  hitbox.start();

  world_.tick(milliseconds{0});
  world_.tick(milliseconds{500});
  world_.tick(milliseconds{1000});
  world_.tick(milliseconds{1500});

  EXPECT_EQ(completions_, 2);

  hitbox.stop();
  world_.tick(milliseconds{2500});
  EXPECT_EQ(completions_, 2);
}

TEST_F(HitboxTest, Running_InvalidParams_StopsHitboxOnly)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.start();
  hitbox.config().params.gridSize = -1.0;

  DestructionParams other{};
  other.cuttingShape =
    OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D::uniform(12.0)};
  const JobId otherJob = world_.destroy(other);

  EXPECT_NO_THROW(world_.tick(milliseconds{0}));

  EXPECT_FALSE(hitbox.isRunning());
  EXPECT_EQ(world_.scheduler().jobState(otherJob), std::optional{JobState::Completed});
  EXPECT_FALSE(scene_.isAttached(wall_));
}

TEST_F(HitboxTest, CompletionCallback_MayDestroyHitbox)
{
  Hitbox& hitbox = world_.createHitbox(
    OrientedShape{ShapeKind::Box, ReferenceFrame{}, Vector3D::uniform(12.0)});
  const HitboxId id = hitbox.id();
  hitbox.config().params.onDestructCompleted =
    [this, id](size_t, const std::set<DirtyGroupId>&)
  {
    ++completions_;
    world_.destroyHitbox(id);
  };
  hitbox.start();

  world_.tick(milliseconds{0});
  EXPECT_FALSE(world_.findHitbox(id).has_value());

  world_.tick(milliseconds{16});
  EXPECT_EQ(completions_, 1);
}

TEST_F(HitboxTest, ImaginaryHitbox_DeliversResultsThroughCallback)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.config().type = HitboxType::Imaginary;
  std::vector<size_t> deliveries;
  hitbox.config().imaginaryCallback = [&deliveries](const ImaginaryResult& result)
  { deliveries.push_back(result.voxels.size()); };
  hitbox.start();

  world_.tick(milliseconds{0});
  hitbox.stop();

  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries[0], 125u);
  EXPECT_EQ(hitbox.pendingResultCount(), 0u);
  EXPECT_EQ(completions_, 0);
}

TEST_F(HitboxTest, ImaginaryHitbox_ClearedQueueDropsResult)
{
  Hitbox& hitbox = coveringHitbox();
  hitbox.config().type = HitboxType::Imaginary;
  int deliveries = 0;
  hitbox.config().imaginaryCallback = [&deliveries](const ImaginaryResult&)
  { ++deliveries; };

  auto future = hitbox.imaginaryVoxels();
  world_.clearQueue();
  world_.tick(milliseconds{0});

  EXPECT_THROW(future.get(), JobCancelledError);
  EXPECT_EQ(deliveries, 0);
  EXPECT_TRUE(scene_.isAttached(wall_));
}

TEST_F(HitboxTest, ImaginaryCallback_MayDestroyOwnHitbox)
{
  Hitbox& hitbox = coveringHitbox();
  const HitboxId id = hitbox.id();
  const HitboxId otherId = coveringHitbox().id();
  hitbox.config().type = HitboxType::Imaginary;
  int deliveries = 0;
  hitbox.config().imaginaryCallback = [this, id, &deliveries](const ImaginaryResult&)
  {
    ++deliveries;
    EXPECT_TRUE(world_.destroyHitbox(id));
    EXPECT_FALSE(world_.destroyHitbox(id));
  };
  hitbox.start();

  EXPECT_NO_THROW(world_.tick(milliseconds{0}));
  EXPECT_EQ(deliveries, 1);
  EXPECT_FALSE(world_.findHitbox(id).has_value());
  EXPECT_TRUE(world_.findHitbox(otherId).has_value());

  EXPECT_NO_THROW(world_.tick(milliseconds{16}));
  EXPECT_EQ(deliveries, 1);
  EXPECT_TRUE(scene_.isAttached(wall_));
}

// ========== Welding ==========

class HitboxWeldTest : public HitboxTest
{
protected:
  void SetUp() override
  {
    car_ = scene_.addBox(Coordinate{-40, 0, 0}, Vector3D::uniform(1.0));
    scene_.setAnchored(car_, false);
    scene_.setVelocity(car_, Velocity{2.0, 0.0, 0.0}, Vector3D{0.0, 0.0, 0.0});
  }

  Hitbox& hitboxAheadOfCar()
  {
    return world_.createHitbox(OrientedShape{
      ShapeKind::Ball, ReferenceFrame{Coordinate{-35, 0, 0}}, Vector3D::uniform(2.0)});
  }

  SolidObjectId car_{kInvalidObjectId};
};

TEST_F(HitboxWeldTest, WeldTo_UnknownObject_Throws)
{
  Hitbox& hitbox = hitboxAheadOfCar();

  EXPECT_THROW(hitbox.weldTo(9999), std::invalid_argument);
  EXPECT_FALSE(hitbox.weldTarget().has_value());
}

TEST_F(HitboxWeldTest, Welded_FollowsTargetKeepingOffset)
{
  Hitbox& hitbox = hitboxAheadOfCar();
  hitbox.weldTo(car_);
  EXPECT_EQ(hitbox.weldTarget(), std::optional<SolidObjectId>{car_});

  scene_.advance(1.0);
  world_.tick(milliseconds{1000});

  const Coordinate& origin = hitbox.shape().frame.getOrigin();
  EXPECT_NEAR(origin.x(), -33.0, 1e-9);
  EXPECT_NEAR(origin.y(), 0.0, 1e-9);
}

TEST_F(HitboxWeldTest, VelocityPrediction_PushesCutAhead)
{
  Hitbox& hitbox = hitboxAheadOfCar();
  hitbox.config().velocityPrediction = true;
  hitbox.config().velocityBias = 0.5;
  hitbox.weldTo(car_);

  world_.tick(milliseconds{0});
  scene_.advance(1.0);
  world_.tick(milliseconds{1000});

  // Car at -38, offset +5, plus velocity 2 * dt 1 * bias 0.5
  EXPECT_NEAR(hitbox.shape().frame.getOrigin().x(), -32.0, 1e-9);
}

TEST_F(HitboxWeldTest, Unweld_StopsFollowing)
{
  Hitbox& hitbox = hitboxAheadOfCar();
  hitbox.weldTo(car_);
  hitbox.unweld();
  EXPECT_FALSE(hitbox.weldTarget().has_value());

  scene_.advance(1.0);
  world_.tick(milliseconds{1000});

  EXPECT_NEAR(hitbox.shape().frame.getOrigin().x(), -35.0, 1e-9);
}

TEST_F(HitboxWeldTest, RemovedTarget_Unwelds)
{
  Hitbox& hitbox = hitboxAheadOfCar();
  hitbox.weldTo(car_);
  scene_.removeObject(car_);

  world_.tick(milliseconds{0});

  EXPECT_FALSE(hitbox.weldTarget().has_value());
  EXPECT_NEAR(hitbox.shape().frame.getOrigin().x(), -35.0, 1e-9);
}

}  // namespace test
}  // namespace shatter_sim
