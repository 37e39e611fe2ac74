// Ticket: 0005_scene_collaborator
// Test: WorldScene attachment, region queries and motion

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "shatter-sim/src/Environment/WorldScene.hpp"

namespace shatter_sim
{
namespace test
{

namespace
{

Aabb regionAround(const Coordinate& centre, double halfSize)
{
  return Aabb{Coordinate{centre - Vector3D::uniform(halfSize)},
              Coordinate{centre + Vector3D::uniform(halfSize)}};
}

}  // namespace

TEST(WorldSceneTest, Constructor_RejectsNegativeDamping)
{
  EXPECT_THROW(WorldScene{-1.0}, std::invalid_argument);
}

TEST(WorldSceneTest, AddBox_AssignsIdsAndAttaches)
{
  WorldScene scene;
  const auto a = scene.addBox(Coordinate{0, 0, 0}, Vector3D{1, 1, 1}, {"Wall"});
  const auto b = scene.addBox(Coordinate{5, 0, 0}, Vector3D{1, 1, 1});

  EXPECT_NE(a, kInvalidObjectId);
  EXPECT_LT(a, b);
  EXPECT_TRUE(scene.isAttached(a));
  EXPECT_TRUE(scene.find(a)->get().hasTag("Wall"));
  EXPECT_EQ(scene.objectCount(), 2u);
  EXPECT_EQ(scene.attachedIds(), (std::vector<SolidObjectId>{a, b}));
}

TEST(WorldSceneTest, Detach_KeepsObjectButHidesItFromQueries)
{
  WorldScene scene;
  const auto id = scene.addBox(Coordinate{0, 0, 0}, Vector3D{2, 2, 2});

  EXPECT_TRUE(scene.detach(id));

  EXPECT_TRUE(scene.find(id).has_value());
  EXPECT_FALSE(scene.isAttached(id));
  EXPECT_TRUE(scene.queryRegion(regionAround(Coordinate{0, 0, 0}, 5.0), {}).empty());
  EXPECT_EQ(scene.attachedCount(), 0u);

  EXPECT_TRUE(scene.attach(id));
  EXPECT_EQ(scene.queryRegion(regionAround(Coordinate{0, 0, 0}, 5.0), {}),
            std::vector<SolidObjectId>{id});
}

TEST(WorldSceneTest, QueryRegion_FiltersByTagAndOverlap)
{
  WorldScene scene;
  const auto wall = scene.addBox(Coordinate{0, 0, 0}, Vector3D{2, 2, 2}, {"Wall"});
  const auto floor = scene.addBox(Coordinate{0, -3, 0}, Vector3D{2, 2, 2}, {"Floor"});
  scene.addBox(Coordinate{50, 0, 0}, Vector3D{2, 2, 2}, {"Wall"});

  const Aabb region = regionAround(Coordinate{0, -1.5, 0}, 3.0);

  EXPECT_EQ(scene.queryRegion(region, {}), (std::vector<SolidObjectId>{wall, floor}));
  EXPECT_EQ(scene.queryRegion(region, {"Floor"}), std::vector<SolidObjectId>{floor});
  EXPECT_EQ(scene.queryRegion(region, {"Floor", "Wall"}),
            (std::vector<SolidObjectId>{wall, floor}));
  EXPECT_TRUE(scene.queryRegion(region, {"Roof"}).empty());
}

TEST(WorldSceneTest, UnknownIds_ReturnFalse)
{
  WorldScene scene;

  EXPECT_FALSE(scene.find(42).has_value());
  EXPECT_FALSE(scene.detach(42));
  EXPECT_FALSE(scene.attach(42));
  EXPECT_FALSE(scene.removeObject(42));
  EXPECT_FALSE(scene.setAnchored(42, false));
  EXPECT_FALSE(scene.getBodyState(42).has_value());
}

TEST(WorldSceneTest, Advance_MovesOnlyUnanchoredAttachedObjects)
{
  WorldScene scene;
  const auto anchored = scene.addBox(Coordinate{0, 0, 0}, Vector3D{1, 1, 1});
  const auto falling = scene.addBox(Coordinate{10, 0, 0}, Vector3D{1, 1, 1});
  scene.setVelocity(anchored, Velocity{1, 0, 0}, Vector3D{0, 0, 0});
  scene.setAnchored(falling, false);
  scene.setVelocity(falling, Velocity{0, -2, 0}, Vector3D{0, 0, 0});

  scene.advance(0.5);

  EXPECT_DOUBLE_EQ(scene.find(anchored)->get().frame().getOrigin().x(), 0.0);
  const auto state = scene.getBodyState(falling);
  ASSERT_TRUE(state.has_value());
  EXPECT_DOUBLE_EQ(state->frame.getOrigin().y(), -1.0);
  EXPECT_DOUBLE_EQ(state->linearVelocity.y(), -2.0);
}

TEST(WorldSceneTest, Advance_AppliesDampingAndSpin)
{
  WorldScene scene{1.0};
  const auto id = scene.addBox(Coordinate{0, 0, 0}, Vector3D{1, 1, 1});
  scene.setAnchored(id, false);
  scene.setVelocity(id, Velocity{1, 0, 0}, Vector3D{0, 0, 1});

  scene.advance(1.0);

  const auto state = scene.getBodyState(id);
  ASSERT_TRUE(state.has_value());
  EXPECT_NEAR(state->linearVelocity.x(), std::exp(-1.0), 1e-12);
  EXPECT_NEAR(state->angularVelocity.z(), std::exp(-1.0), 1e-12);
  // Rotated one radian about +Z
  EXPECT_NEAR(state->frame.axis(0).y(), std::sin(1.0), 1e-9);
}

TEST(WorldSceneTest, SetAnchored_ZeroesVelocity)
{
  WorldScene scene;
  const auto id = scene.addBox(Coordinate{0, 0, 0}, Vector3D{1, 1, 1});
  scene.setAnchored(id, false);
  scene.setVelocity(id, Velocity{3, 0, 0}, Vector3D{0, 1, 0});

  scene.setAnchored(id, true);

  const auto state = scene.getBodyState(id);
  ASSERT_TRUE(state.has_value());
  EXPECT_DOUBLE_EQ(state->linearVelocity.norm(), 0.0);
  EXPECT_DOUBLE_EQ(state->angularVelocity.norm(), 0.0);
}

TEST(WorldSceneTest, CreateObject_Detached)
{
  WorldScene scene;
  SolidObject spec;
  spec.shape = OrientedShape{ShapeKind::Ball, ReferenceFrame{}, Vector3D{2, 2, 2}};
  spec.divisible = false;

  const auto id = scene.createObject(spec, false);

  ASSERT_TRUE(scene.find(id).has_value());
  EXPECT_EQ(scene.find(id)->get().id, id);
  EXPECT_FALSE(scene.find(id)->get().divisible);
  EXPECT_FALSE(scene.isAttached(id));
  EXPECT_TRUE(scene.removeObject(id));
  EXPECT_EQ(scene.objectCount(), 0u);
}

}  // namespace test
}  // namespace shatter_sim
