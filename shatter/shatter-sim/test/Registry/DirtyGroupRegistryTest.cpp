// Ticket: 0007_dirty_group_registry
// Test: DirtyGroupRegistry provenance bookkeeping

#include <gtest/gtest.h>

#include "shatter-sim/src/Environment/WorldScene.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"

namespace shatter_sim
{
namespace test
{

class DirtyGroupRegistryTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    wall_ = scene_.addBox(Coordinate{0, 0, 0}, Vector3D{4, 2, 2});
    pillar_ = scene_.addBox(Coordinate{20, 0, 0}, Vector3D{1, 4, 1});
  }

  /// Split the wall into two halves registered as live voxels
  std::pair<SolidObjectId, SolidObjectId> splitWall()
  {
    const auto result = registry_.capture(wall_, scene_);
    EXPECT_EQ(result.status, CaptureStatus::Captured);

    const SolidObjectId left = scene_.addBox(Coordinate{-1, 0, 0}, Vector3D{2, 2, 2});
    const SolidObjectId right = scene_.addBox(Coordinate{1, 0, 0}, Vector3D{2, 2, 2});
    EXPECT_TRUE(registry_.addVoxel(wall_, left));
    EXPECT_TRUE(registry_.addVoxel(wall_, right));
    return {left, right};
  }

  WorldScene scene_;
  DirtyGroupRegistry registry_;
  SolidObjectId wall_{kInvalidObjectId};
  SolidObjectId pillar_{kInvalidObjectId};
};

// ========== Capture ==========

TEST_F(DirtyGroupRegistryTest, Capture_DetachesOriginalAndCopiesIt)
{
  const auto result = registry_.capture(wall_, scene_);

  EXPECT_EQ(result.status, CaptureStatus::Captured);
  EXPECT_EQ(result.groupId, wall_);
  EXPECT_FALSE(scene_.isAttached(wall_));
  ASSERT_TRUE(registry_.getOriginalPart(wall_).has_value());
  EXPECT_NEAR(registry_.getOriginalPart(wall_)->get().extent().x(), 4.0, 1e-12);
}

TEST_F(DirtyGroupRegistryTest, Capture_IsIdempotent)
{
  registry_.capture(wall_, scene_);
  const auto again = registry_.capture(wall_, scene_);

  EXPECT_EQ(again.status, CaptureStatus::Existing);
  EXPECT_EQ(again.groupId, wall_);
  EXPECT_EQ(registry_.groupCount(), 1u);
}

TEST_F(DirtyGroupRegistryTest, Capture_LiveBlockResolvesToItsGroup)
{
  const auto [left, right] = splitWall();

  const auto result = registry_.capture(left, scene_);
  EXPECT_EQ(result.status, CaptureStatus::Existing);
  EXPECT_EQ(result.groupId, wall_);
  EXPECT_TRUE(scene_.isAttached(left));
}

TEST_F(DirtyGroupRegistryTest, Capture_LockedBlockConflicts)
{
  const auto [left, right] = splitWall();
  registry_.lockVoxels({left});

  EXPECT_EQ(registry_.capture(left, scene_).status, CaptureStatus::Conflict);
  EXPECT_EQ(registry_.capture(right, scene_).status, CaptureStatus::Existing);

  registry_.unlockVoxels({left});
  EXPECT_EQ(registry_.capture(left, scene_).status, CaptureStatus::Existing);
}

TEST_F(DirtyGroupRegistryTest, Capture_UnknownObject)
{
  EXPECT_EQ(registry_.capture(999, scene_).status, CaptureStatus::Unknown);
  EXPECT_EQ(registry_.groupCount(), 0u);
}

// ========== Voxel sets ==========

TEST_F(DirtyGroupRegistryTest, AddVoxel_UnknownGroupFails)
{
  EXPECT_FALSE(registry_.addVoxel(12345, pillar_));
  EXPECT_FALSE(registry_.groupOfBlock(pillar_).has_value());
}

TEST_F(DirtyGroupRegistryTest, ReplaceVoxels_SwapsAtomically)
{
  const auto [left, right] = splitWall();
  const SolidObjectId merged = scene_.addBox(Coordinate{0, 0, 0}, Vector3D{4, 2, 2});

  registry_.replaceVoxels(wall_, {left, right}, {merged});

  EXPECT_FALSE(registry_.groupOfBlock(left).has_value());
  EXPECT_EQ(registry_.groupOfBlock(merged), wall_);
  EXPECT_EQ(registry_.liveVoxelCount(), 1u);
}

TEST_F(DirtyGroupRegistryTest, ReplaceVoxels_InvalidRequestChangesNothing)
{
  const auto [left, right] = splitWall();
  const SolidObjectId extra = scene_.addBox(Coordinate{0, 5, 0}, Vector3D{1, 1, 1});

  // pillar_ is not live in the group
  EXPECT_THROW(registry_.replaceVoxels(wall_, {left, pillar_}, {extra}),
               std::invalid_argument);
  EXPECT_EQ(registry_.groupOfBlock(left), wall_);
  EXPECT_FALSE(registry_.groupOfBlock(extra).has_value());

  // right already belongs to the group and is not being removed
  EXPECT_THROW(registry_.replaceVoxels(wall_, {left}, {right}),
               std::invalid_argument);
  EXPECT_EQ(registry_.liveVoxelCount(), 2u);

  EXPECT_THROW(registry_.replaceVoxels(777, {}, {extra}), std::invalid_argument);
}

TEST_F(DirtyGroupRegistryTest, ReplaceVoxels_ReleasesLocksOfRemovedBlocks)
{
  const auto [left, right] = splitWall();
  registry_.lockVoxels({left, right});

  registry_.replaceVoxels(wall_, {left}, {});

  EXPECT_FALSE(registry_.isLocked(left));
  EXPECT_TRUE(registry_.isLocked(right));
}

TEST_F(DirtyGroupRegistryTest, Debris_TrackedPerGroup)
{
  registry_.capture(wall_, scene_);
  const SolidObjectId chunk = scene_.addBox(Coordinate{0, 3, 0}, Vector3D{1, 1, 1});

  EXPECT_TRUE(registry_.addDebris(wall_, chunk));
  EXPECT_EQ(registry_.groupOfDebris(chunk), wall_);
  EXPECT_TRUE(registry_.removeDebris(chunk));
  EXPECT_FALSE(registry_.removeDebris(chunk));
  EXPECT_FALSE(registry_.addDebris(4242, chunk));
}

TEST_F(DirtyGroupRegistryTest, RestoreIfEmpty_ReattachesOriginal)
{
  const auto [left, right] = splitWall();
  EXPECT_FALSE(registry_.restoreIfEmpty(wall_, scene_));

  EXPECT_TRUE(registry_.removeVoxel(wall_, left));
  EXPECT_TRUE(registry_.removeVoxel(wall_, right));
  EXPECT_TRUE(registry_.restoreIfEmpty(wall_, scene_));

  EXPECT_TRUE(scene_.isAttached(wall_));
  EXPECT_FALSE(registry_.hasGroup(wall_));
}

// ========== resetArea ==========

TEST_F(DirtyGroupRegistryTest, CaptureThenResetArea_RestoresScene)
{
  const auto before = scene_.attachedIds();
  const auto [left, right] = splitWall();

  const OrientedShape area{ShapeKind::Box, ReferenceFrame{}, Vector3D{10, 10, 10}};
  EXPECT_EQ(registry_.resetArea(area, scene_), 1u);

  EXPECT_EQ(scene_.attachedIds(), before);
  EXPECT_FALSE(scene_.find(left).has_value());
  EXPECT_FALSE(scene_.find(right).has_value());
  EXPECT_EQ(registry_.groupCount(), 0u);
}

TEST_F(DirtyGroupRegistryTest, ResetArea_PartialOverlapKeepsGroupSplit)
{
  const auto [left, right] = splitWall();

  const OrientedShape area{
    ShapeKind::Box, ReferenceFrame{Coordinate{-1.5, 0, 0}}, Vector3D{1, 1, 1}};
  EXPECT_EQ(registry_.resetArea(area, scene_), 0u);

  EXPECT_FALSE(scene_.find(left).has_value());
  EXPECT_TRUE(scene_.isAttached(right));
  EXPECT_TRUE(registry_.hasGroup(wall_));
  EXPECT_FALSE(scene_.isAttached(wall_));
}

TEST_F(DirtyGroupRegistryTest, ResetArea_FarRegionIsNoOp)
{
  splitWall();
  const OrientedShape area{
    ShapeKind::Box, ReferenceFrame{Coordinate{100, 0, 0}}, Vector3D{1, 1, 1}};

  EXPECT_EQ(registry_.resetArea(area, scene_), 0u);
  EXPECT_EQ(registry_.liveVoxelCount(), 2u);
}

// ========== reset ==========

TEST_F(DirtyGroupRegistryTest, Reset_IsIdempotent)
{
  const auto [left, right] = splitWall();
  registry_.capture(pillar_, scene_);
  const SolidObjectId chunk = scene_.addBox(Coordinate{0, 3, 0}, Vector3D{1, 1, 1});
  registry_.addDebris(wall_, chunk);

  registry_.reset(true, scene_);
  const auto onceIds = scene_.attachedIds();
  const size_t onceCount = scene_.objectCount();

  registry_.reset(true, scene_);
  EXPECT_EQ(scene_.attachedIds(), onceIds);
  EXPECT_EQ(scene_.objectCount(), onceCount);

  EXPECT_EQ(onceIds, (std::vector<SolidObjectId>{wall_, pillar_}));
  EXPECT_EQ(registry_.groupCount(), 0u);
  EXPECT_EQ(registry_.debrisCount(), 0u);
}

TEST_F(DirtyGroupRegistryTest, Reset_OwnershipRevertIsOptional)
{
  registry_.capture(wall_, scene_);
  registry_.assignOwnership(wall_, 3);

  registry_.reset(false, scene_);
  EXPECT_EQ(registry_.getOwnership(wall_), 3u);

  registry_.reset(true, scene_);
  EXPECT_FALSE(registry_.getOwnership(wall_).has_value());
}

TEST_F(DirtyGroupRegistryTest, Reset_RecreatesRemovedOriginal)
{
  registry_.capture(wall_, scene_);
  scene_.removeObject(wall_);

  registry_.reset(true, scene_);
  EXPECT_EQ(scene_.attachedCount(), 2u);
}

}  // namespace test
}  // namespace shatter_sim
