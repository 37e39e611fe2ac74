// Ticket: 0003_reference_frame
// Test: ReferenceFrame transforms, composition and validity

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Utils/utils.hpp"

namespace shatter_sim
{
namespace test
{

namespace
{

bool coordinatesEqual(const Coordinate& c1,
                      const Coordinate& c2,
                      double tolerance = 1e-9)
{
  return almostEqual(c1.x(), c2.x(), tolerance) &&
         almostEqual(c1.y(), c2.y(), tolerance) &&
         almostEqual(c1.z(), c2.z(), tolerance);
}

/// 90 degrees about +Z: local X maps to global Y
QuaternionD quarterYaw()
{
  return QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitZ(), std::numbers::pi / 2.0);
}

}  // namespace

// ========== Constructors ==========

TEST(ReferenceFrameTest, DefaultConstructor_IsIdentity)
{
  const ReferenceFrame frame;

  EXPECT_TRUE(coordinatesEqual(frame.getOrigin(), Coordinate{0, 0, 0}));
  EXPECT_TRUE(frame.getRotation().isApprox(Eigen::Matrix3d::Identity()));
  EXPECT_TRUE(frame.isValid());
}

TEST(ReferenceFrameTest, ConstructorWithOrientation_NormalizesQuaternion)
{
  const ReferenceFrame frame{Coordinate{1, 2, 3}, QuaternionD{2.0, 0.0, 0.0, 0.0}};

  EXPECT_NEAR(frame.getOrientation().norm(), 1.0, 1e-12);
  EXPECT_TRUE(frame.getRotation().isApprox(Eigen::Matrix3d::Identity()));
}

// ========== Transforms ==========

TEST(ReferenceFrameTest, LocalToGlobal_RotatesThenTranslates)
{
  const ReferenceFrame frame{Coordinate{5, 0, 0}, quarterYaw()};

  const Coordinate global = frame.localToGlobal(Coordinate{1, 0, 0});

  EXPECT_TRUE(coordinatesEqual(global, Coordinate{5, 1, 0}));
}

TEST(ReferenceFrameTest, GlobalToLocal_InvertsLocalToGlobal)
{
  const ReferenceFrame frame{
    Coordinate{1, -2, 3},
    QuaternionD::fromAxisAngle(Eigen::Vector3d{1, 1, 0}, 0.7)};
  const Coordinate point{4, 5, 6};

  EXPECT_TRUE(coordinatesEqual(frame.localToGlobal(frame.globalToLocal(point)), point));
}

TEST(ReferenceFrameTest, RelativeTransforms_IgnoreOrigin)
{
  const ReferenceFrame frame{Coordinate{100, 100, 100}, quarterYaw()};

  const Vector3D global = frame.localToGlobalRelative(Vector3D{1, 0, 0});
  EXPECT_NEAR(global.x(), 0.0, 1e-12);
  EXPECT_NEAR(global.y(), 1.0, 1e-12);

  const Vector3D local = frame.globalToLocalRelative(global);
  EXPECT_NEAR(local.x(), 1.0, 1e-12);
  EXPECT_NEAR(local.y(), 0.0, 1e-12);
}

TEST(ReferenceFrameTest, BatchTransforms_MatchSinglePoints)
{
  const ReferenceFrame frame{Coordinate{1, 2, 3}, quarterYaw()};
  Eigen::Matrix3Xd points{3, 2};
  points.col(0) = Eigen::Vector3d{1, 0, 0};
  points.col(1) = Eigen::Vector3d{0, 2, 1};

  frame.localToGlobalBatch(points);
  EXPECT_TRUE(coordinatesEqual(Coordinate{points.col(0)},
                               frame.localToGlobal(Coordinate{1, 0, 0})));
  EXPECT_TRUE(coordinatesEqual(Coordinate{points.col(1)},
                               frame.localToGlobal(Coordinate{0, 2, 1})));

  frame.globalToLocalBatch(points);
  EXPECT_TRUE(coordinatesEqual(Coordinate{points.col(1)}, Coordinate{0, 2, 1}));
}

TEST(ReferenceFrameTest, Axis_ReturnsRotatedBasis)
{
  const ReferenceFrame frame{Coordinate{0, 0, 0}, quarterYaw()};

  EXPECT_TRUE(frame.axis(0).isApprox(Eigen::Vector3d::UnitY()));
  EXPECT_TRUE(frame.axis(2).isApprox(Eigen::Vector3d::UnitZ()));
}

// ========== Composition ==========

TEST(ReferenceFrameTest, Compose_PlacesChildInParent)
{
  const ReferenceFrame parent{Coordinate{10, 0, 0}, quarterYaw()};
  const ReferenceFrame child{Coordinate{2, 0, 0}};

  const ReferenceFrame composed = parent.compose(child);

  EXPECT_TRUE(coordinatesEqual(composed.getOrigin(), Coordinate{10, 2, 0}));
  EXPECT_TRUE(composed.axis(0).isApprox(Eigen::Vector3d::UnitY()));
}

TEST(ReferenceFrameTest, RelativeTo_IsInverseOfCompose)
{
  const ReferenceFrame parent{
    Coordinate{3, 1, -2},
    QuaternionD::fromAxisAngle(Eigen::Vector3d{0, 1, 1}, 1.1)};
  const ReferenceFrame other{
    Coordinate{-4, 6, 0},
    QuaternionD::fromAxisAngle(Eigen::Vector3d{1, 0, 0}, -0.3)};

  const ReferenceFrame roundTrip = parent.compose(parent.relativeTo(other));

  EXPECT_TRUE(coordinatesEqual(roundTrip.getOrigin(), other.getOrigin()));
  EXPECT_TRUE(roundTrip.getRotation().isApprox(other.getRotation(), 1e-9));
}

// ========== Validity ==========

TEST(ReferenceFrameTest, IsValid_RejectsNonFiniteOrigin)
{
  ReferenceFrame frame;
  frame.setOrigin(Coordinate{std::numeric_limits<double>::infinity(), 0, 0});

  EXPECT_FALSE(frame.isValid());
}

TEST(ReferenceFrameTest, IsValid_RejectsDegenerateOrientation)
{
  ReferenceFrame frame;
  frame.setOrientation(QuaternionD{0.0, 0.0, 0.0, 0.0});

  EXPECT_FALSE(frame.isValid());
  EXPECT_TRUE(frame.getRotation().isApprox(Eigen::Matrix3d::Identity()));
}

}  // namespace test
}  // namespace shatter_sim
