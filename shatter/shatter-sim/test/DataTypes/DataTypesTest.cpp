// Ticket: 0002_core_datatypes
// Test: record conversion and formatting of the core value types

#include <gtest/gtest.h>

#include <cmath>
#include <format>
#include <numbers>

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Quaternion.hpp"
#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/DataTypes/Velocity.hpp"

namespace shatter_sim
{
namespace test
{

// ========== Records ==========

TEST(DataTypesTest, CoordinateRecordCarriesComponents)
{
  const Coordinate position{1.5, -2.0, 3.25};
  const auto record = position.toRecord();

  EXPECT_DOUBLE_EQ(record.x, 1.5);
  EXPECT_DOUBLE_EQ(record.y, -2.0);
  EXPECT_DOUBLE_EQ(record.z, 3.25);
  EXPECT_TRUE(Coordinate::fromRecord(record).isApprox(position));
}

TEST(DataTypesTest, DefaultRecordIsNaN)
{
  const shatter_transfer::CoordinateRecord record;
  const Coordinate restored = Coordinate::fromRecord(record);

  EXPECT_TRUE(std::isnan(restored.x()));
  EXPECT_TRUE(std::isnan(restored.y()));
  EXPECT_TRUE(std::isnan(restored.z()));
}

TEST(DataTypesTest, QuaternionRecordUsesHamiltonOrder)
{
  const QuaternionD orientation{0.5, 0.5, -0.5, 0.5};
  const auto record = orientation.toRecord();

  EXPECT_DOUBLE_EQ(record.w, 0.5);
  EXPECT_DOUBLE_EQ(record.x, 0.5);
  EXPECT_DOUBLE_EQ(record.y, -0.5);
  EXPECT_DOUBLE_EQ(record.z, 0.5);

  const QuaternionD restored = QuaternionD::fromRecord(record);
  EXPECT_DOUBLE_EQ(restored.w(), 0.5);
  EXPECT_DOUBLE_EQ(restored.y(), -0.5);
}

TEST(DataTypesTest, VelocityRecordCarriesComponents)
{
  const Velocity velocity{0.0, -9.81, 4.0};
  const auto record = velocity.toRecord();

  EXPECT_DOUBLE_EQ(record.y, -9.81);
  EXPECT_DOUBLE_EQ(record.z, 4.0);
}

// ========== Quaternion helpers ==========

TEST(DataTypesTest, SlerpHalfwayBetweenIdentityAndQuarterTurn)
{
  const QuaternionD identity;
  const QuaternionD quarter =
    QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitZ(), std::numbers::pi / 2.0);

  const QuaternionD half = identity.slerp(0.5, quarter);
  const QuaternionD expected =
    QuaternionD::fromAxisAngle(Eigen::Vector3d::UnitZ(), std::numbers::pi / 4.0);

  EXPECT_NEAR(half.w(), expected.w(), 1e-12);
  EXPECT_NEAR(half.z(), expected.z(), 1e-12);
  EXPECT_NEAR(half.norm(), 1.0, 1e-12);
}

TEST(DataTypesTest, FromAxisAngleNormalizesAxis)
{
  const QuaternionD q =
    QuaternionD::fromAxisAngle(Eigen::Vector3d{0.0, 0.0, 10.0}, std::numbers::pi);

  EXPECT_NEAR(q.w(), 0.0, 1e-12);
  EXPECT_NEAR(q.z(), 1.0, 1e-12);
}

// ========== Formatting ==========

TEST(DataTypesTest, DefaultFormatUsesSixDecimals)
{
  EXPECT_EQ(std::format("{}", Coordinate{1.0, 2.5, -3.0}),
            "(1.000000, 2.500000, -3.000000)");
}

TEST(DataTypesTest, FormatHonoursPrecisionAndWidth)
{
  EXPECT_EQ(std::format("{:.2f}", Vector3D{1.0, 2.0, 3.0}), "(1.00, 2.00, 3.00)");
  EXPECT_EQ(std::format("{:6.1f}", Velocity{1.0, -2.0, 0.5}),
            "(   1.0,   -2.0,    0.5)");
}

TEST(DataTypesTest, QuaternionFormatsFourComponents)
{
  EXPECT_EQ(std::format("{:.1f}", QuaternionD{}), "(1.0, 0.0, 0.0, 0.0)");
}

}  // namespace test
}  // namespace shatter_sim
