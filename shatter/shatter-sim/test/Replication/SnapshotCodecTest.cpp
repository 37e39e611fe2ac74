// Ticket: 0012_puppet_replication
// Test: SnapshotCodec quantization and wire format

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "shatter-sim/src/Replication/SnapshotCodec.hpp"

namespace shatter_sim
{
namespace test
{

namespace
{

PuppetSnapshot sampleSnapshot()
{
  PuppetSnapshot snapshot{};
  snapshot.puppetId = 17;
  snapshot.position = Coordinate{12.345, -3.21, 100.5};
  snapshot.orientation =
    QuaternionD::fromAxisAngle(Eigen::Vector3d{0.3, 1.0, -0.2}.normalized(), 1.1);
  snapshot.linearVelocity = Velocity{4.2, -9.81, 0.125};
  snapshot.timestamp = 12.5;
  snapshot.sleeping = true;
  return snapshot;
}

/// Angle between two rotations [rad]
double rotationError(const QuaternionD& a, const QuaternionD& b)
{
  return a.eigen().angularDistance(b.eigen());
}

}  // namespace

TEST(SnapshotCodecTest, EncodeDecode_PreservesStateWithinQuantization)
{
  const PuppetSnapshot original = sampleSnapshot();
  const PuppetSnapshot decoded =
    SnapshotCodec::decode(SnapshotCodec::encode(original));

  EXPECT_EQ(decoded.puppetId, original.puppetId);
  EXPECT_LE((decoded.position - original.position).cwiseAbs().maxCoeff(),
            0.5 / SnapshotCodec::kPositionScale + 1e-12);
  EXPECT_LE((decoded.linearVelocity - original.linearVelocity).cwiseAbs().maxCoeff(),
            0.5 / SnapshotCodec::kVelocityScale + 1e-12);
  EXPECT_LT(rotationError(decoded.orientation, original.orientation), 0.01);
  EXPECT_DOUBLE_EQ(decoded.timestamp, 12.5);
  EXPECT_TRUE(decoded.sleeping);
}

TEST(SnapshotCodecTest, Encode_SaturatesVelocity)
{
  PuppetSnapshot snapshot = sampleSnapshot();
  snapshot.linearVelocity = Velocity{1.0e6, -1.0e6, 0.0};

  const EncodedSnapshot encoded = SnapshotCodec::encode(snapshot);
  EXPECT_EQ(encoded.velocity[0], std::numeric_limits<int16_t>::max());
  EXPECT_EQ(encoded.velocity[1], std::numeric_limits<int16_t>::min());
  EXPECT_EQ(encoded.velocity[2], 0);
}

TEST(SnapshotCodecTest, Encode_RejectsNonFiniteState)
{
  PuppetSnapshot snapshot = sampleSnapshot();
  snapshot.position.x() = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(SnapshotCodec::encode(snapshot), std::invalid_argument);

  snapshot = sampleSnapshot();
  snapshot.timestamp = -1.0;
  EXPECT_THROW(SnapshotCodec::encode(snapshot), std::invalid_argument);
}

TEST(SnapshotCodecTest, PackOrientation_QAndMinusQMatch)
{
  const QuaternionD q{0.2, -0.7, 0.1, 0.4};
  const QuaternionD minusQ{-0.2, 0.7, -0.1, -0.4};

  EXPECT_EQ(SnapshotCodec::packOrientation(q),
            SnapshotCodec::packOrientation(minusQ));
}

TEST(SnapshotCodecTest, UnpackOrientation_IdentityRoundTrip)
{
  const QuaternionD identity{};
  const QuaternionD unpacked =
    SnapshotCodec::unpackOrientation(SnapshotCodec::packOrientation(identity));
  EXPECT_LT(rotationError(unpacked, identity), 1e-2);
  EXPECT_NEAR(unpacked.eigen().norm(), 1.0, 1e-12);
}

TEST(SnapshotCodecTest, Serialize_FixedSizeLayout)
{
  SnapshotBatch batch{};
  batch.timestamp = 3.25;
  batch.snapshots.push_back(SnapshotCodec::encode(sampleSnapshot()));
  batch.snapshots.push_back(SnapshotCodec::encode(sampleSnapshot()));

  const auto bytes = SnapshotCodec::serialize(batch);
  ASSERT_EQ(bytes.size(),
            SnapshotCodec::kBatchHeaderBytes + 2 * SnapshotCodec::kEncodedSnapshotBytes);

  // Little-endian timestamp in milliseconds
  EXPECT_EQ(bytes[0], 3250 & 0xFF);
  EXPECT_EQ(bytes[1], (3250 >> 8) & 0xFF);

  const SnapshotBatch decoded = SnapshotCodec::deserialize(bytes);
  EXPECT_DOUBLE_EQ(decoded.timestamp, 3.25);
  ASSERT_EQ(decoded.snapshots.size(), 2u);
  EXPECT_EQ(decoded.snapshots[1].puppetId, 17u);
  EXPECT_EQ(decoded.snapshots[1].position, batch.snapshots[1].position);
  EXPECT_EQ(decoded.snapshots[1].velocity, batch.snapshots[1].velocity);
  EXPECT_EQ(decoded.snapshots[1].orientation, batch.snapshots[1].orientation);
  EXPECT_EQ(decoded.snapshots[1].flags, SnapshotCodec::kSleepingFlag);
}

TEST(SnapshotCodecTest, Deserialize_RejectsTruncatedBytes)
{
  SnapshotBatch batch{};
  batch.snapshots.push_back(SnapshotCodec::encode(sampleSnapshot()));
  auto bytes = SnapshotCodec::serialize(batch);

  bytes.pop_back();
  EXPECT_THROW(SnapshotCodec::deserialize(bytes), std::runtime_error);

  const std::vector<uint8_t> header{0, 0};
  EXPECT_THROW(SnapshotCodec::deserialize(header), std::runtime_error);
}

}  // namespace test
}  // namespace shatter_sim
