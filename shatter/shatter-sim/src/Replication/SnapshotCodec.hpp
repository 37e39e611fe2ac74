// Ticket: 0012_puppet_replication

#ifndef SHATTER_SIM_REPLICATION_SNAPSHOT_CODEC_HPP
#define SHATTER_SIM_REPLICATION_SNAPSHOT_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Quaternion.hpp"
#include "shatter-sim/src/DataTypes/Velocity.hpp"
#include "shatter-sim/src/Replication/Puppet.hpp"

namespace shatter_sim
{

/**
 * @brief Full-precision puppet state at one instant
 */
struct PuppetSnapshot
{
  PuppetId puppetId{0};
  Coordinate position;
  QuaternionD orientation;
  Velocity linearVelocity;
  double timestamp{0.0};  // Server time [s]
  bool sleeping{false};
};

/**
 * @brief Quantized puppet state as sent on the wire
 */
struct EncodedSnapshot
{
  PuppetId puppetId{0};
  std::array<int32_t, 3> position{};  // 1/512 unit steps
  uint32_t orientation{0};            // Smallest-three, 2 + 3x10 bits
  std::array<int16_t, 3> velocity{};  // 1/64 unit/s steps, saturated
  uint32_t timestampMs{0};
  uint8_t flags{0};  // Bit 0: sleeping
};

/**
 * @brief Snapshots broadcast together at one replication instant
 */
struct SnapshotBatch
{
  double timestamp{0.0};  // [s]
  std::vector<EncodedSnapshot> snapshots;
};

/**
 * @brief Bandwidth-oriented quantization of puppet state
 *
 * @ticket 0012_puppet_replication
 */
namespace SnapshotCodec
{

/// Position steps per world unit
inline constexpr double kPositionScale = 512.0;

/// Velocity steps per unit/s
inline constexpr double kVelocityScale = 64.0;

/// Bits per stored quaternion component
inline constexpr int kOrientationBits = 10;

inline constexpr uint8_t kSleepingFlag = 0x01;

/// Bytes of one snapshot in a serialized batch
inline constexpr size_t kEncodedSnapshotBytes = 4 + 3 * 4 + 4 + 3 * 2 + 4 + 1;

/// Bytes of the serialized batch header (timestamp, count)
inline constexpr size_t kBatchHeaderBytes = 4 + 4;

/**
 * @brief Quantize a snapshot
 *
 * Positions outside the int32 range and velocities outside the int16 range
 * saturate.
 *
 * @throws std::invalid_argument if any value is not finite or the
 *         timestamp is negative
 */
EncodedSnapshot encode(const PuppetSnapshot& snapshot);

PuppetSnapshot decode(const EncodedSnapshot& encoded);

/**
 * @brief Smallest-three quaternion packing
 *
 * The largest-magnitude component is dropped (its sign forced positive) and
 * the remaining three, each within [-1/sqrt(2), 1/sqrt(2)], are stored in
 * 10 bits. The top 2 bits hold the index of the dropped component.
 */
uint32_t packOrientation(const QuaternionD& orientation);

QuaternionD unpackOrientation(uint32_t packed);

/// Little-endian byte stream for a transport
std::vector<uint8_t> serialize(const SnapshotBatch& batch);

/**
 * @throws std::runtime_error if bytes is truncated or has trailing data
 */
SnapshotBatch deserialize(std::span<const uint8_t> bytes);

}  // namespace SnapshotCodec

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REPLICATION_SNAPSHOT_CODEC_HPP
