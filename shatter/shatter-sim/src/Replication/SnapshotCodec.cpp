// Ticket: 0012_puppet_replication

#include "shatter-sim/src/Replication/SnapshotCodec.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <type_traits>

namespace shatter_sim::SnapshotCodec
{

namespace
{

constexpr uint32_t kComponentMax = (1u << kOrientationBits) - 1u;
constexpr double kComponentRange = 1.0 / std::numbers::sqrt2;

template <typename Int>
Int quantize(double value, double scale)
{
  const double scaled = std::round(value * scale);
  const double lo = static_cast<double>(std::numeric_limits<Int>::min());
  const double hi = static_cast<double>(std::numeric_limits<Int>::max());
  return static_cast<Int>(std::clamp(scaled, lo, hi));
}

template <typename Int>
void put(std::vector<uint8_t>& out, Int value)
{
  using Unsigned = std::make_unsigned_t<Int>;
  const auto bits = static_cast<Unsigned>(value);
  for (size_t i = 0; i < sizeof(Int); ++i)
  {
    out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
  }
}

template <typename Int>
Int get(std::span<const uint8_t> bytes, size_t& offset)
{
  using Unsigned = std::make_unsigned_t<Int>;
  if (offset + sizeof(Int) > bytes.size())
  {
    throw std::runtime_error{std::format(
      "Snapshot batch truncated at byte {} of {}", offset, bytes.size())};
  }
  Unsigned bits = 0;
  for (size_t i = 0; i < sizeof(Int); ++i)
  {
    bits |= static_cast<Unsigned>(static_cast<Unsigned>(bytes[offset + i])
                                  << (8 * i));
  }
  offset += sizeof(Int);
  return static_cast<Int>(bits);
}

}  // namespace

EncodedSnapshot encode(const PuppetSnapshot& snapshot)
{
  if (!snapshot.position.allFinite() || !snapshot.linearVelocity.allFinite() ||
      !snapshot.orientation.eigen().coeffs().allFinite() ||
      !std::isfinite(snapshot.timestamp) || snapshot.timestamp < 0.0)
  {
    throw std::invalid_argument{std::format(
      "Cannot encode snapshot of puppet {}: non-finite state or negative time",
      snapshot.puppetId)};
  }

  EncodedSnapshot encoded{};
  encoded.puppetId = snapshot.puppetId;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    encoded.position[i] =
      quantize<int32_t>(snapshot.position[i], kPositionScale);
    encoded.velocity[i] =
      quantize<int16_t>(snapshot.linearVelocity[i], kVelocityScale);
  }
  encoded.orientation = packOrientation(snapshot.orientation);
  encoded.timestampMs = static_cast<uint32_t>(
    std::min(std::round(snapshot.timestamp * 1000.0),
             static_cast<double>(std::numeric_limits<uint32_t>::max())));
  encoded.flags = snapshot.sleeping ? kSleepingFlag : uint8_t{0};
  return encoded;
}

PuppetSnapshot decode(const EncodedSnapshot& encoded)
{
  PuppetSnapshot snapshot{};
  snapshot.puppetId = encoded.puppetId;
  snapshot.position = Coordinate{encoded.position[0] / kPositionScale,
                                 encoded.position[1] / kPositionScale,
                                 encoded.position[2] / kPositionScale};
  snapshot.linearVelocity = Velocity{encoded.velocity[0] / kVelocityScale,
                                     encoded.velocity[1] / kVelocityScale,
                                     encoded.velocity[2] / kVelocityScale};
  snapshot.orientation = unpackOrientation(encoded.orientation);
  snapshot.timestamp = encoded.timestampMs / 1000.0;
  snapshot.sleeping = (encoded.flags & kSleepingFlag) != 0;
  return snapshot;
}

uint32_t packOrientation(const QuaternionD& orientation)
{
  const QuaternionD unit = orientation.normalized();
  std::array<double, 4> q{unit.w(), unit.x(), unit.y(), unit.z()};

  uint32_t largest = 0;
  for (uint32_t i = 1; i < 4; ++i)
  {
    if (std::abs(q[i]) > std::abs(q[largest]))
    {
      largest = i;
    }
  }
  // q and -q are the same rotation
  if (q[largest] < 0.0)
  {
    for (auto& c : q)
    {
      c = -c;
    }
  }

  uint32_t packed = largest << (3 * kOrientationBits);
  int shift = 2 * kOrientationBits;
  for (uint32_t i = 0; i < 4; ++i)
  {
    if (i == largest)
    {
      continue;
    }
    const double normalized =
      std::clamp((q[i] / kComponentRange + 1.0) * 0.5, 0.0, 1.0);
    const auto value =
      static_cast<uint32_t>(std::lround(normalized * kComponentMax));
    packed |= value << shift;
    shift -= kOrientationBits;
  }
  return packed;
}

QuaternionD unpackOrientation(uint32_t packed)
{
  const uint32_t largest = packed >> (3 * kOrientationBits);
  std::array<double, 4> q{};
  double sumSquares = 0.0;
  int shift = 2 * kOrientationBits;
  for (uint32_t i = 0; i < 4; ++i)
  {
    if (i == largest)
    {
      continue;
    }
    const uint32_t value = (packed >> shift) & kComponentMax;
    shift -= kOrientationBits;
    q[i] = (static_cast<double>(value) / kComponentMax * 2.0 - 1.0) *
           kComponentRange;
    sumSquares += q[i] * q[i];
  }
  q[largest] = std::sqrt(std::max(0.0, 1.0 - sumSquares));
  return QuaternionD{q[0], q[1], q[2], q[3]}.normalized();
}

std::vector<uint8_t> serialize(const SnapshotBatch& batch)
{
  std::vector<uint8_t> out;
  out.reserve(kBatchHeaderBytes + batch.snapshots.size() * kEncodedSnapshotBytes);

  put<uint32_t>(out,
                static_cast<uint32_t>(std::max(0.0, std::round(batch.timestamp * 1000.0))));
  put<uint32_t>(out, static_cast<uint32_t>(batch.snapshots.size()));
  for (const auto& snapshot : batch.snapshots)
  {
    put<uint32_t>(out, snapshot.puppetId);
    for (const auto p : snapshot.position)
    {
      put<int32_t>(out, p);
    }
    put<uint32_t>(out, snapshot.orientation);
    for (const auto v : snapshot.velocity)
    {
      put<int16_t>(out, v);
    }
    put<uint32_t>(out, snapshot.timestampMs);
    put<uint8_t>(out, snapshot.flags);
  }
  return out;
}

SnapshotBatch deserialize(std::span<const uint8_t> bytes)
{
  size_t offset = 0;
  SnapshotBatch batch{};
  batch.timestamp = get<uint32_t>(bytes, offset) / 1000.0;
  const auto count = get<uint32_t>(bytes, offset);
  if (bytes.size() != kBatchHeaderBytes + count * kEncodedSnapshotBytes)
  {
    throw std::runtime_error{std::format(
      "Snapshot batch of {} bytes does not hold {} snapshots",
      bytes.size(),
      count)};
  }

  batch.snapshots.reserve(count);
  for (uint32_t n = 0; n < count; ++n)
  {
    EncodedSnapshot snapshot{};
    snapshot.puppetId = get<uint32_t>(bytes, offset);
    for (auto& p : snapshot.position)
    {
      p = get<int32_t>(bytes, offset);
    }
    snapshot.orientation = get<uint32_t>(bytes, offset);
    for (auto& v : snapshot.velocity)
    {
      v = get<int16_t>(bytes, offset);
    }
    snapshot.timestampMs = get<uint32_t>(bytes, offset);
    snapshot.flags = get<uint8_t>(bytes, offset);
    batch.snapshots.push_back(snapshot);
  }
  return batch;
}

}  // namespace shatter_sim::SnapshotCodec
