// Ticket: 0012_puppet_replication

#ifndef SHATTER_SIM_REPLICATION_PUPPET_TWEENER_HPP
#define SHATTER_SIM_REPLICATION_PUPPET_TWEENER_HPP

#include <cstddef>
#include <optional>
#include <unordered_map>

#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Replication/SnapshotCodec.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"

namespace shatter_sim
{

/**
 * @brief Observer side of puppet replication
 *
 * Smooths displayed puppet frames between snapshots: each new snapshot
 * starts a lerp (position) and slerp (orientation) from the currently
 * displayed frame to the received one, spread over one replication
 * interval. First sightings, jumps longer than the distance limit and a
 * disabled tween snap straight to the received frame. Snapshots older than
 * the last applied one are ignored.
 *
 * @ticket 0012_puppet_replication
 */
class PuppetTweener
{
public:
  /**
   * @throws std::invalid_argument if replicationFrequency is not positive
   *         or distanceLimit is negative
   */
  PuppetTweener(bool tweenEnabled,
                double distanceLimit,
                double replicationFrequency);

  explicit PuppetTweener(const Settings& settings);

  void applySnapshot(const PuppetSnapshot& snapshot);

  /// Decode and apply every snapshot of a batch
  void applyBatch(const SnapshotBatch& batch);

  /**
   * @brief Advance every tween
   * @param dt Elapsed receiver time [s]
   */
  void update(double dt);

  [[nodiscard]] std::optional<ReferenceFrame> getDisplayedFrame(
    PuppetId id) const;

  bool removePuppet(PuppetId id);

  [[nodiscard]] size_t trackedCount() const
  {
    return tracks_.size();
  }

private:
  struct Track
  {
    ReferenceFrame from;
    ReferenceFrame to;
    ReferenceFrame displayed;
    double elapsed{0.0};
    double latestTimestamp{0.0};
  };

  bool tweenEnabled_;
  double distanceLimit_;
  double interval_;
  std::unordered_map<PuppetId, Track> tracks_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REPLICATION_PUPPET_TWEENER_HPP
