// Ticket: 0012_puppet_replication

#include "shatter-sim/src/Replication/PuppetTweener.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace shatter_sim
{

PuppetTweener::PuppetTweener(bool tweenEnabled,
                             double distanceLimit,
                             double replicationFrequency)
  : tweenEnabled_{tweenEnabled},
    distanceLimit_{distanceLimit},
    interval_{0.0}
{
  if (!std::isfinite(replicationFrequency) || replicationFrequency <= 0.0)
  {
    throw std::invalid_argument{std::format(
      "Replication frequency must be positive, got {}", replicationFrequency)};
  }
  if (!(distanceLimit >= 0.0))
  {
    throw std::invalid_argument{std::format(
      "Tween distance limit must be non-negative, got {}", distanceLimit)};
  }
  interval_ = 1.0 / replicationFrequency;
}

PuppetTweener::PuppetTweener(const Settings& settings)
  : PuppetTweener{settings.clientTweenPuppets,
                  settings.clientTweenDistanceLimit,
                  settings.puppetReplicationFrequency}
{
}

void PuppetTweener::applySnapshot(const PuppetSnapshot& snapshot)
{
  const ReferenceFrame target{snapshot.position, snapshot.orientation};

  auto it = tracks_.find(snapshot.puppetId);
  if (it == tracks_.end())
  {
    tracks_.emplace(snapshot.puppetId,
                    Track{target, target, target, interval_, snapshot.timestamp});
    return;
  }

  Track& track = it->second;
  if (snapshot.timestamp < track.latestTimestamp)
  {
    return;
  }
  track.latestTimestamp = snapshot.timestamp;

  const double jump =
    (target.getOrigin() - track.displayed.getOrigin()).norm();
  if (!tweenEnabled_ || jump > distanceLimit_)
  {
    track.from = target;
    track.to = target;
    track.displayed = target;
    track.elapsed = interval_;
    return;
  }

  track.from = track.displayed;
  track.to = target;
  track.elapsed = 0.0;
}

void PuppetTweener::applyBatch(const SnapshotBatch& batch)
{
  for (const auto& encoded : batch.snapshots)
  {
    applySnapshot(SnapshotCodec::decode(encoded));
  }
}

void PuppetTweener::update(double dt)
{
  for (auto& [id, track] : tracks_)
  {
    track.elapsed = std::min(track.elapsed + std::max(dt, 0.0), interval_);
    const double t = track.elapsed / interval_;

    const Coordinate position{
      track.from.getOrigin() +
      t * (track.to.getOrigin() - track.from.getOrigin())};
    const QuaternionD orientation =
      track.from.getOrientation().slerp(t, track.to.getOrientation());
    track.displayed = ReferenceFrame{position, orientation};
  }
}

std::optional<ReferenceFrame> PuppetTweener::getDisplayedFrame(PuppetId id) const
{
  auto it = tracks_.find(id);
  if (it == tracks_.end())
  {
    return std::nullopt;
  }
  return it->second.displayed;
}

bool PuppetTweener::removePuppet(PuppetId id)
{
  return tracks_.erase(id) > 0;
}

}  // namespace shatter_sim
