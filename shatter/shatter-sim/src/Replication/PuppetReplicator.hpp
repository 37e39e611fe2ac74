// Ticket: 0012_puppet_replication

#ifndef SHATTER_SIM_REPLICATION_PUPPET_REPLICATOR_HPP
#define SHATTER_SIM_REPLICATION_PUPPET_REPLICATOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "shatter-sim/src/Environment/SceneInterface.hpp"
#include "shatter-sim/src/Replication/Puppet.hpp"
#include "shatter-sim/src/Replication/ReplicationTransport.hpp"
#include "shatter-sim/src/Replication/SnapshotCodec.hpp"
#include "shatter-sim/src/Settings/Settings.hpp"

namespace shatter_sim
{

/**
 * @brief Server side of falling-debris replication
 *
 * Tracks puppets, refreshes them from the physics collaborator, anchors
 * those that stay asleep for puppetAnchorTimeout and broadcasts compressed
 * snapshot batches at puppetReplicationFrequency. Batches are sent through
 * the transport only with useClientServer; the snapshot observer sees every
 * emitted snapshot either way.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 *
 * @ticket 0012_puppet_replication
 */
class PuppetReplicator
{
public:
  /// Receives each snapshot as an observer would decode it
  using SnapshotObserver = std::function<void(const PuppetSnapshot&)>;

  /**
   * @param transport Optional, not owned; must outlive the replicator
   */
  PuppetReplicator(SceneInterface& scene,
                   ReplicationTransport* transport,
                   const Settings& settings);

  /**
   * @brief Make a scene object fall and replicate it
   *
   * Unanchors the object and gives it the initial velocities. When the
   * puppet count then exceeds puppetMaxCount the oldest puppet is anchored
   * and dropped. Puppeteering an existing puppet only updates its velocity.
   *
   * @throws std::invalid_argument if the object is unknown
   * @return Id of the (possibly existing) puppet
   */
  PuppetId puppeteer(SolidObjectId objectId,
                     const Velocity& linearVelocity,
                     const Vector3D& angularVelocity,
                     const std::vector<ObserverId>& excludedObservers = {});

  /**
   * @brief Refresh, sleep, anchor and broadcast
   * @param simTime Current simulation time [s], non-decreasing
   */
  void tick(double simTime);

  void updateSettings(const Settings& settings);

  void setSnapshotObserver(SnapshotObserver observer);

  /// Forget a puppet without anchoring it
  bool removePuppet(PuppetId id);

  /// Forget every puppet without anchoring
  void clear();

  [[nodiscard]] size_t activeCount() const
  {
    return puppets_.size();
  }

  [[nodiscard]] std::optional<std::reference_wrapper<const Puppet>> find(
    PuppetId id) const;

  [[nodiscard]] std::optional<PuppetId> puppetOf(SolidObjectId objectId) const;

  [[nodiscard]] uint64_t batchesSent() const
  {
    return batchesSent_;
  }

  // Rule of Five
  PuppetReplicator(const PuppetReplicator&) = delete;
  PuppetReplicator& operator=(const PuppetReplicator&) = delete;
  PuppetReplicator(PuppetReplicator&&) noexcept = default;
  PuppetReplicator& operator=(PuppetReplicator&&) noexcept = delete;
  ~PuppetReplicator() = default;

private:
  [[nodiscard]] bool usesTransport() const
  {
    return settings_.useClientServer && transport_ != nullptr;
  }

  /// Anchor the puppet's object, notify observers and forget it
  void anchor(PuppetId id);

  void broadcast(double simTime);

  SceneInterface& scene_;
  ReplicationTransport* transport_;
  Settings settings_;
  SnapshotObserver observer_;

  std::map<PuppetId, Puppet> puppets_;  // Ascending id is creation order
  PuppetId nextPuppetId_{1};
  uint64_t nextCreationOrder_{0};
  std::optional<double> lastTick_;
  std::optional<double> lastBroadcast_;
  uint64_t batchesSent_{0};
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REPLICATION_PUPPET_REPLICATOR_HPP
