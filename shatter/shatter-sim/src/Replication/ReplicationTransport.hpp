// Ticket: 0012_puppet_replication

#ifndef SHATTER_SIM_REPLICATION_REPLICATION_TRANSPORT_HPP
#define SHATTER_SIM_REPLICATION_REPLICATION_TRANSPORT_HPP

#include <vector>

#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"
#include "shatter-sim/src/Replication/Puppet.hpp"
#include "shatter-sim/src/Replication/SnapshotCodec.hpp"

namespace shatter_sim
{

/**
 * @brief Host network layer that carries puppet state to observers
 *
 * Thread safety: Called from the simulation thread only
 *
 * @ticket 0012_puppet_replication
 */
class ReplicationTransport
{
public:
  virtual ~ReplicationTransport() = default;

  /// Broadcast to every observer not listed in excludedObservers
  virtual void send(const SnapshotBatch& batch,
                    const std::vector<ObserverId>& excludedObservers) = 0;

  /**
   * @brief Hand physics authority over the object to the server
   * @return false if the host refused; the puppet then stays local
   */
  virtual bool assignOwnership(PuppetId puppetId, SolidObjectId objectId) = 0;

  /// Tell observers the puppet came to rest and is no longer replicated
  virtual void sendAnchored(PuppetId puppetId) = 0;

protected:
  ReplicationTransport() = default;
  ReplicationTransport(const ReplicationTransport&) = default;
  ReplicationTransport& operator=(const ReplicationTransport&) = default;
  ReplicationTransport(ReplicationTransport&&) noexcept = default;
  ReplicationTransport& operator=(ReplicationTransport&&) noexcept = default;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REPLICATION_REPLICATION_TRANSPORT_HPP
