// Ticket: 0012_puppet_replication

#include "shatter-sim/src/Replication/PuppetReplicator.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "shatter-sim/src/Utils/Logging.hpp"

namespace shatter_sim
{

PuppetReplicator::PuppetReplicator(SceneInterface& scene,
                                   ReplicationTransport* transport,
                                   const Settings& settings)
  : scene_{scene}, transport_{transport}, settings_{settings}
{
}

PuppetId PuppetReplicator::puppeteer(
  SolidObjectId objectId,
  const Velocity& linearVelocity,
  const Vector3D& angularVelocity,
  const std::vector<ObserverId>& excludedObservers)
{
  auto object = scene_.find(objectId);
  if (!object)
  {
    throw std::invalid_argument{
      std::format("Cannot puppeteer unknown object {}", objectId)};
  }

  scene_.setAnchored(objectId, false);
  scene_.setVelocity(objectId, linearVelocity, angularVelocity);

  if (auto existing = puppetOf(objectId))
  {
    Puppet& puppet = puppets_.at(*existing);
    puppet.linearVelocity = linearVelocity;
    puppet.angularVelocity = angularVelocity;
    puppet.sleeping = false;
    puppet.sleepTimer = 0.0;
    puppet.sleepAnnounced = false;
    return *existing;
  }

  Puppet puppet{};
  puppet.id = nextPuppetId_++;
  puppet.objectId = objectId;
  puppet.frame = object->get().frame();
  puppet.linearVelocity = linearVelocity;
  puppet.angularVelocity = angularVelocity;
  puppet.creationOrder = nextCreationOrder_++;
  puppet.excluded = excludedObservers;
  std::sort(puppet.excluded.begin(), puppet.excluded.end());

  if (usesTransport())
  {
    puppet.replicated = transport_->assignOwnership(puppet.id, objectId);
    if (!puppet.replicated)
    {
      logger()->warn(
        "Ownership of puppet {} (object {}) refused, simulating locally",
        puppet.id,
        objectId);
    }
  }

  const PuppetId id = puppet.id;
  puppets_.emplace(id, std::move(puppet));

  while (puppets_.size() > settings_.puppetMaxCount)
  {
    anchor(puppets_.begin()->first);
  }
  return id;
}

void PuppetReplicator::tick(double simTime)
{
  const double dt = lastTick_ ? std::max(0.0, simTime - *lastTick_) : 0.0;
  lastTick_ = simTime;

  std::vector<PuppetId> lost;
  std::vector<PuppetId> settled;
  for (auto& [id, puppet] : puppets_)
  {
    auto state = scene_.getBodyState(puppet.objectId);
    if (!state)
    {
      lost.push_back(id);
      continue;
    }
    puppet.frame = state->frame;
    puppet.linearVelocity = state->linearVelocity;
    puppet.angularVelocity = state->angularVelocity;

    const bool slow =
      puppet.linearVelocity.norm() < settings_.puppetSleepVelocity &&
      puppet.angularVelocity.norm() < settings_.puppetSleepVelocity;
    if (slow)
    {
      puppet.sleeping = true;
      puppet.sleepTimer += dt;
      if (puppet.sleepTimer >= settings_.puppetAnchorTimeout)
      {
        settled.push_back(id);
      }
    }
    else
    {
      puppet.sleeping = false;
      puppet.sleepTimer = 0.0;
      puppet.sleepAnnounced = false;
    }
  }

  for (const auto id : lost)
  {
    logger()->debug("Puppet {} lost its scene object", id);
    puppets_.erase(id);
  }
  for (const auto id : settled)
  {
    anchor(id);
  }

  if (!lastBroadcast_ ||
      simTime - *lastBroadcast_ >= settings_.replicationInterval())
  {
    broadcast(simTime);
  }
}

void PuppetReplicator::broadcast(double simTime)
{
  lastBroadcast_ = simTime;

  // One batch per distinct exclusion list
  std::map<std::vector<ObserverId>, SnapshotBatch> batches;
  for (auto& [id, puppet] : puppets_)
  {
    if (puppet.sleeping && puppet.sleepAnnounced)
    {
      continue;
    }

    PuppetSnapshot snapshot{};
    snapshot.puppetId = id;
    snapshot.position = puppet.frame.getOrigin();
    snapshot.orientation = puppet.frame.getOrientation();
    snapshot.linearVelocity = puppet.linearVelocity;
    snapshot.timestamp = simTime;
    snapshot.sleeping = puppet.sleeping;

    const EncodedSnapshot encoded = SnapshotCodec::encode(snapshot);
    SnapshotBatch& batch = batches[puppet.excluded];
    batch.timestamp = simTime;
    batch.snapshots.push_back(encoded);

    puppet.lastBroadcast = simTime;
    puppet.sleepAnnounced = puppet.sleeping;

    if (observer_)
    {
      observer_(SnapshotCodec::decode(encoded));
    }
  }

  if (!usesTransport())
  {
    return;
  }
  for (const auto& [excluded, batch] : batches)
  {
    transport_->send(batch, excluded);
    ++batchesSent_;
  }
}

void PuppetReplicator::anchor(PuppetId id)
{
  auto it = puppets_.find(id);
  if (it == puppets_.end())
  {
    return;
  }
  scene_.setAnchored(it->second.objectId, true);
  if (usesTransport() && it->second.replicated)
  {
    transport_->sendAnchored(id);
  }
  logger()->debug("Puppet {} anchored (object {})", id, it->second.objectId);
  puppets_.erase(it);
}

void PuppetReplicator::updateSettings(const Settings& settings)
{
  settings_ = settings;
  while (puppets_.size() > settings_.puppetMaxCount)
  {
    anchor(puppets_.begin()->first);
  }
}

void PuppetReplicator::setSnapshotObserver(SnapshotObserver observer)
{
  observer_ = std::move(observer);
}

bool PuppetReplicator::removePuppet(PuppetId id)
{
  return puppets_.erase(id) > 0;
}

void PuppetReplicator::clear()
{
  puppets_.clear();
}

std::optional<std::reference_wrapper<const Puppet>> PuppetReplicator::find(
  PuppetId id) const
{
  auto it = puppets_.find(id);
  if (it == puppets_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second);
}

std::optional<PuppetId> PuppetReplicator::puppetOf(SolidObjectId objectId) const
{
  for (const auto& [id, puppet] : puppets_)
  {
    if (puppet.objectId == objectId)
    {
      return id;
    }
  }
  return std::nullopt;
}

}  // namespace shatter_sim
