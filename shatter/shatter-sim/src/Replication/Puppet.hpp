// Ticket: 0012_puppet_replication

#ifndef SHATTER_SIM_REPLICATION_PUPPET_HPP
#define SHATTER_SIM_REPLICATION_PUPPET_HPP

#include <cstdint>
#include <limits>
#include <vector>

#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/DataTypes/Velocity.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Environment/SolidObject.hpp"
#include "shatter-sim/src/Registry/DirtyGroupRegistry.hpp"

namespace shatter_sim
{

using PuppetId = uint32_t;

/**
 * @brief Free-falling debris block whose motion is replicated to observers
 *
 * The puppet refers to its scene object by id only; the scene owns the
 * object and the physics state.
 */
struct Puppet
{
  PuppetId id{0};
  SolidObjectId objectId{kInvalidObjectId};
  ReferenceFrame frame;
  Velocity linearVelocity;
  Vector3D angularVelocity;
  double lastBroadcast{-std::numeric_limits<double>::infinity()};  // [s]
  bool sleeping{false};
  double sleepTimer{0.0};  // Time spent below the sleep velocity [s]
  uint64_t creationOrder{0};
  bool replicated{false};  // Ownership granted by the transport
  bool sleepAnnounced{false};
  std::vector<ObserverId> excluded;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REPLICATION_PUPPET_HPP
