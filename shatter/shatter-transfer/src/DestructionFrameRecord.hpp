// Ticket: 0014_destruction_data_recorder

#ifndef SHATTER_TRANSFER_DESTRUCTION_FRAME_RECORD_HPP
#define SHATTER_TRANSFER_DESTRUCTION_FRAME_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace shatter_transfer
{

/**
 * @brief Database record for one scheduling tick
 *
 * Each call to DestructionWorld::tick() while recording is enabled produces
 * exactly one DestructionFrameRecord. Job and snapshot records reference it
 * via ForeignKey<DestructionFrameRecord>.
 *
 * The id field is inherited from BaseTransferObject and serves as the
 * primary key for frame identification.
 *
 * @ticket 0014_destruction_data_recorder
 */
struct DestructionFrameRecord : public cpp_sqlite::BaseTransferObject
{
  double simulation_time{0.0};  // Simulation time [seconds]
  double wall_clock_time{0.0};  // Wall clock time [seconds since epoch]
  uint32_t divisions{0};        // Objects voxelized during this tick
  uint32_t operations{0};       // Classification + registry operations
  uint32_t active_jobs{0};      // Queued or processing jobs after the tick
  uint32_t active_puppets{0};   // Replicated puppets after the tick
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(DestructionFrameRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (simulation_time,
                       wall_clock_time,
                       divisions,
                       operations,
                       active_jobs,
                       active_puppets));

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_DESTRUCTION_FRAME_RECORD_HPP
