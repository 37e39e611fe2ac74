// Ticket: 0014_destruction_data_recorder

#ifndef SHATTER_TRANSFER_PUPPET_SNAPSHOT_RECORD_HPP
#define SHATTER_TRANSFER_PUPPET_SNAPSHOT_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "shatter-transfer/src/CoordinateRecord.hpp"
#include "shatter-transfer/src/DestructionFrameRecord.hpp"
#include "shatter-transfer/src/QuaternionDRecord.hpp"
#include "shatter-transfer/src/VelocityRecord.hpp"

namespace shatter_transfer
{

/**
 * @brief One puppet state as broadcast to observers
 *
 * Holds the decoded (dequantized) values so the recorded stream matches
 * what a receiver reconstructs, not the server's full-precision state.
 */
struct PuppetSnapshotRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t puppet_id{0};
  double timestamp{0.0};  // Server time of the snapshot [seconds]
  uint32_t sleeping{0};
  CoordinateRecord position;
  QuaternionDRecord orientation;
  VelocityRecord velocity;

  cpp_sqlite::ForeignKey<DestructionFrameRecord> frame;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(PuppetSnapshotRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (puppet_id,
                       timestamp,
                       sleeping,
                       position,
                       orientation,
                       velocity,
                       frame));

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_PUPPET_SNAPSHOT_RECORD_HPP
