// Ticket: 0014_destruction_data_recorder

#ifndef SHATTER_TRANSFER_DESTRUCTION_JOB_RECORD_HPP
#define SHATTER_TRANSFER_DESTRUCTION_JOB_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "shatter-transfer/src/CoordinateRecord.hpp"
#include "shatter-transfer/src/DestructionFrameRecord.hpp"
#include "shatter-transfer/src/Vector3DRecord.hpp"

namespace shatter_transfer
{

/**
 * @brief Outcome of one finished destruction job
 *
 * Written once when a job reaches Completed or Cancelled. The frame
 * foreign key points at the tick during which the job finished.
 *
 * state: 2 = Completed, 3 = Cancelled (matches shatter_sim::JobState)
 */
struct DestructionJobRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t job_id{0};
  uint32_t submission_order{0};
  uint32_t shape_kind{0};
  uint32_t state{0};
  uint32_t destroyed_voxels{0};
  uint32_t affected_groups{0};
  uint32_t imaginary{0};
  double grid_size{0.0};
  CoordinateRecord cutting_origin;
  Vector3DRecord cutting_extent;

  cpp_sqlite::ForeignKey<DestructionFrameRecord> frame;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(DestructionJobRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (job_id,
                       submission_order,
                       shape_kind,
                       state,
                       destroyed_voxels,
                       affected_groups,
                       imaginary,
                       grid_size,
                       cutting_origin,
                       cutting_extent,
                       frame));

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_DESTRUCTION_JOB_RECORD_HPP
