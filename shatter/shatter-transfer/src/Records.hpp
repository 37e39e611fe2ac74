#ifndef SHATTER_TRANSFER_RECORDS_HPP
#define SHATTER_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all database transfer objects
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "shatter-transfer/src/CoordinateRecord.hpp"
#include "shatter-transfer/src/DestructionFrameRecord.hpp"
#include "shatter-transfer/src/DestructionJobRecord.hpp"
#include "shatter-transfer/src/PuppetSnapshotRecord.hpp"
#include "shatter-transfer/src/QuaternionDRecord.hpp"
#include "shatter-transfer/src/Vector3DRecord.hpp"
#include "shatter-transfer/src/VelocityRecord.hpp"

namespace shatter_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 */
using Database = cpp_sqlite::Database;

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_RECORDS_HPP
