#ifndef SHATTER_TRANSFER_VECTOR3D_RECORD_HPP
#define SHATTER_TRANSFER_VECTOR3D_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace shatter_transfer
{

/**
 * @brief Database record for a generic 3D vector
 *
 * Used for extents and angular velocities. Positions and linear velocities
 * have their own records (CoordinateRecord, VelocityRecord).
 */
struct Vector3DRecord : public cpp_sqlite::BaseTransferObject
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(Vector3DRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (x, y, z));

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_VECTOR3D_RECORD_HPP
