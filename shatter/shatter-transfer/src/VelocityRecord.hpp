#ifndef SHATTER_TRANSFER_VELOCITY_RECORD_HPP
#define SHATTER_TRANSFER_VELOCITY_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace shatter_transfer
{

/**
 * @brief Database record for a linear velocity [units/s]
 */
struct VelocityRecord : public cpp_sqlite::BaseTransferObject
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

BOOST_DESCRIBE_STRUCT(VelocityRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (x, y, z));

}  // namespace shatter_transfer

#endif  // SHATTER_TRANSFER_VELOCITY_RECORD_HPP
