// Ticket: 0003_reference_frame

#include "shatter-sim/src/Environment/ReferenceFrame.hpp"

#include <cmath>

namespace shatter_sim
{

namespace
{

// Quaternions shorter than this cannot be normalized into a rotation
constexpr double kMinQuaternionNorm = 1e-9;

}  // namespace

ReferenceFrame::ReferenceFrame()
  : origin_{0.0, 0.0, 0.0},
    orientation_{},
    rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin)
  : origin_{origin}, orientation_{}, rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const QuaternionD& orientation)
  : origin_{origin},
    orientation_{orientation},
    rotation_{Eigen::Matrix3d::Identity()}
{
  updateRotationMatrix();
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& globalCoord) const
{
  // Translate to frame origin, then rotate to local orientation
  Coordinate translated = globalCoord - origin_;
  return rotation_.transpose() * translated;
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& localCoord) const
{
  // Rotate to global orientation, then translate to global position
  Coordinate rotated = rotation_ * localCoord;
  return rotated + origin_;
}

void ReferenceFrame::globalToLocalBatch(Eigen::Matrix3Xd& globalCoords) const
{
  globalCoords.colwise() -= origin_;
  globalCoords.applyOnTheLeft(rotation_.transpose());
}

void ReferenceFrame::localToGlobalBatch(Eigen::Matrix3Xd& localCoords) const
{
  localCoords.applyOnTheLeft(rotation_);
  localCoords.colwise() += origin_;
}

Vector3D ReferenceFrame::globalToLocalRelative(
  const Vector3D& globalVector) const
{
  return rotation_.transpose() * globalVector;
}

Vector3D ReferenceFrame::localToGlobalRelative(
  const Vector3D& localVector) const
{
  return rotation_ * localVector;
}

Vector3D ReferenceFrame::axis(Eigen::Index index) const
{
  return rotation_.col(index);
}

ReferenceFrame ReferenceFrame::compose(const ReferenceFrame& child) const
{
  return ReferenceFrame{localToGlobal(child.getOrigin()),
                        orientation_ * child.getOrientation()};
}

ReferenceFrame ReferenceFrame::relativeTo(const ReferenceFrame& other) const
{
  return ReferenceFrame{globalToLocal(other.getOrigin()),
                        orientation_.conjugate() * other.getOrientation()};
}

void ReferenceFrame::setOrigin(const Coordinate& origin)
{
  origin_ = origin;
}

void ReferenceFrame::setOrientation(const QuaternionD& orientation)
{
  orientation_ = orientation;
  updateRotationMatrix();
}

bool ReferenceFrame::isValid() const
{
  const auto& q = orientation_.eigen();
  return origin_.allFinite() && q.coeffs().allFinite() &&
         q.norm() > kMinQuaternionNorm;
}

void ReferenceFrame::updateRotationMatrix()
{
  // A degenerate quaternion is kept as-is so isValid() can report it;
  // the cached matrix stays at identity in that case.
  if (orientation_.norm() <= kMinQuaternionNorm ||
      !orientation_.eigen().coeffs().allFinite())
  {
    rotation_ = Eigen::Matrix3d::Identity();
    return;
  }
  orientation_ = orientation_.normalized();
  rotation_ = orientation_.toRotationMatrix();
}

}  // namespace shatter_sim
