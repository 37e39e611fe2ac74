// Ticket: 0003_reference_frame

#ifndef SHATTER_SIM_REFERENCE_FRAME_HPP
#define SHATTER_SIM_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Quaternion.hpp"
#include "shatter-sim/src/DataTypes/Vector3D.hpp"

namespace shatter_sim
{

/**
 * @brief An oriented frame (position + rotation) for coordinate transforms
 *
 * Every scene object, voxel and cutting shape carries one of these. The
 * rotation is stored as a unit quaternion and cached as a 3x3 matrix; local
 * axis i in world space is column i of getRotation().
 */
class ReferenceFrame
{
public:
  /**
   * @brief Default constructor - creates identity frame at origin
   */
  ReferenceFrame();

  /**
   * @brief Constructor with translation only
   * @param origin The origin of this frame in global coordinates
   */
  explicit ReferenceFrame(const Coordinate& origin);

  /**
   * @brief Constructor with translation and rotation
   * @param origin The origin of this frame in global coordinates
   * @param orientation Rotation from local to global (normalized internally)
   */
  ReferenceFrame(const Coordinate& origin, const QuaternionD& orientation);

  /**
   * @brief Transform a point from global frame to this local frame
   * @param globalCoord Coordinate in global frame
   * @return Coordinate in this local frame
   */
  [[nodiscard]] Coordinate globalToLocal(const Coordinate& globalCoord) const;

  /**
   * @brief Transform a point from this local frame to global frame
   * @param localCoord Coordinate in this local frame
   * @return Coordinate in global frame
   */
  [[nodiscard]] Coordinate localToGlobal(const Coordinate& localCoord) const;

  /**
   * @brief Batch transform coordinates from global frame to this local frame
   *
   * Each column represents a 3D coordinate.
   *
   * @param globalCoords 3xN matrix of coordinates in global frame (modified in
   * place)
   */
  void globalToLocalBatch(Eigen::Matrix3Xd& globalCoords) const;

  /**
   * @brief Batch transform coordinates from this local frame to global frame
   *
   * @param localCoords 3xN matrix of coordinates in local frame (modified in
   * place)
   */
  void localToGlobalBatch(Eigen::Matrix3Xd& localCoords) const;

  /**
   * @brief Rotate a direction vector from global frame to local frame
   *
   * Applies only rotation, not translation. Use this for directions,
   * normals and velocities.
   */
  [[nodiscard]] Vector3D globalToLocalRelative(
    const Vector3D& globalVector) const;

  /**
   * @brief Rotate a direction vector from local frame to global frame
   */
  [[nodiscard]] Vector3D localToGlobalRelative(
    const Vector3D& localVector) const;

  /**
   * @brief World-space direction of local axis 0 (X), 1 (Y) or 2 (Z)
   */
  [[nodiscard]] Vector3D axis(Eigen::Index index) const;

  /**
   * @brief Compose this frame with a frame expressed in this frame's space
   *
   * Equivalent to CFrame multiplication: the result places child in world
   * space.
   */
  [[nodiscard]] ReferenceFrame compose(const ReferenceFrame& child) const;

  /**
   * @brief Express other (a world frame) relative to this frame
   */
  [[nodiscard]] ReferenceFrame relativeTo(const ReferenceFrame& other) const;

  void setOrigin(const Coordinate& origin);

  void setOrientation(const QuaternionD& orientation);

  [[nodiscard]] const Coordinate& getOrigin() const
  {
    return origin_;
  }

  [[nodiscard]] const QuaternionD& getOrientation() const
  {
    return orientation_;
  }

  /**
   * @brief Get the rotation matrix (local to global)
   * @return Const reference to the cached 3x3 rotation matrix
   */
  [[nodiscard]] const Eigen::Matrix3d& getRotation() const
  {
    return rotation_;
  }

  /**
   * @brief True if every component is finite and the quaternion is not
   * degenerate
   */
  [[nodiscard]] bool isValid() const;

private:
  void updateRotationMatrix();

  Coordinate origin_;        ///< Origin of this frame in global coordinates
  QuaternionD orientation_;  ///< Rotation from local to global
  Eigen::Matrix3d rotation_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_REFERENCE_FRAME_HPP
