#ifndef STACK_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP
#define STACK_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/DataTypes/Vector3D.hpp"

namespace stack_sim
{

/**
 * @brief A reference frame for coordinate transformations
 *
 * Translated and rotated relative to the world frame. Orientation is stored
 * as a unit quaternion; the rotation matrix is cached and rebuilt whenever
 * the orientation changes.
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
   * @param origin The origin of this frame in world coordinates
   */
  explicit ReferenceFrame(const Coordinate& origin);

  /**
   * @brief Constructor with translation and rotation
   * @param origin The origin of this frame in world coordinates
   * @param orientation Rotation from local to world (normalized on entry)
   */
  ReferenceFrame(const Coordinate& origin,
                 const Eigen::Quaterniond& orientation);

  /**
   * @brief Transform a point from world frame to this local frame
   */
  [[nodiscard]] Coordinate globalToLocal(const Coordinate& globalCoord) const;

  /**
   * @brief Transform a point from this local frame to world frame
   */
  [[nodiscard]] Coordinate localToGlobal(const Coordinate& localCoord) const;

  /**
   * @brief Rotate a direction from world frame into this local frame
   *
   * Applies only rotation, not translation.
   */
  [[nodiscard]] Vector3D globalToLocalRelative(
    const Vector3D& globalVector) const;

  /**
   * @brief Rotate a direction from this local frame into world frame
   *
   * Applies only rotation, not translation.
   */
  [[nodiscard]] Vector3D localToGlobalRelative(
    const Vector3D& localVector) const;

  /**
   * @brief World-space direction of this frame's local +y axis
   */
  [[nodiscard]] Vector3D getUpAxis() const;

  void setOrigin(const Coordinate& origin);

  /**
   * @brief Set the orientation
   * @param orientation Rotation from local to world (normalized on entry)
   */
  void setOrientation(const Eigen::Quaterniond& orientation);

  [[nodiscard]] const Coordinate& getOrigin() const
  {
    return origin_;
  }

  [[nodiscard]] const Eigen::Quaterniond& getOrientation() const
  {
    return orientation_;
  }

  [[nodiscard]] const Eigen::Matrix3d& getRotation() const
  {
    return rotation_;
  }

private:
  Coordinate origin_;               ///< Origin in world coordinates
  Eigen::Quaterniond orientation_;  ///< Local to world rotation
  Eigen::Matrix3d rotation_;        ///< Cached matrix form of orientation_
};

}  // namespace stack_sim

#endif  // STACK_SIM_ENVIRONMENT_REFERENCE_FRAME_HPP
