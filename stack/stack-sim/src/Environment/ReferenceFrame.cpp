#include "stack-sim/src/Environment/ReferenceFrame.hpp"

namespace stack_sim
{

ReferenceFrame::ReferenceFrame()
  : origin_{0.0, 0.0, 0.0},
    orientation_{Eigen::Quaterniond::Identity()},
    rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin)
  : origin_{origin},
    orientation_{Eigen::Quaterniond::Identity()},
    rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Quaterniond& orientation)
  : origin_{origin},
    orientation_{orientation.normalized()},
    rotation_{orientation_.toRotationMatrix()}
{
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& globalCoord) const
{
  // Translate to frame origin, then rotate to local orientation
  Coordinate const translated = globalCoord - origin_;
  return rotation_.transpose() * translated;
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& localCoord) const
{
  // Rotate to world orientation, then translate to world position
  Coordinate const rotated = rotation_ * localCoord;
  return rotated + origin_;
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

Vector3D ReferenceFrame::getUpAxis() const
{
  return rotation_.col(1);
}

void ReferenceFrame::setOrigin(const Coordinate& origin)
{
  origin_ = origin;
}

void ReferenceFrame::setOrientation(const Eigen::Quaterniond& orientation)
{
  orientation_ = orientation.normalized();
  rotation_ = orientation_.toRotationMatrix();
}

}  // namespace stack_sim
