// Ticket: 0002_tower_model

#include "stack-sim/src/Bodies/StackedObject.hpp"

#include <stdexcept>
#include <string>

namespace stack_sim
{

StackedObject::StackedObject(uint32_t instanceId,
                             BodyRole role,
                             const Coordinate& halfExtents,
                             const ReferenceFrame& frame,
                             double mass,
                             const Coordinate& centerOfMassOffset)
  : instanceId_{instanceId},
    role_{role},
    halfExtents_{halfExtents},
    frame_{frame},
    mass_{role == BodyRole::Piece ? mass : 0.0},
    centerOfMassOffset_{centerOfMassOffset}
{
  if (halfExtents.minCoeff() <= 0.0)
  {
    throw std::invalid_argument(
      "StackedObject: half-extents must be positive (body " +
      std::to_string(instanceId) + ")");
  }

  if (role == BodyRole::Piece && mass <= 0.0)
  {
    throw std::invalid_argument(
      "StackedObject: piece mass must be positive (mass = " +
      std::to_string(mass) + ")");
  }
}

Coordinate StackedObject::getWorldCenterOfMass() const
{
  return frame_.localToGlobal(centerOfMassOffset_);
}

Vector3D StackedObject::getUpAxis() const
{
  return frame_.getUpAxis();
}

BoundingBox StackedObject::getWorldBoundingBox() const
{
  // Projected radius of an oriented box on each world axis is |R| * h
  Eigen::Vector3d const worldHalf =
    frame_.getRotation().cwiseAbs() * halfExtents_;
  const Coordinate& center = frame_.getOrigin();
  return BoundingBox{Coordinate{center - worldHalf},
                     Coordinate{center + worldHalf}};
}

Coordinate StackedObject::closestPoint(const Coordinate& point) const
{
  Coordinate const local = frame_.globalToLocal(point);
  Coordinate const clamped =
    local.cwiseMax(-halfExtents_).cwiseMin(halfExtents_);
  return frame_.localToGlobal(clamped);
}

void StackedObject::setPose(const Coordinate& position,
                            const Eigen::Quaterniond& orientation)
{
  frame_.setOrigin(position);
  frame_.setOrientation(orientation);
}

void StackedObject::setVelocities(const Vector3D& linear,
                                  const Vector3D& angular)
{
  linearVelocity_ = linear;
  angularVelocity_ = angular;
}

}  // namespace stack_sim
