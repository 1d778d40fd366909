// Ticket: 0002_tower_model

#ifndef STACK_SIM_BODIES_STACKED_OBJECT_HPP
#define STACK_SIM_BODIES_STACKED_OBJECT_HPP

#include <cstdint>

#include "stack-sim/src/Bodies/BodyRole.hpp"
#include "stack-sim/src/Bodies/BoundingBox.hpp"
#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/DataTypes/Vector3D.hpp"
#include "stack-sim/src/Environment/ReferenceFrame.hpp"

namespace stack_sim
{

/**
 * @brief A box-shaped body taking part in the tower.
 *
 * Read-only input to the stability analysis. Position, orientation and
 * velocities are owned by the host simulation, which writes them back every
 * step through the setters below.
 *
 * The collider is an oriented box centred on the frame origin with the given
 * half-extents in the local frame. The centre of mass sits at
 * @c centerOfMassOffset in the local frame.
 *
 * Base bodies are treated as immovable: their mass does not enter the tower
 * centroid and they never originate contacts.
 */
class StackedObject
{
public:
  /**
   * @brief Construct a body.
   *
   * @param instanceId Stable identifier assigned by the owner
   * @param role Base or Piece
   * @param halfExtents Local half-size of the box collider [m], all > 0
   * @param frame Initial position and orientation
   * @param mass Mass [kg], > 0 for pieces; ignored for bases
   * @param centerOfMassOffset Centre of mass in the local frame [m]
   * @throws std::invalid_argument if a half-extent is not positive, or a
   *         piece has non-positive mass
   */
  StackedObject(uint32_t instanceId,
                BodyRole role,
                const Coordinate& halfExtents,
                const ReferenceFrame& frame,
                double mass = 1.0,
                const Coordinate& centerOfMassOffset = Coordinate{});

  [[nodiscard]] uint32_t getInstanceId() const
  {
    return instanceId_;
  }

  [[nodiscard]] BodyRole getRole() const
  {
    return role_;
  }

  [[nodiscard]] bool isPiece() const
  {
    return role_ == BodyRole::Piece;
  }

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  [[nodiscard]] const Coordinate& getHalfExtents() const
  {
    return halfExtents_;
  }

  [[nodiscard]] const Coordinate& getCenterOfMassOffset() const
  {
    return centerOfMassOffset_;
  }

  [[nodiscard]] const ReferenceFrame& getReferenceFrame() const
  {
    return frame_;
  }

  [[nodiscard]] const Coordinate& getPosition() const
  {
    return frame_.getOrigin();
  }

  [[nodiscard]] const Eigen::Quaterniond& getOrientation() const
  {
    return frame_.getOrientation();
  }

  [[nodiscard]] const Vector3D& getLinearVelocity() const
  {
    return linearVelocity_;
  }

  [[nodiscard]] const Vector3D& getAngularVelocity() const
  {
    return angularVelocity_;
  }

  /**
   * @brief Centre of mass in world coordinates
   */
  [[nodiscard]] Coordinate getWorldCenterOfMass() const;

  /**
   * @brief World direction of the body's local +y axis
   */
  [[nodiscard]] Vector3D getUpAxis() const;

  /**
   * @brief World axis-aligned box enclosing the oriented collider
   */
  [[nodiscard]] BoundingBox getWorldBoundingBox() const;

  /**
   * @brief Closest point on the oriented collider to a world point
   *
   * Returns @p point itself when it lies inside the collider.
   */
  [[nodiscard]] Coordinate closestPoint(const Coordinate& point) const;

  void setPose(const Coordinate& position,
               const Eigen::Quaterniond& orientation);

  void setVelocities(const Vector3D& linear, const Vector3D& angular);

private:
  uint32_t instanceId_;
  BodyRole role_;
  Coordinate halfExtents_;
  ReferenceFrame frame_;
  double mass_;
  Coordinate centerOfMassOffset_;
  Vector3D linearVelocity_;
  Vector3D angularVelocity_;
};

}  // namespace stack_sim

#endif  // STACK_SIM_BODIES_STACKED_OBJECT_HPP
