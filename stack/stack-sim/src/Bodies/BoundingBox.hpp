// Ticket: 0002_tower_model

#ifndef STACK_SIM_BODIES_BOUNDING_BOX_HPP
#define STACK_SIM_BODIES_BOUNDING_BOX_HPP

#include "stack-sim/src/DataTypes/Coordinate.hpp"

namespace stack_sim
{

/**
 * @brief Axis-aligned bounding box in world space.
 *
 * Used as the broad-phase volume for contact detection between stacked
 * bodies.
 */
struct BoundingBox
{
  Coordinate min;  // Minimum corner
  Coordinate max;  // Maximum corner

  [[nodiscard]] Coordinate center() const;

  /**
   * @brief Half-size along each axis
   */
  [[nodiscard]] Coordinate extents() const;

  /**
   * @brief Inclusive overlap test
   *
   * Boxes that merely touch, or whose gap along every axis is at most
   * @p tolerance, count as overlapping.
   *
   * @param other Box to test against
   * @param tolerance Contact offset [m], must be >= 0
   * @return true if no axis separates the boxes by more than tolerance
   */
  [[nodiscard]] bool overlaps(const BoundingBox& other,
                              double tolerance = 0.0) const;

  /**
   * @brief Closest point inside the box to @p point
   *
   * Returns @p point itself when it lies inside the box.
   */
  [[nodiscard]] Coordinate closestPoint(const Coordinate& point) const;
};

}  // namespace stack_sim

#endif  // STACK_SIM_BODIES_BOUNDING_BOX_HPP
