// Ticket: 0002_tower_model

#include "stack-sim/src/Bodies/BoundingBox.hpp"

namespace stack_sim
{

Coordinate BoundingBox::center() const
{
  return 0.5 * (min + max);
}

Coordinate BoundingBox::extents() const
{
  return 0.5 * (max - min);
}

bool BoundingBox::overlaps(const BoundingBox& other, double tolerance) const
{
  // Separating axis test on the three world axes
  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    if (min[axis] - other.max[axis] > tolerance ||
        other.min[axis] - max[axis] > tolerance)
    {
      return false;
    }
  }
  return true;
}

Coordinate BoundingBox::closestPoint(const Coordinate& point) const
{
  return point.cwiseMax(min).cwiseMin(max);
}

}  // namespace stack_sim
