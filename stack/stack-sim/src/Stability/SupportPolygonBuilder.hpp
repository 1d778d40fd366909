// Ticket: 0003_support_polygon

#ifndef STACK_SIM_STABILITY_SUPPORT_POLYGON_BUILDER_HPP
#define STACK_SIM_STABILITY_SUPPORT_POLYGON_BUILDER_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/Geometry/SupportPolygon.hpp"

namespace stack_sim
{

/**
 * @brief Builds the tower's ground footprint from body contacts.
 *
 * Every piece is tested against every other body (base or piece). For each
 * pair whose bounding boxes overlap within @c contactTolerance, the closest
 * point on the piece's collider to the partner's box centre is taken as the
 * contact and projected onto the ground plane. Candidates closer than
 * @c mergeDistance to an already accepted point are dropped (first seen
 * wins). With at least @c minContactPoints points the convex hull is taken,
 * otherwise the merged points are returned as-is.
 *
 * Stateless apart from its parameters; does not modify the bodies.
 */
class SupportPolygonBuilder
{
public:
  /**
   * @param mergeDistance Contact merge radius [m], >= 0
   * @param minContactPoints Minimum points for the hull step, >= 3
   * @param contactTolerance Overlap slack for touching boxes [m], >= 0
   * @throws std::invalid_argument on out-of-range parameters
   */
  SupportPolygonBuilder(double mergeDistance,
                        size_t minContactPoints,
                        double contactTolerance);

  /**
   * @brief Compute the support polygon for the current body set
   */
  [[nodiscard]] SupportPolygon build(
    std::span<const StackedObject> objects) const;

  /**
   * @brief Detect and merge ground-projected contact points
   *
   * Exposed separately so callers can inspect the raw contacts.
   */
  [[nodiscard]] std::vector<Coordinate> collectContactPoints(
    std::span<const StackedObject> objects) const;

  /**
   * @brief Append @p candidate unless an accepted point lies within the
   * merge distance
   * @return true if the candidate was accepted
   */
  bool mergeContactPoint(std::vector<Coordinate>& accepted,
                         const Coordinate& candidate) const;

private:
  double mergeDistance_;
  size_t minContactPoints_;
  double contactTolerance_;
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_SUPPORT_POLYGON_BUILDER_HPP
