// Ticket: 0003_support_polygon

#ifndef STACK_SIM_GEOMETRY_SUPPORT_POLYGON_HPP
#define STACK_SIM_GEOMETRY_SUPPORT_POLYGON_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "stack-sim/src/DataTypes/Coordinate.hpp"

namespace stack_sim
{

/**
 * @brief Compute the 2D convex hull of ground-plane points.
 *
 * Monotone chain: points are sorted by (x, then z) ascending, the lower hull
 * is built keeping only strict left turns (cross2D > 0), the upper hull is
 * built the same way over the reverse order, and the two chains are joined
 * with their duplicated endpoints dropped.
 *
 * Output winding is counter-clockwise in the (x, z) parameter plane, so
 * geometry::signedPolygonArea() of the result is positive. Seen from above
 * (+y looking down) that is clockwise. The first vertex is the smallest
 * (x, z) point. Collinear and interior points are discarded, so an all
 * collinear input collapses to its two extreme points.
 *
 * Inputs with fewer than 3 points are returned unchanged.
 *
 * @param points Ground-plane points (y is ignored and copied through)
 * @return Hull vertices
 */
std::vector<Coordinate> computeConvexHull(std::vector<Coordinate> points);

/**
 * @brief Ground footprint the tower rests on.
 *
 * Either the convex hull of the merged contact points (reliable), or, when
 * too few contacts were found for the hull step, the merged points in the
 * order they were detected (unreliable). Scoring treats an unreliable
 * polygon as "no proven support".
 */
class SupportPolygon
{
public:
  SupportPolygon() = default;

  /**
   * @brief Wrap an already-computed vertex list
   * @param vertices Ground-plane points (y = 0)
   * @param hullComputed true if @p vertices is a convex hull
   */
  SupportPolygon(std::vector<Coordinate> vertices, bool hullComputed);

  /**
   * @brief Build from raw ground-plane points
   *
   * Runs computeConvexHull() when at least @p minContactPoints points are
   * given, otherwise keeps the raw list.
   */
  static SupportPolygon fromPoints(std::vector<Coordinate> points,
                                   size_t minContactPoints);

  [[nodiscard]] std::span<const Coordinate> getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] size_t getVertexCount() const
  {
    return vertices_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return vertices_.empty();
  }

  /**
   * @brief True if the hull step ran on these vertices
   */
  [[nodiscard]] bool isHull() const
  {
    return hullComputed_;
  }

  /**
   * @brief Absolute ground-plane area; zero unless this is a hull
   */
  [[nodiscard]] double area() const;

  /**
   * @brief Even-odd containment of a point's ground projection
   */
  [[nodiscard]] bool contains(const Coordinate& point) const;

private:
  std::vector<Coordinate> vertices_;
  bool hullComputed_{false};
};

}  // namespace stack_sim

#endif  // STACK_SIM_GEOMETRY_SUPPORT_POLYGON_HPP
