// Ticket: 0003_support_polygon

#ifndef STACK_SIM_GEOMETRY_POLYGON_UTILS_HPP
#define STACK_SIM_GEOMETRY_POLYGON_UTILS_HPP

#include <span>

#include "stack-sim/src/DataTypes/Coordinate.hpp"

namespace stack_sim
{
namespace geometry
{

/**
 * All functions in this namespace work in the ground plane: they read the x
 * and z components of their arguments and ignore y. Polygons are ordered
 * vertex lists with an implicit closing edge from the last vertex back to the
 * first.
 */

/**
 * @brief z-component of (b - a) x (c - a) in the (x, z) plane
 *
 * Positive when a -> b -> c turns counter-clockwise in the (x, z) parameter
 * plane, zero when the three points are collinear.
 */
double cross2D(const Coordinate& a, const Coordinate& b, const Coordinate& c);

/**
 * @brief Even-odd ray casting test along +x
 *
 * Boundary points follow the half-open rule of the crossing test. For an
 * axis-aligned rectangle, points on the min-x and min-z edges count as
 * inside and points on the max-x and max-z edges as outside. Polygons with
 * fewer than 3 vertices contain nothing.
 */
bool isPointInPolygon(const Coordinate& point,
                      std::span<const Coordinate> polygon);

/**
 * @brief Ground-plane distance from a point to the closed segment [a, b]
 *
 * Degenerate segments (a == b) return the distance to a.
 */
double distancePointToSegment(const Coordinate& point,
                              const Coordinate& a,
                              const Coordinate& b);

/**
 * @brief Smallest distance from a point to any polygon edge
 * @return +inf for an empty polygon
 */
double distanceToPolygonBoundary(const Coordinate& point,
                                 std::span<const Coordinate> polygon);

/**
 * @brief Shoelace area, positive for counter-clockwise (x, z) winding
 */
double signedPolygonArea(std::span<const Coordinate> polygon);

/**
 * @brief Absolute shoelace area
 */
double polygonArea(std::span<const Coordinate> polygon);

/**
 * @brief Arithmetic mean of the vertices (y = 0)
 * @return Origin for an empty polygon
 */
Coordinate vertexCentroid(std::span<const Coordinate> polygon);

/**
 * @brief Largest ground-plane distance from @p center to any vertex
 */
double maxVertexRadius(std::span<const Coordinate> polygon,
                       const Coordinate& center);

}  // namespace geometry
}  // namespace stack_sim

#endif  // STACK_SIM_GEOMETRY_POLYGON_UTILS_HPP
