// Ticket: 0003_support_polygon

#include "stack-sim/src/Geometry/PolygonUtils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace stack_sim
{
namespace geometry
{

double cross2D(const Coordinate& a, const Coordinate& b, const Coordinate& c)
{
  return (b.x() - a.x()) * (c.z() - a.z()) - (b.z() - a.z()) * (c.x() - a.x());
}

bool isPointInPolygon(const Coordinate& point,
                      std::span<const Coordinate> polygon)
{
  if (polygon.size() < 3)
  {
    return false;
  }

  bool inside = false;
  size_t j = polygon.size() - 1;
  for (size_t i = 0; i < polygon.size(); ++i)
  {
    const Coordinate& pi = polygon[i];
    const Coordinate& pj = polygon[j];

    // Edge straddles the horizontal line through the point; the division is
    // safe because straddling implies pi.z != pj.z.
    if ((pi.z() > point.z()) != (pj.z() > point.z()))
    {
      double const crossingX =
        (pj.x() - pi.x()) * (point.z() - pi.z()) / (pj.z() - pi.z()) + pi.x();
      if (point.x() < crossingX)
      {
        inside = !inside;
      }
    }
    j = i;
  }

  return inside;
}

double distancePointToSegment(const Coordinate& point,
                              const Coordinate& a,
                              const Coordinate& b)
{
  Eigen::Vector2d const p = point.ground();
  Eigen::Vector2d const start = a.ground();
  Eigen::Vector2d const segment = b.ground() - start;

  double const lengthSquared = segment.squaredNorm();
  if (lengthSquared <= 0.0)
  {
    return (p - start).norm();
  }

  double const t =
    std::clamp((p - start).dot(segment) / lengthSquared, 0.0, 1.0);
  return (p - (start + t * segment)).norm();
}

double distanceToPolygonBoundary(const Coordinate& point,
                                 std::span<const Coordinate> polygon)
{
  double minDistance = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < polygon.size(); ++i)
  {
    const Coordinate& a = polygon[i];
    const Coordinate& b = polygon[(i + 1) % polygon.size()];
    minDistance = std::min(minDistance, distancePointToSegment(point, a, b));
  }
  return minDistance;
}

double signedPolygonArea(std::span<const Coordinate> polygon)
{
  double twiceArea = 0.0;
  for (size_t i = 0; i < polygon.size(); ++i)
  {
    const Coordinate& p1 = polygon[i];
    const Coordinate& p2 = polygon[(i + 1) % polygon.size()];
    twiceArea += p1.x() * p2.z() - p2.x() * p1.z();
  }
  return 0.5 * twiceArea;
}

double polygonArea(std::span<const Coordinate> polygon)
{
  return std::abs(signedPolygonArea(polygon));
}

Coordinate vertexCentroid(std::span<const Coordinate> polygon)
{
  if (polygon.empty())
  {
    return Coordinate{};
  }

  Eigen::Vector2d sum = Eigen::Vector2d::Zero();
  for (const auto& vertex : polygon)
  {
    sum += vertex.ground();
  }
  sum /= static_cast<double>(polygon.size());
  return Coordinate{sum.x(), 0.0, sum.y()};
}

double maxVertexRadius(std::span<const Coordinate> polygon,
                       const Coordinate& center)
{
  Eigen::Vector2d const c = center.ground();
  double radius = 0.0;
  for (const auto& vertex : polygon)
  {
    radius = std::max(radius, (vertex.ground() - c).norm());
  }
  return radius;
}

}  // namespace geometry
}  // namespace stack_sim
