// Ticket: 0003_support_polygon

#include "stack-sim/src/Geometry/SupportPolygon.hpp"

#include <algorithm>
#include <utility>

#include "stack-sim/src/Geometry/PolygonUtils.hpp"

namespace stack_sim
{

std::vector<Coordinate> computeConvexHull(std::vector<Coordinate> points)
{
  if (points.size() < 3)
  {
    return points;
  }

  std::sort(points.begin(),
            points.end(),
            [](const Coordinate& a, const Coordinate& b)
            {
              if (a.x() != b.x())
              {
                return a.x() < b.x();
              }
              return a.z() < b.z();
            });

  std::vector<Coordinate> lower;
  lower.reserve(points.size());
  for (const auto& p : points)
  {
    while (lower.size() >= 2 &&
           geometry::cross2D(lower[lower.size() - 2], lower.back(), p) <= 0.0)
    {
      lower.pop_back();
    }
    lower.push_back(p);
  }

  std::vector<Coordinate> upper;
  upper.reserve(points.size());
  for (auto it = points.rbegin(); it != points.rend(); ++it)
  {
    while (upper.size() >= 2 &&
           geometry::cross2D(upper[upper.size() - 2], upper.back(), *it) <= 0.0)
    {
      upper.pop_back();
    }
    upper.push_back(*it);
  }

  // Last point of each chain is the first point of the other
  lower.pop_back();
  upper.pop_back();

  lower.insert(lower.end(), upper.begin(), upper.end());
  return lower;
}

SupportPolygon::SupportPolygon(std::vector<Coordinate> vertices,
                               bool hullComputed)
  : vertices_{std::move(vertices)}, hullComputed_{hullComputed}
{
}

SupportPolygon SupportPolygon::fromPoints(std::vector<Coordinate> points,
                                          size_t minContactPoints)
{
  if (points.size() < minContactPoints || points.size() < 3)
  {
    return SupportPolygon{std::move(points), false};
  }
  return SupportPolygon{computeConvexHull(std::move(points)), true};
}

double SupportPolygon::area() const
{
  if (!hullComputed_)
  {
    return 0.0;
  }
  return geometry::polygonArea(vertices_);
}

bool SupportPolygon::contains(const Coordinate& point) const
{
  return geometry::isPointInPolygon(point, vertices_);
}

}  // namespace stack_sim
