// Ticket: 0003_support_polygon
// Test: ground-plane polygon helpers

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/Geometry/PolygonUtils.hpp"
#include "stack-sim/src/Geometry/SupportPolygon.hpp"
#include "stack-sim/test/Helpers/TowerScenario.hpp"

namespace stack_sim
{
namespace test
{

// Hull of the square footprint: (0,0) -> (2,0) -> (2,2) -> (0,2)
static std::vector<Coordinate> squareHull()
{
  return computeConvexHull(TowerScenario::squareFootprint());
}

// ========== isPointInPolygon ==========

TEST(PolygonUtils, PointInPolygon_Centre_IsInside)
{
  EXPECT_TRUE(
    geometry::isPointInPolygon(Coordinate{1.0, 0.0, 1.0}, squareHull()));
}

TEST(PolygonUtils, PointInPolygon_Outside_IsOutside)
{
  auto const hull = squareHull();

  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{3.0, 0.0, 1.0}, hull));
  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{-0.5, 0.0, 1.0}, hull));
  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{1.0, 0.0, 2.5}, hull));
}

TEST(PolygonUtils, PointInPolygon_HeightIsIgnored)
{
  EXPECT_TRUE(
    geometry::isPointInPolygon(Coordinate{1.0, 42.0, 1.0}, squareHull()));
}

TEST(PolygonUtils, PointInPolygon_MinEdges_CountAsInside)
{
  auto const hull = squareHull();

  EXPECT_TRUE(geometry::isPointInPolygon(Coordinate{0.0, 0.0, 1.0}, hull));
  EXPECT_TRUE(geometry::isPointInPolygon(Coordinate{1.0, 0.0, 0.0}, hull));
}

TEST(PolygonUtils, PointInPolygon_MaxEdges_CountAsOutside)
{
  auto const hull = squareHull();

  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{2.0, 0.0, 1.0}, hull));
  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{1.0, 0.0, 2.0}, hull));
}

TEST(PolygonUtils, PointInPolygon_DegeneratePolygon_IsOutside)
{
  std::vector<Coordinate> segment{Coordinate{0.0, 0.0, 0.0},
                                  Coordinate{2.0, 0.0, 2.0}};

  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{1.0, 0.0, 1.0}, segment));
  EXPECT_FALSE(geometry::isPointInPolygon(Coordinate{1.0, 0.0, 1.0}, {}));
}

// ========== Distances ==========

TEST(PolygonUtils, DistanceToSegment_ProjectsOntoInterior)
{
  double const d = geometry::distancePointToSegment(Coordinate{1.0, 0.0, 1.0},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Coordinate{2.0, 0.0, 0.0});
  EXPECT_NEAR(d, 1.0, 1e-12);
}

TEST(PolygonUtils, DistanceToSegment_ClampsToEndpoint)
{
  double const d = geometry::distancePointToSegment(Coordinate{5.0, 0.0, 4.0},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Coordinate{2.0, 0.0, 0.0});
  EXPECT_NEAR(d, 5.0, 1e-12);
}

TEST(PolygonUtils, DistanceToSegment_DegenerateSegment_IsPointDistance)
{
  double const d = geometry::distancePointToSegment(Coordinate{3.0, 7.0, 4.0},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Coordinate{0.0, 0.0, 0.0});
  EXPECT_NEAR(d, 5.0, 1e-12);
}

TEST(PolygonUtils, DistanceToBoundary_NearestEdgeWins)
{
  auto const hull = squareHull();

  EXPECT_NEAR(geometry::distanceToPolygonBoundary(Coordinate{1.0, 0.0, 1.0}, hull),
              1.0,
              1e-12);
  EXPECT_NEAR(
    geometry::distanceToPolygonBoundary(Coordinate{1.9, 0.0, 1.0}, hull),
    0.1,
    1e-12);
}

TEST(PolygonUtils, DistanceToBoundary_EmptyPolygon_IsInfinite)
{
  EXPECT_EQ(geometry::distanceToPolygonBoundary(Coordinate{0.0, 0.0, 0.0}, {}),
            std::numeric_limits<double>::infinity());
}

// ========== Area and centroid ==========

TEST(PolygonUtils, SignedArea_FlipsWithWinding)
{
  std::vector<Coordinate> forward{Coordinate{0.0, 0.0, 0.0},
                                  Coordinate{2.0, 0.0, 0.0},
                                  Coordinate{2.0, 0.0, 2.0},
                                  Coordinate{0.0, 0.0, 2.0}};
  std::vector<Coordinate> reversed(forward.rbegin(), forward.rend());

  EXPECT_NEAR(geometry::signedPolygonArea(forward), 4.0, 1e-12);
  EXPECT_NEAR(geometry::signedPolygonArea(reversed), -4.0, 1e-12);
  EXPECT_NEAR(geometry::polygonArea(reversed), 4.0, 1e-12);
}

TEST(PolygonUtils, VertexCentroid_AveragesGroundPositions)
{
  std::vector<Coordinate> points{Coordinate{0.0, 5.0, 0.0},
                                 Coordinate{4.0, 5.0, 0.0},
                                 Coordinate{4.0, 5.0, 2.0},
                                 Coordinate{0.0, 5.0, 2.0}};

  Coordinate const centre = geometry::vertexCentroid(points);

  EXPECT_NEAR(centre.x(), 2.0, 1e-12);
  EXPECT_DOUBLE_EQ(centre.y(), 0.0);
  EXPECT_NEAR(centre.z(), 1.0, 1e-12);
}

TEST(PolygonUtils, MaxVertexRadius_Square)
{
  auto const hull = squareHull();

  EXPECT_NEAR(geometry::maxVertexRadius(hull, Coordinate{1.0, 0.0, 1.0}),
              std::sqrt(2.0),
              1e-12);
}

}  // namespace test
}  // namespace stack_sim
