// Ticket: 0005_stability_scoring
// Test: StabilityScorer sub-scores and weighted combination

#include <gtest/gtest.h>

#include <cmath>
#include <optional>
#include <vector>

#include "stack-sim/src/Geometry/SupportPolygon.hpp"
#include "stack-sim/src/Stability/StabilityConfig.hpp"
#include "stack-sim/src/Stability/StabilityScorer.hpp"
#include "stack-sim/test/Helpers/TowerScenario.hpp"

namespace stack_sim
{
namespace test
{

static SupportPolygon squarePolygon()
{
  return SupportPolygon::fromPoints(TowerScenario::squareFootprint(), 3);
}

// ========== Mass position ==========

TEST(StabilityScorer, MassPosition_CentredInSquare_Is100)
{
  StabilityConfig const config;

  double const score = StabilityScorer::massPositionScore(
    squarePolygon(), Coordinate{1.0, 0.0, 1.0}, config);

  EXPECT_DOUBLE_EQ(score, 100.0);
}

TEST(StabilityScorer, MassPosition_UsesGroundProjection)
{
  StabilityConfig const config;

  double const score = StabilityScorer::massPositionScore(
    squarePolygon(), Coordinate{1.0, 7.5, 1.0}, config);

  EXPECT_DOUBLE_EQ(score, 100.0);
}

TEST(StabilityScorer, MassPosition_ApproachingEdge_DecreasesStrictly)
{
  StabilityConfig const config;
  auto const polygon = squarePolygon();

  double previous = 100.0;
  for (double x : {1.3, 1.5, 1.7, 1.9, 1.95, 1.99})
  {
    double const score = StabilityScorer::massPositionScore(
      polygon, Coordinate{x, 0.0, 1.0}, config);
    EXPECT_GT(score, 0.0) << "x = " << x;
    EXPECT_LT(score, previous) << "x = " << x;
    previous = score;
  }
}

TEST(StabilityScorer, MassPosition_NearEdge_MatchesMarginRatio)
{
  StabilityConfig const config;

  // 0.01 from the edge, max vertex radius sqrt(2)
  double const expected = 0.01 / std::sqrt(2.0) / 0.7 * 100.0;
  double const score = StabilityScorer::massPositionScore(
    squarePolygon(), Coordinate{1.99, 0.0, 1.0}, config);

  EXPECT_NEAR(score, expected, 1e-9);
}

TEST(StabilityScorer, MassPosition_Outside_IsZero)
{
  StabilityConfig const config;

  EXPECT_DOUBLE_EQ(StabilityScorer::massPositionScore(
                     squarePolygon(), Coordinate{2.01, 0.0, 1.0}, config),
                   0.0);
  EXPECT_DOUBLE_EQ(StabilityScorer::massPositionScore(
                     squarePolygon(), Coordinate{-3.0, 0.0, -3.0}, config),
                   0.0);
}

TEST(StabilityScorer, MassPosition_TooFewVertices_IsFallback)
{
  StabilityConfig const config;
  auto const polygon = SupportPolygon::fromPoints(
    {Coordinate{0.0, 0.0, 0.0}, Coordinate{2.0, 0.0, 0.0}}, 3);

  EXPECT_DOUBLE_EQ(StabilityScorer::massPositionScore(
                     polygon, Coordinate{1.0, 0.0, 0.0}, config),
                   50.0);
}

// ========== Contact quality ==========

TEST(StabilityScorer, ContactQuality_FullAreaEvenSpread_Is100)
{
  StabilityConfig const config;

  // 4 m^2 footprint, 2 pieces expect 4 m^2
  EXPECT_NEAR(
    StabilityScorer::contactQualityScore(squarePolygon(), 2, config), 100.0, 1e-9);
}

TEST(StabilityScorer, ContactQuality_AreaRatioIsCapped)
{
  StabilityConfig const config;

  EXPECT_NEAR(
    StabilityScorer::contactQualityScore(squarePolygon(), 1, config), 100.0, 1e-9);
}

TEST(StabilityScorer, ContactQuality_HalfExpectedArea)
{
  StabilityConfig const config;

  // area ratio 0.5, distribution 1 -> (0.7 * 0.5 + 0.3) * 100
  EXPECT_NEAR(
    StabilityScorer::contactQualityScore(squarePolygon(), 4, config), 65.0, 1e-9);
}

TEST(StabilityScorer, ContactQuality_NoReliablePolygon_IsZero)
{
  StabilityConfig const config;

  EXPECT_DOUBLE_EQ(
    StabilityScorer::contactQualityScore(SupportPolygon{}, 3, config), 0.0);
  EXPECT_DOUBLE_EQ(
    StabilityScorer::contactQualityScore(squarePolygon(), 0, config), 0.0);
}

TEST(StabilityScorer, Distribution_EquidistantVertices_IsOne)
{
  EXPECT_NEAR(StabilityScorer::contactDistribution(
                squarePolygon().getVertices()),
              1.0,
              1e-12);
}

TEST(StabilityScorer, Distribution_UnevenVertices_IsBelowOne)
{
  std::vector<Coordinate> triangle{Coordinate{0.0, 0.0, 0.0},
                                   Coordinate{2.0, 0.0, 0.0},
                                   Coordinate{0.0, 0.0, 2.0}};

  double const distribution = StabilityScorer::contactDistribution(triangle);

  EXPECT_GT(distribution, 0.0);
  EXPECT_LT(distribution, 1.0);
}

TEST(StabilityScorer, Distribution_Degenerate_IsZero)
{
  std::vector<Coordinate> single{Coordinate{1.0, 0.0, 1.0}};
  std::vector<Coordinate> coincident(3, Coordinate{1.0, 0.0, 1.0});

  EXPECT_DOUBLE_EQ(StabilityScorer::contactDistribution(single), 0.0);
  EXPECT_DOUBLE_EQ(StabilityScorer::contactDistribution(coincident), 0.0);
}

// ========== Oscillation ==========

TEST(StabilityScorer, Oscillation_WindowNotFull_IsNeutral)
{
  StabilityConfig const config;

  EXPECT_DOUBLE_EQ(StabilityScorer::oscillationScore(std::nullopt, config),
                   100.0);
}

TEST(StabilityScorer, Oscillation_ScalesLinearlyToZero)
{
  StabilityConfig const config;

  EXPECT_DOUBLE_EQ(StabilityScorer::oscillationScore(0.0, config), 100.0);
  EXPECT_NEAR(StabilityScorer::oscillationScore(0.25, config), 50.0, 1e-12);
  EXPECT_DOUBLE_EQ(StabilityScorer::oscillationScore(0.5, config), 0.0);
  EXPECT_DOUBLE_EQ(StabilityScorer::oscillationScore(2.0, config), 0.0);
}

// ========== Tilt ==========

TEST(StabilityScorer, Tilt_NoPieces_Is100)
{
  StabilityConfig const config;
  std::vector<StackedObject> objects{TowerScenario::foundation()};

  EXPECT_DOUBLE_EQ(StabilityScorer::tiltScore(objects, config), 100.0);
  EXPECT_FALSE(StabilityScorer::averageTiltDegrees(objects).has_value());
}

TEST(StabilityScorer, Tilt_Upright_Is100)
{
  StabilityConfig const config;
  auto const objects = TowerScenario::fourCornerTower();

  EXPECT_NEAR(StabilityScorer::tiltScore(objects, config), 100.0, 1e-9);
}

TEST(StabilityScorer, Tilt_ScalesWithAverageAngle)
{
  StabilityConfig const config;
  std::vector<StackedObject> objects{TowerScenario::cube(
    1, Coordinate{0.0, 0.5, 0.0}, 1.0, TowerScenario::tiltAboutX(15.0))};

  auto const angle = StabilityScorer::averageTiltDegrees(objects);

  ASSERT_TRUE(angle.has_value());
  EXPECT_NEAR(*angle, 15.0, 1e-9);
  EXPECT_NEAR(StabilityScorer::tiltScore(objects, config), 50.0, 1e-7);
}

TEST(StabilityScorer, Tilt_BeyondLimit_IsZero)
{
  StabilityConfig const config;
  std::vector<StackedObject> objects{TowerScenario::cube(
    1, Coordinate{0.0, 0.5, 0.0}, 1.0, TowerScenario::tiltAboutX(45.0))};

  EXPECT_DOUBLE_EQ(StabilityScorer::tiltScore(objects, config), 0.0);
}

TEST(StabilityScorer, Tilt_OpposingAxesCancel_IsZero)
{
  StabilityConfig const config;
  std::vector<StackedObject> objects{
    TowerScenario::cube(
      1, Coordinate{0.0, 0.5, 0.0}, 1.0, TowerScenario::tiltAboutX(90.0)),
    TowerScenario::cube(
      2, Coordinate{3.0, 0.5, 0.0}, 1.0, TowerScenario::tiltAboutX(-90.0))};

  EXPECT_FALSE(StabilityScorer::averageTiltDegrees(objects).has_value());
  EXPECT_DOUBLE_EQ(StabilityScorer::tiltScore(objects, config), 0.0);
}

// ========== Combination ==========

TEST(StabilityScorer, Combine_AppliesWeights)
{
  StabilityWeights const weights;

  EXPECT_NEAR(StabilityScorer::combine(StabilityBreakdown{}, weights), 100.0, 1e-9);
  EXPECT_NEAR(
    StabilityScorer::combine(StabilityBreakdown{0.0, 100.0, 100.0, 100.0}, weights),
    60.0,
    1e-9);
  EXPECT_NEAR(
    StabilityScorer::combine(StabilityBreakdown{50.0, 20.0, 100.0, 0.0}, weights),
    46.0,
    1e-9);
}

TEST(StabilityScorer, Combine_ClampsToRange)
{
  StabilityWeights weights;
  weights.massPosition = 2.0;

  EXPECT_DOUBLE_EQ(StabilityScorer::combine(StabilityBreakdown{}, weights), 100.0);
}

}  // namespace test
}  // namespace stack_sim
