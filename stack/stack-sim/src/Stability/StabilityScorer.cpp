// Ticket: 0005_stability_scoring

#include "stack-sim/src/Stability/StabilityScorer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "stack-sim/src/Geometry/PolygonUtils.hpp"

namespace stack_sim
{

namespace
{

double clamp01(double value)
{
  return std::clamp(value, 0.0, 1.0);
}

// Below this length the average up axis has no meaningful direction
constexpr double kMinUpAxisLength{1e-9};

}  // namespace

double StabilityScorer::massPositionScore(const SupportPolygon& polygon,
                                          const Coordinate& centerOfMass,
                                          const StabilityConfig& config)
{
  if (polygon.getVertexCount() < config.minContactPoints)
  {
    return config.massPositionFallback;
  }

  Coordinate const projected = projectToGround(centerOfMass);
  if (!polygon.contains(projected))
  {
    return 0.0;
  }

  auto vertices = polygon.getVertices();
  double const edgeDistance =
    geometry::distanceToPolygonBoundary(projected, vertices);
  double const radius =
    geometry::maxVertexRadius(vertices, geometry::vertexCentroid(vertices));
  if (radius <= 0.0)
  {
    return config.massPositionFallback;
  }

  double const normalized = edgeDistance / radius;
  return clamp01(normalized / config.centerOfMassThreshold) * 100.0;
}

double StabilityScorer::contactQualityScore(const SupportPolygon& polygon,
                                            size_t pieceCount,
                                            const StabilityConfig& config)
{
  if (polygon.getVertexCount() < config.minContactPoints || pieceCount == 0)
  {
    return 0.0;
  }

  double const expectedArea =
    static_cast<double>(pieceCount) * config.expectedAreaPerPiece;
  double const areaRatio = clamp01(polygon.area() / expectedArea);
  double const distribution = contactDistribution(polygon.getVertices());

  return (config.areaWeight * areaRatio +
          config.distributionWeight * distribution) *
         100.0;
}

double StabilityScorer::contactDistribution(
  std::span<const Coordinate> vertices)
{
  if (vertices.size() < 2)
  {
    return 0.0;
  }

  Coordinate const center = geometry::vertexCentroid(vertices);
  auto const count = static_cast<double>(vertices.size());

  double meanDistance = 0.0;
  for (const auto& vertex : vertices)
  {
    meanDistance += Coordinate{vertex - center}.groundNorm();
  }
  meanDistance /= count;

  if (meanDistance <= 0.0)
  {
    return 0.0;
  }

  double variance = 0.0;
  for (const auto& vertex : vertices)
  {
    double const deviation =
      Coordinate{vertex - center}.groundNorm() - meanDistance;
    variance += deviation * deviation;
  }
  variance /= count;

  return clamp01(1.0 - variance / (meanDistance * meanDistance));
}

double StabilityScorer::oscillationScore(
  std::optional<double> oscillationMagnitude,
  const StabilityConfig& config)
{
  if (!oscillationMagnitude)
  {
    return 100.0;
  }
  return clamp01(1.0 - *oscillationMagnitude / config.maxAllowedOscillation) *
         100.0;
}

std::optional<double> StabilityScorer::averageTiltDegrees(
  std::span<const StackedObject> objects)
{
  Eigen::Vector3d upSum = Eigen::Vector3d::Zero();
  size_t count = 0;
  for (const auto& object : objects)
  {
    if (!object.isPiece())
    {
      continue;
    }
    upSum += object.getUpAxis();
    ++count;
  }

  if (count == 0)
  {
    return std::nullopt;
  }

  Eigen::Vector3d const averageUp = upSum / static_cast<double>(count);
  double const length = averageUp.norm();
  if (length < kMinUpAxisLength)
  {
    return std::nullopt;
  }

  double const cosine =
    std::clamp(averageUp.dot(Vector3D::up()) / length, -1.0, 1.0);
  return std::acos(cosine) * 180.0 / std::numbers::pi;
}

double StabilityScorer::tiltScore(std::span<const StackedObject> objects,
                                  const StabilityConfig& config)
{
  bool const hasPieces =
    std::any_of(objects.begin(),
                objects.end(),
                [](const StackedObject& object) { return object.isPiece(); });
  if (!hasPieces)
  {
    return 100.0;
  }

  std::optional<double> const angle = averageTiltDegrees(objects);
  if (!angle)
  {
    return 0.0;
  }
  return clamp01(1.0 - *angle / config.maxAllowedTiltDegrees) * 100.0;
}

double StabilityScorer::combine(const StabilityBreakdown& breakdown,
                                const StabilityWeights& weights)
{
  double const total = breakdown.massPosition * weights.massPosition +
                       breakdown.contactQuality * weights.contactQuality +
                       breakdown.oscillation * weights.oscillation +
                       breakdown.tilt * weights.tilt;
  return std::clamp(total, 0.0, 100.0);
}

}  // namespace stack_sim
