// Ticket: 0005_stability_scoring

#ifndef STACK_SIM_STABILITY_STABILITY_SCORER_HPP
#define STACK_SIM_STABILITY_STABILITY_SCORER_HPP

#include <cstddef>
#include <optional>
#include <span>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/Geometry/SupportPolygon.hpp"
#include "stack-sim/src/Stability/StabilityConfig.hpp"
#include "stack-sim/src/Stability/StabilityInfo.hpp"

namespace stack_sim
{

/**
 * @brief Stability sub-score computation
 *
 * Static functions, one per sub-score, each returning a value in [0, 100],
 * plus the weighted combination. Degenerate input never throws; each
 * function documents the value it falls back to.
 *
 * Weighted sum (default weights):
 *   overall = 0.4 * massPosition + 0.3 * contactQuality
 *           + 0.2 * oscillation  + 0.1 * tilt
 */
class StabilityScorer
{
public:
  /**
   * @brief How well the centroid is supported by the footprint
   *
   * - fewer than minContactPoints polygon vertices: massPositionFallback
   * - centroid projection outside the polygon: 0
   * - otherwise clamp01(edgeDistance / radius / centerOfMassThreshold) * 100,
   *   where edgeDistance is the distance to the nearest polygon edge and
   *   radius the largest vertex distance from the vertex centroid
   */
  static double massPositionScore(const SupportPolygon& polygon,
                                  const Coordinate& centerOfMass,
                                  const StabilityConfig& config);

  /**
   * @brief Footprint size and contact spread
   *
   * (areaWeight * clamp01(area / (pieceCount * expectedAreaPerPiece))
   *  + distributionWeight * contactDistribution) * 100.
   * Zero with fewer than minContactPoints vertices.
   */
  static double contactQualityScore(const SupportPolygon& polygon,
                                    size_t pieceCount,
                                    const StabilityConfig& config);

  /**
   * @brief Uniformity of the vertices around their own centroid
   *
   * 1 - variance / mean^2 of the vertex-to-centroid distances, clamped to
   * [0, 1]. Zero for fewer than two vertices or a zero mean distance.
   */
  static double contactDistribution(std::span<const Coordinate> vertices);

  /**
   * @brief Penalty for centroid sway
   *
   * clamp01(1 - magnitude / maxAllowedOscillation) * 100, or 100 while the
   * oscillation window has not filled (nullopt).
   */
  static double oscillationScore(std::optional<double> oscillationMagnitude,
                                 const StabilityConfig& config);

  /**
   * @brief Penalty for pieces leaning away from vertical
   *
   * Averages the up axis of every piece and scores
   * clamp01(1 - angle / maxAllowedTiltDegrees) * 100 against world up.
   * 100 without pieces; 0 if the average up axis cancels out to zero.
   */
  static double tiltScore(std::span<const StackedObject> objects,
                          const StabilityConfig& config);

  /**
   * @brief Angle between the pieces' average up axis and world up [deg]
   * @return nullopt without pieces or when the average cancels out
   */
  static std::optional<double> averageTiltDegrees(
    std::span<const StackedObject> objects);

  /**
   * @brief Weighted sum of the sub-scores, clamped to [0, 100]
   */
  static double combine(const StabilityBreakdown& breakdown,
                        const StabilityWeights& weights);
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_STABILITY_SCORER_HPP
