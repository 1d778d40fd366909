// Ticket: 0005_stability_scoring

#ifndef STACK_SIM_STABILITY_STABILITY_CONFIG_HPP
#define STACK_SIM_STABILITY_STABILITY_CONFIG_HPP

#include <chrono>
#include <cstddef>

namespace stack_sim
{

/**
 * @brief Weights of the four sub-scores in the overall stability score.
 *
 * A tuning choice, not a physical law. Must be non-negative and sum to 1.
 */
struct StabilityWeights
{
  double massPosition{0.4};
  double contactQuality{0.3};
  double oscillation{0.2};
  double tilt{0.1};

  [[nodiscard]] double sum() const
  {
    return massPosition + contactQuality + oscillation + tilt;
  }
};

/**
 * @brief Tuning parameters for support-polygon construction, scoring and
 * publishing.
 *
 * Defaults reproduce the shipped game balance. Call validate() before use;
 * the analysis classes do so in their constructors.
 */
struct StabilityConfig
{
  // ===== Support polygon =====
  double contactPointMergeDistance{0.1};  // [m]
  size_t minContactPoints{3};
  double contactTolerance{0.01};  // AABB overlap slack [m]

  // ===== Centre of mass =====
  size_t historyCapacity{20};  // Ticks in the oscillation window

  // ===== Scoring =====
  double centerOfMassThreshold{0.7};  // Edge margin ratio that scores 100
  double massPositionFallback{50.0};  // Score without a reliable polygon
  double expectedAreaPerPiece{2.0};   // [m^2]
  double areaWeight{0.7};
  double distributionWeight{0.3};
  double maxAllowedOscillation{0.5};  // [m]
  double maxAllowedTiltDegrees{30.0};
  StabilityWeights weights{};

  // ===== Publishing =====
  std::chrono::milliseconds analysisInterval{100};
  double smoothingHalfLife{0.35};  // [s]
  double criticalThreshold{15.0};
  double warningThreshold{30.0};

  /**
   * @brief Check every field against its valid range
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const;
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_STABILITY_CONFIG_HPP
