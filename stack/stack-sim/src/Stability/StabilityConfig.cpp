// Ticket: 0005_stability_scoring

#include "stack-sim/src/Stability/StabilityConfig.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace stack_sim
{

namespace
{

void requirePositive(double value, const char* field)
{
  if (!(value > 0.0))
  {
    throw std::invalid_argument(std::string{"StabilityConfig: "} + field +
                                " must be positive (value = " +
                                std::to_string(value) + ")");
  }
}

void requireNonNegative(double value, const char* field)
{
  if (!(value >= 0.0))
  {
    throw std::invalid_argument(std::string{"StabilityConfig: "} + field +
                                " must be non-negative (value = " +
                                std::to_string(value) + ")");
  }
}

void requirePercentage(double value, const char* field)
{
  if (!(value >= 0.0 && value <= 100.0))
  {
    throw std::invalid_argument(std::string{"StabilityConfig: "} + field +
                                " must be in [0, 100] (value = " +
                                std::to_string(value) + ")");
  }
}

}  // namespace

void StabilityConfig::validate() const
{
  requireNonNegative(contactPointMergeDistance, "contactPointMergeDistance");
  requireNonNegative(contactTolerance, "contactTolerance");

  if (minContactPoints < 3)
  {
    throw std::invalid_argument(
      "StabilityConfig: minContactPoints must be at least 3 (value = " +
      std::to_string(minContactPoints) + ")");
  }

  if (historyCapacity == 0)
  {
    throw std::invalid_argument(
      "StabilityConfig: historyCapacity must be at least 1");
  }

  requirePositive(centerOfMassThreshold, "centerOfMassThreshold");
  requirePercentage(massPositionFallback, "massPositionFallback");
  requirePositive(expectedAreaPerPiece, "expectedAreaPerPiece");
  requireNonNegative(areaWeight, "areaWeight");
  requireNonNegative(distributionWeight, "distributionWeight");
  if (std::abs(areaWeight + distributionWeight - 1.0) > 1e-9)
  {
    throw std::invalid_argument(
      "StabilityConfig: areaWeight + distributionWeight must equal 1");
  }
  requirePositive(maxAllowedOscillation, "maxAllowedOscillation");
  requirePositive(maxAllowedTiltDegrees, "maxAllowedTiltDegrees");

  requireNonNegative(weights.massPosition, "weights.massPosition");
  requireNonNegative(weights.contactQuality, "weights.contactQuality");
  requireNonNegative(weights.oscillation, "weights.oscillation");
  requireNonNegative(weights.tilt, "weights.tilt");
  if (std::abs(weights.sum() - 1.0) > 1e-9)
  {
    throw std::invalid_argument(
      "StabilityConfig: weights must sum to 1 (sum = " +
      std::to_string(weights.sum()) + ")");
  }

  if (analysisInterval.count() <= 0)
  {
    throw std::invalid_argument(
      "StabilityConfig: analysisInterval must be positive");
  }
  requirePositive(smoothingHalfLife, "smoothingHalfLife");
  requirePercentage(criticalThreshold, "criticalThreshold");
  requirePercentage(warningThreshold, "warningThreshold");
  if (criticalThreshold > warningThreshold)
  {
    throw std::invalid_argument(
      "StabilityConfig: criticalThreshold must not exceed warningThreshold");
  }
}

}  // namespace stack_sim
