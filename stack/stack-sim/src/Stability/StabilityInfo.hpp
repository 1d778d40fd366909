// Ticket: 0005_stability_scoring

#ifndef STACK_SIM_STABILITY_STABILITY_INFO_HPP
#define STACK_SIM_STABILITY_STABILITY_INFO_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include "stack-sim/src/DataTypes/Coordinate.hpp"
#include "stack-sim/src/Geometry/SupportPolygon.hpp"

namespace stack_sim
{

struct StabilityConfig;

/**
 * @brief The four sub-scores behind one overall value, each in [0, 100]
 */
struct StabilityBreakdown
{
  double massPosition{100.0};
  double contactQuality{100.0};
  double oscillation{100.0};
  double tilt{100.0};
};

/**
 * @brief Result of one stability analysis tick.
 *
 * Recreated every tick. @c centerOfMass is nullopt when the tower holds no
 * pieces (there is no centroid to report). @c oscillationMagnitude is zero
 * until the centroid history window has filled.
 */
struct StabilityInfo
{
  double overallStability{100.0};  // [0, 100]
  std::optional<Coordinate> centerOfMass;
  SupportPolygon supportPolygon;
  double oscillationMagnitude{0.0};  // [m]
  bool isStable{true};
  StabilityBreakdown breakdown{};
};

/**
 * @brief Coarse stability band used for warnings
 */
enum class StabilityLevel : uint8_t
{
  Good,
  Warning,
  Critical
};

/**
 * @brief Band a score falls into
 *
 * Good at or above the warning threshold, Warning at or above the critical
 * threshold, Critical below it.
 */
StabilityLevel classifyStability(double score, const StabilityConfig& config);

constexpr std::string_view toString(StabilityLevel level)
{
  switch (level)
  {
    case StabilityLevel::Good:
      return "Good";
    case StabilityLevel::Warning:
      return "Warning";
    case StabilityLevel::Critical:
      return "Critical";
  }
  return "Unknown";
}

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_STABILITY_INFO_HPP
