// Ticket: 0005_stability_scoring

#include "stack-sim/src/Stability/StabilityInfo.hpp"

#include "stack-sim/src/Stability/StabilityConfig.hpp"

namespace stack_sim
{

StabilityLevel classifyStability(double score, const StabilityConfig& config)
{
  if (score >= config.warningThreshold)
  {
    return StabilityLevel::Good;
  }
  if (score >= config.criticalThreshold)
  {
    return StabilityLevel::Warning;
  }
  return StabilityLevel::Critical;
}

}  // namespace stack_sim
