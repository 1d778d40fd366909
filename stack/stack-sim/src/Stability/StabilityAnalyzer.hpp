// Ticket: 0006_stability_monitor

#ifndef STACK_SIM_STABILITY_STABILITY_ANALYZER_HPP
#define STACK_SIM_STABILITY_STABILITY_ANALYZER_HPP

#include <span>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/Stability/CenterOfMassTracker.hpp"
#include "stack-sim/src/Stability/StabilityConfig.hpp"
#include "stack-sim/src/Stability/StabilityInfo.hpp"
#include "stack-sim/src/Stability/SupportPolygonBuilder.hpp"

namespace stack_sim
{

/**
 * @brief Runs one stability analysis tick over a body set.
 *
 * Per tick: the support polygon is rebuilt from the current contacts, the
 * tower centroid is computed and pushed into the history, and the four
 * sub-scores are combined. The returned score is the raw target value; the
 * smoothed, published value is the job of StabilityMonitor.
 *
 * The only state kept between ticks is the centroid history.
 */
class StabilityAnalyzer
{
public:
  /**
   * @throws std::invalid_argument if @p config is invalid
   */
  explicit StabilityAnalyzer(const StabilityConfig& config = StabilityConfig{});

  /**
   * @brief Analyze the current bodies
   *
   * An empty stack (no pieces) yields a score of 100 with an empty polygon
   * and no centroid, and leaves the history untouched.
   */
  StabilityInfo analyze(std::span<const StackedObject> objects);

  /**
   * @brief Clear the centroid history (tower reset)
   */
  void reset();

  [[nodiscard]] const StabilityConfig& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const CenterOfMassTracker& getTracker() const
  {
    return tracker_;
  }

private:
  StabilityConfig config_;
  SupportPolygonBuilder builder_;
  CenterOfMassTracker tracker_;
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_STABILITY_ANALYZER_HPP
