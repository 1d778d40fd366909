// Ticket: 0006_stability_monitor

#ifndef STACK_SIM_STABILITY_STABILITY_MONITOR_HPP
#define STACK_SIM_STABILITY_STABILITY_MONITOR_HPP

#include <chrono>
#include <optional>
#include <span>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/Stability/StabilityAnalyzer.hpp"
#include "stack-sim/src/Stability/StabilityConfig.hpp"
#include "stack-sim/src/Stability/StabilityInfo.hpp"

namespace stack_sim
{

/**
 * @brief Publishes a smoothed tower stability value on a fixed cadence.
 *
 * The host calls update() every frame with the absolute simulation time and
 * the current bodies. A fresh analysis runs whenever the analysis interval
 * has elapsed, independent of how often update() is called; between
 * analyses the published score decays exponentially toward the last
 * analysed target:
 *
 *   published += (target - published) * (1 - 0.5^(dt / halfLife))
 *
 * and snaps onto the target once within a thousandth of a point, so a
 * collapsed tower publishes exactly zero.
 *
 * The monitor never reaches into global state: bodies are passed per call,
 * configuration at construction.
 *
 * @note Not thread-safe - single-threaded simulation assumed.
 */
class StabilityMonitor
{
public:
  /**
   * @throws std::invalid_argument if @p config is invalid
   */
  explicit StabilityMonitor(const StabilityConfig& config = StabilityConfig{});

  /**
   * @brief Advance the monitor to the given absolute time
   * @param simTime Absolute simulation time (not a delta). Pass
   *        non-decreasing values; an earlier time is treated as no elapsed
   *        time.
   * @param objects Current bodies, read only during this call
   * @return true if an analysis ran during this call
   */
  bool update(std::chrono::milliseconds simTime,
              std::span<const StackedObject> objects);

  /**
   * @brief Run an analysis immediately and reschedule the next one
   *
   * The published score is not changed; it converges on following updates.
   */
  void forceAnalysis(std::chrono::milliseconds simTime,
                     std::span<const StackedObject> objects);

  /**
   * @brief Return to the initial state: history cleared, score 100
   */
  void reset();

  /**
   * @brief Smoothed score in [0, 100]
   */
  [[nodiscard]] double getStability() const
  {
    return published_;
  }

  /**
   * @brief Last raw analysis result in [0, 100]
   */
  [[nodiscard]] double getTargetStability() const
  {
    return latest_.overallStability;
  }

  /**
   * @brief Published result: the last analysis with the smoothed score
   */
  [[nodiscard]] StabilityInfo getStabilityInfo() const;

  [[nodiscard]] StabilityLevel getLevel() const
  {
    return level_;
  }

  /**
   * @brief Collapse rule: nothing left holding the tower up
   * @param towerSettled Whether the tower has come to rest
   * @return true if the published score is at or below zero and the tower
   *         has settled
   */
  [[nodiscard]] bool hasCollapsed(bool towerSettled) const;

  [[nodiscard]] const StabilityConfig& getConfig() const
  {
    return analyzer_.getConfig();
  }

private:
  void runAnalysis(std::chrono::milliseconds simTime,
                   std::span<const StackedObject> objects);

  void smoothToward(double target, std::chrono::milliseconds elapsed);

  void updateLevel();

  StabilityAnalyzer analyzer_;
  StabilityInfo latest_{};
  double published_{100.0};
  StabilityLevel level_{StabilityLevel::Good};
  std::optional<std::chrono::milliseconds> lastUpdateTime_;
  std::chrono::milliseconds nextAnalysisTime_{0};
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_STABILITY_MONITOR_HPP
