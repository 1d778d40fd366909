// Ticket: 0006_stability_monitor

#include "stack-sim/src/Stability/StabilityMonitor.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace stack_sim
{

namespace
{

// Published score snaps onto the target once this close [score points]
constexpr double kSnapDistance{1e-3};

}  // namespace

StabilityMonitor::StabilityMonitor(const StabilityConfig& config)
  : analyzer_{config}
{
}

bool StabilityMonitor::update(std::chrono::milliseconds simTime,
                              std::span<const StackedObject> objects)
{
  bool ranAnalysis = false;
  if (simTime >= nextAnalysisTime_)
  {
    runAnalysis(simTime, objects);
    ranAnalysis = true;
  }

  std::chrono::milliseconds elapsed{0};
  if (lastUpdateTime_ && simTime > *lastUpdateTime_)
  {
    elapsed = simTime - *lastUpdateTime_;
  }
  lastUpdateTime_ = std::max(simTime, lastUpdateTime_.value_or(simTime));

  smoothToward(latest_.overallStability, elapsed);
  updateLevel();
  return ranAnalysis;
}

void StabilityMonitor::forceAnalysis(std::chrono::milliseconds simTime,
                                     std::span<const StackedObject> objects)
{
  runAnalysis(simTime, objects);
}

void StabilityMonitor::reset()
{
  analyzer_.reset();
  latest_ = StabilityInfo{};
  published_ = 100.0;
  level_ = StabilityLevel::Good;
  lastUpdateTime_.reset();
  nextAnalysisTime_ = std::chrono::milliseconds{0};
  spdlog::info("StabilityMonitor: reset");
}

StabilityInfo StabilityMonitor::getStabilityInfo() const
{
  StabilityInfo info = latest_;
  info.overallStability = published_;
  info.isStable = published_ > getConfig().criticalThreshold;
  return info;
}

bool StabilityMonitor::hasCollapsed(bool towerSettled) const
{
  return published_ <= 0.0 && towerSettled;
}

void StabilityMonitor::runAnalysis(std::chrono::milliseconds simTime,
                                   std::span<const StackedObject> objects)
{
  latest_ = analyzer_.analyze(objects);
  nextAnalysisTime_ = simTime + getConfig().analysisInterval;
}

void StabilityMonitor::smoothToward(double target,
                                    std::chrono::milliseconds elapsed)
{
  if (elapsed.count() <= 0)
  {
    return;
  }

  double const dt = std::chrono::duration<double>{elapsed}.count();
  double const retained = std::pow(0.5, dt / getConfig().smoothingHalfLife);
  published_ = target + (published_ - target) * retained;
  if (std::abs(published_ - target) < kSnapDistance)
  {
    published_ = target;
  }
  published_ = std::clamp(published_, 0.0, 100.0);
}

void StabilityMonitor::updateLevel()
{
  StabilityLevel const level = classifyStability(published_, getConfig());
  if (level == level_)
  {
    return;
  }

  if (level == StabilityLevel::Good)
  {
    spdlog::info("StabilityMonitor: stability recovered to {:.1f}", published_);
  }
  else
  {
    spdlog::warn("StabilityMonitor: stability {:.1f} entered {} level",
                 published_,
                 toString(level));
  }
  level_ = level;
}

}  // namespace stack_sim
