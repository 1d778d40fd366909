// Ticket: 0006_stability_monitor

#include "stack-sim/src/Stability/StabilityAnalyzer.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "stack-sim/src/Stability/StabilityScorer.hpp"

namespace stack_sim
{

namespace
{

// Validate before any member is built from the config
const StabilityConfig& validated(const StabilityConfig& config)
{
  config.validate();
  return config;
}

}  // namespace

StabilityAnalyzer::StabilityAnalyzer(const StabilityConfig& config)
  : config_{validated(config)},
    builder_{config.contactPointMergeDistance,
             config.minContactPoints,
             config.contactTolerance},
    tracker_{config.historyCapacity}
{
}

StabilityInfo StabilityAnalyzer::analyze(std::span<const StackedObject> objects)
{
  StabilityInfo info{};

  std::optional<Coordinate> const centroid =
    CenterOfMassTracker::computeCenterOfMass(objects);
  if (!centroid)
  {
    // Nothing stacked: trivially stable
    info.isStable = info.overallStability > config_.criticalThreshold;
    return info;
  }

  info.supportPolygon = builder_.build(objects);

  tracker_.push(*centroid);
  info.centerOfMass = centroid;
  std::optional<double> const oscillation = tracker_.getOscillationMagnitude();
  info.oscillationMagnitude = oscillation.value_or(0.0);

  auto const pieceCount = static_cast<size_t>(
    std::count_if(objects.begin(),
                  objects.end(),
                  [](const StackedObject& object) { return object.isPiece(); }));

  info.breakdown.massPosition =
    StabilityScorer::massPositionScore(info.supportPolygon, *centroid, config_);
  info.breakdown.contactQuality = StabilityScorer::contactQualityScore(
    info.supportPolygon, pieceCount, config_);
  info.breakdown.oscillation =
    StabilityScorer::oscillationScore(oscillation, config_);
  info.breakdown.tilt = StabilityScorer::tiltScore(objects, config_);

  info.overallStability =
    StabilityScorer::combine(info.breakdown, config_.weights);
  info.isStable = info.overallStability > config_.criticalThreshold;

  spdlog::debug(
    "StabilityAnalyzer: score {:.1f} (mass {:.1f}, contact {:.1f}, "
    "oscillation {:.1f}, tilt {:.1f}), {} pieces",
    info.overallStability,
    info.breakdown.massPosition,
    info.breakdown.contactQuality,
    info.breakdown.oscillation,
    info.breakdown.tilt,
    pieceCount);

  return info;
}

void StabilityAnalyzer::reset()
{
  tracker_.reset();
}

}  // namespace stack_sim
