// Ticket: 0007_settlement_detection

#include "stack-sim/src/Diagnostics/SettlementDetector.hpp"

#include <algorithm>
#include <numbers>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace stack_sim
{

namespace
{

void requireNonNegative(double value, const char* field)
{
  if (!(value >= 0.0))
  {
    throw std::invalid_argument(std::string{"SettlementConfig: "} + field +
                                " must be non-negative (value = " +
                                std::to_string(value) + ")");
  }
}

void requirePositive(std::chrono::milliseconds value, const char* field)
{
  if (value.count() <= 0)
  {
    throw std::invalid_argument(std::string{"SettlementConfig: "} + field +
                                " must be positive (value = " +
                                std::to_string(value.count()) + " ms)");
  }
}

}  // namespace

void SettlementConfig::validate() const
{
  requireNonNegative(velocityThreshold, "velocityThreshold");
  requireNonNegative(angularVelocityThreshold, "angularVelocityThreshold");
  requireNonNegative(positionThreshold, "positionThreshold");
  requireNonNegative(rotationThresholdDegrees, "rotationThresholdDegrees");
  requirePositive(settlementTime, "settlementTime");
  requirePositive(checkInterval, "checkInterval");
}

SettlementDetector::SettlementDetector(const SettlementConfig& config)
  : config_{config}
{
  config_.validate();
}

SettlementUpdate SettlementDetector::update(
  std::chrono::milliseconds simTime,
  std::span<const StackedObject> objects)
{
  if (simTime < nextCheckTime_)
  {
    return SettlementUpdate{};
  }
  return check(simTime, objects);
}

SettlementUpdate SettlementDetector::check(
  std::chrono::milliseconds simTime,
  std::span<const StackedObject> objects)
{
  nextCheckTime_ = simTime + config_.checkInterval;
  syncTrackedPieces(objects);

  SettlementUpdate result;
  bool allSettled = true;

  for (const auto& object : objects)
  {
    if (!object.isPiece())
    {
      continue;
    }

    PieceTracking& tracking = pieces_.at(object.getInstanceId());
    bool const atRest = isAtRest(object, tracking);
    tracking.lastPosition = object.getPosition();
    tracking.lastOrientation = object.getOrientation();

    if (atRest)
    {
      tracking.restTimer += config_.checkInterval;
    }
    else
    {
      tracking.restTimer = std::chrono::milliseconds{0};
    }

    if (!tracking.isSettled && tracking.restTimer >= config_.settlementTime)
    {
      tracking.isSettled = true;
      tracking.settledTime = simTime;
      result.newlySettled.push_back(object.getInstanceId());
      spdlog::debug("SettlementDetector: piece {} settled", object.getInstanceId());
    }

    if (!tracking.isSettled)
    {
      allSettled = false;
    }
  }

  if (!allSettled)
  {
    towerTimer_ = std::chrono::milliseconds{0};
    towerSettled_ = false;
  }
  else if (!towerSettled_)
  {
    towerTimer_ += config_.checkInterval;
    if (towerTimer_ >= config_.settlementTime)
    {
      towerSettled_ = true;
      result.towerJustSettled = true;
      spdlog::info("SettlementDetector: tower has settled ({} pieces)",
                   pieces_.size());
    }
  }

  return result;
}

void SettlementDetector::reset()
{
  pieces_.clear();
  towerTimer_ = std::chrono::milliseconds{0};
  towerSettled_ = true;
  nextCheckTime_ = std::chrono::milliseconds{0};
}

bool SettlementDetector::isPieceSettled(uint32_t instanceId) const
{
  auto it = pieces_.find(instanceId);
  return it != pieces_.end() && it->second.isSettled;
}

SettlementStats SettlementDetector::getStats() const
{
  SettlementStats stats;
  stats.totalPieces = pieces_.size();
  stats.isTowerSettled = towerSettled_;

  double settledTimeSum = 0.0;
  for (const auto& [id, tracking] : pieces_)
  {
    if (tracking.isSettled)
    {
      ++stats.settledPieces;
      settledTimeSum +=
        std::chrono::duration<double>{tracking.settledTime}.count();
    }
  }

  if (stats.totalPieces > 0)
  {
    stats.settlementPercentage =
      100.0 * static_cast<double>(stats.settledPieces) /
      static_cast<double>(stats.totalPieces);
  }
  if (stats.settledPieces > 0)
  {
    stats.averageSettledTime =
      settledTimeSum / static_cast<double>(stats.settledPieces);
  }

  return stats;
}

void SettlementDetector::syncTrackedPieces(
  std::span<const StackedObject> objects)
{
  std::unordered_set<uint32_t> active;
  for (const auto& object : objects)
  {
    if (!object.isPiece())
    {
      continue;
    }

    active.insert(object.getInstanceId());
    if (!pieces_.contains(object.getInstanceId()))
    {
      PieceTracking tracking;
      tracking.lastPosition = object.getPosition();
      tracking.lastOrientation = object.getOrientation();
      pieces_.emplace(object.getInstanceId(), tracking);
    }
  }

  std::erase_if(pieces_,
                [&active](const auto& entry)
                { return !active.contains(entry.first); });
}

bool SettlementDetector::isAtRest(const StackedObject& piece,
                                  const PieceTracking& tracking) const
{
  double const positionDelta =
    (piece.getPosition() - tracking.lastPosition).norm();
  double const rotationDelta =
    piece.getOrientation().angularDistance(tracking.lastOrientation) * 180.0 /
    std::numbers::pi;

  return piece.getLinearVelocity().norm() < config_.velocityThreshold &&
         piece.getAngularVelocity().norm() < config_.angularVelocityThreshold &&
         positionDelta < config_.positionThreshold &&
         rotationDelta < config_.rotationThresholdDegrees;
}

}  // namespace stack_sim
