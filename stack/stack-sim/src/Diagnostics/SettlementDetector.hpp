// Ticket: 0007_settlement_detection

#ifndef STACK_SIM_DIAGNOSTICS_SETTLEMENT_DETECTOR_HPP
#define STACK_SIM_DIAGNOSTICS_SETTLEMENT_DETECTOR_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

#include <Eigen/Geometry>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/DataTypes/Coordinate.hpp"

namespace stack_sim
{

/**
 * @brief Thresholds for per-piece and tower settlement.
 */
struct SettlementConfig
{
  double velocityThreshold{0.006};         // [m/s]
  double angularVelocityThreshold{0.008};  // [rad/s]
  double positionThreshold{0.003};         // [m] between checks
  double rotationThresholdDegrees{0.1};    // between checks
  std::chrono::milliseconds settlementTime{350};
  std::chrono::milliseconds checkInterval{100};

  /**
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const;
};

/**
 * @brief Outcome of one settlement check
 */
struct SettlementUpdate
{
  std::vector<uint32_t> newlySettled;  // Piece ids that settled this check
  bool towerJustSettled{false};        // Tower transitioned to settled
};

/**
 * @brief Aggregate settlement statistics
 */
struct SettlementStats
{
  size_t totalPieces{0};
  size_t settledPieces{0};
  double settlementPercentage{100.0};  // 100 when no pieces are tracked
  double averageSettledTime{0.0};      // Mean sim time of settling [s]
  bool isTowerSettled{true};
};

/**
 * @brief Detects when pieces, and then the whole tower, come to rest.
 *
 * A piece is at rest during a check when its linear and angular speeds are
 * below threshold and its pose barely changed since the previous check. It
 * is settled once it has been at rest for @c settlementTime of consecutive
 * checks, and stays settled until it leaves the tower. The tower is settled
 * once every tracked piece has been settled for a further @c settlementTime;
 * any unsettled piece resets that timer.
 *
 * Checks run on their own cadence (@c checkInterval) regardless of how often
 * update() is called. The detector only reads bodies.
 *
 * @note Not thread-safe - single-threaded simulation assumed.
 */
class SettlementDetector
{
public:
  /**
   * @throws std::invalid_argument if @p config is invalid
   */
  explicit SettlementDetector(
    const SettlementConfig& config = SettlementConfig{});

  /**
   * @brief Advance to an absolute time, checking if the interval elapsed
   * @return Result of the check, or an empty update if none was due
   */
  SettlementUpdate update(std::chrono::milliseconds simTime,
                          std::span<const StackedObject> objects);

  /**
   * @brief Run a check immediately
   */
  SettlementUpdate check(std::chrono::milliseconds simTime,
                         std::span<const StackedObject> objects);

  /**
   * @brief Forget all tracking; the tower counts as settled again
   */
  void reset();

  [[nodiscard]] bool isTowerSettled() const
  {
    return towerSettled_;
  }

  /**
   * @return false for unknown ids
   */
  [[nodiscard]] bool isPieceSettled(uint32_t instanceId) const;

  [[nodiscard]] SettlementStats getStats() const;

  [[nodiscard]] const SettlementConfig& getConfig() const
  {
    return config_;
  }

private:
  struct PieceTracking
  {
    bool isSettled{false};
    std::chrono::milliseconds settledTime{0};
    Coordinate lastPosition;
    Eigen::Quaterniond lastOrientation{Eigen::Quaterniond::Identity()};
    std::chrono::milliseconds restTimer{0};
  };

  void syncTrackedPieces(std::span<const StackedObject> objects);

  bool isAtRest(const StackedObject& piece, const PieceTracking& tracking) const;

  SettlementConfig config_;
  std::unordered_map<uint32_t, PieceTracking> pieces_;
  std::chrono::milliseconds towerTimer_{0};
  bool towerSettled_{true};
  std::chrono::milliseconds nextCheckTime_{0};
};

}  // namespace stack_sim

#endif  // STACK_SIM_DIAGNOSTICS_SETTLEMENT_DETECTOR_HPP
