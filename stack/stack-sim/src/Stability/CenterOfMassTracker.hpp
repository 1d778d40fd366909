// Ticket: 0004_center_of_mass_tracking

#ifndef STACK_SIM_STABILITY_CENTER_OF_MASS_TRACKER_HPP
#define STACK_SIM_STABILITY_CENTER_OF_MASS_TRACKER_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <span>

#include "stack-sim/src/Bodies/StackedObject.hpp"
#include "stack-sim/src/DataTypes/Coordinate.hpp"

namespace stack_sim
{

/**
 * @brief Tracks the tower centroid and its short-term history.
 *
 * The history is a fixed-capacity FIFO of recent centroids; once it is full,
 * the mean distance of its entries from their own average measures how much
 * the tower is swaying.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class CenterOfMassTracker
{
public:
  /**
   * @param capacity Number of centroids in the oscillation window, >= 1
   * @throws std::invalid_argument if capacity is zero
   */
  explicit CenterOfMassTracker(size_t capacity = 20);

  /**
   * @brief Mass-weighted centroid of all pieces
   *
   * sum(worldCenterOfMass * mass) / sum(mass) over Piece bodies.
   *
   * @return nullopt when the total piece mass is zero (no valid centroid)
   */
  static std::optional<Coordinate> computeCenterOfMass(
    std::span<const StackedObject> objects);

  /**
   * @brief Append a centroid, evicting the oldest entry when over capacity
   */
  void push(const Coordinate& centroid);

  /**
   * @brief Mean Euclidean distance of the history from its average
   *
   * @return nullopt until the history holds @c capacity entries; callers must
   *         not penalise stability before the window fills
   */
  [[nodiscard]] std::optional<double> getOscillationMagnitude() const;

  [[nodiscard]] bool isWindowFull() const
  {
    return history_.size() >= capacity_;
  }

  [[nodiscard]] size_t size() const
  {
    return history_.size();
  }

  [[nodiscard]] size_t capacity() const
  {
    return capacity_;
  }

  /**
   * @brief Most recent centroid, if any
   */
  [[nodiscard]] std::optional<Coordinate> latest() const;

  /**
   * @brief Forget all history (tower reset)
   */
  void reset();

private:
  size_t capacity_;
  std::deque<Coordinate> history_;
};

}  // namespace stack_sim

#endif  // STACK_SIM_STABILITY_CENTER_OF_MASS_TRACKER_HPP
