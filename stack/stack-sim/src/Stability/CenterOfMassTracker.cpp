// Ticket: 0004_center_of_mass_tracking

#include "stack-sim/src/Stability/CenterOfMassTracker.hpp"

#include <stdexcept>

namespace stack_sim
{

CenterOfMassTracker::CenterOfMassTracker(size_t capacity) : capacity_{capacity}
{
  if (capacity == 0)
  {
    throw std::invalid_argument(
      "CenterOfMassTracker: history capacity must be at least 1");
  }
}

std::optional<Coordinate> CenterOfMassTracker::computeCenterOfMass(
  std::span<const StackedObject> objects)
{
  Eigen::Vector3d weightedSum = Eigen::Vector3d::Zero();
  double totalMass = 0.0;

  for (const auto& object : objects)
  {
    if (!object.isPiece())
    {
      continue;
    }
    weightedSum += object.getWorldCenterOfMass() * object.getMass();
    totalMass += object.getMass();
  }

  if (totalMass <= 0.0)
  {
    return std::nullopt;
  }
  return Coordinate{weightedSum / totalMass};
}

void CenterOfMassTracker::push(const Coordinate& centroid)
{
  history_.push_back(centroid);
  while (history_.size() > capacity_)
  {
    history_.pop_front();
  }
}

std::optional<double> CenterOfMassTracker::getOscillationMagnitude() const
{
  if (!isWindowFull())
  {
    return std::nullopt;
  }

  Eigen::Vector3d mean = Eigen::Vector3d::Zero();
  for (const auto& centroid : history_)
  {
    mean += centroid;
  }
  mean /= static_cast<double>(history_.size());

  double totalDeviation = 0.0;
  for (const auto& centroid : history_)
  {
    totalDeviation += (centroid - mean).norm();
  }
  return totalDeviation / static_cast<double>(history_.size());
}

std::optional<Coordinate> CenterOfMassTracker::latest() const
{
  if (history_.empty())
  {
    return std::nullopt;
  }
  return history_.back();
}

void CenterOfMassTracker::reset()
{
  history_.clear();
}

}  // namespace stack_sim
