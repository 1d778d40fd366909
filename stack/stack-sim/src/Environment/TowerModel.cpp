// Ticket: 0002_tower_model

#include "stack-sim/src/Environment/TowerModel.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace stack_sim
{

const StackedObject& TowerModel::addBase(const Coordinate& halfExtents,
                                         const ReferenceFrame& frame)
{
  objects_.emplace_back(nextInstanceId_, BodyRole::Base, halfExtents, frame);
  ++nextInstanceId_;
  return objects_.back();
}

const StackedObject& TowerModel::addPiece(const Coordinate& halfExtents,
                                          const ReferenceFrame& frame,
                                          double mass,
                                          const Coordinate& centerOfMassOffset)
{
  objects_.emplace_back(nextInstanceId_,
                        BodyRole::Piece,
                        halfExtents,
                        frame,
                        mass,
                        centerOfMassOffset);
  ++nextInstanceId_;
  return objects_.back();
}

void TowerModel::removeObject(uint32_t instanceId)
{
  auto it = std::find_if(objects_.begin(),
                         objects_.end(),
                         [instanceId](const StackedObject& object)
                         { return object.getInstanceId() == instanceId; });
  if (it == objects_.end())
  {
    throw std::out_of_range("TowerModel: no body with instance id " +
                            std::to_string(instanceId));
  }
  objects_.erase(it);
}

void TowerModel::clear()
{
  objects_.clear();
}

StackedObject* TowerModel::findObject(uint32_t instanceId)
{
  for (auto& object : objects_)
  {
    if (object.getInstanceId() == instanceId)
    {
      return &object;
    }
  }
  return nullptr;
}

const StackedObject* TowerModel::findObject(uint32_t instanceId) const
{
  for (const auto& object : objects_)
  {
    if (object.getInstanceId() == instanceId)
    {
      return &object;
    }
  }
  return nullptr;
}

size_t TowerModel::getPieceCount() const
{
  return static_cast<size_t>(
    std::count_if(objects_.begin(),
                  objects_.end(),
                  [](const StackedObject& object) { return object.isPiece(); }));
}

double TowerModel::getHeight() const
{
  double height = 0.0;
  for (const auto& object : objects_)
  {
    if (object.isPiece())
    {
      height = std::max(height, object.getWorldBoundingBox().max.y());
    }
  }
  return height;
}

}  // namespace stack_sim
