// Ticket: 0003_support_polygon

#include "stack-sim/src/Stability/SupportPolygonBuilder.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace stack_sim
{

SupportPolygonBuilder::SupportPolygonBuilder(double mergeDistance,
                                             size_t minContactPoints,
                                             double contactTolerance)
  : mergeDistance_{mergeDistance},
    minContactPoints_{minContactPoints},
    contactTolerance_{contactTolerance}
{
  if (mergeDistance < 0.0)
  {
    throw std::invalid_argument(
      "SupportPolygonBuilder: merge distance must be non-negative (value = " +
      std::to_string(mergeDistance) + ")");
  }
  if (minContactPoints < 3)
  {
    throw std::invalid_argument(
      "SupportPolygonBuilder: minContactPoints must be at least 3");
  }
  if (contactTolerance < 0.0)
  {
    throw std::invalid_argument(
      "SupportPolygonBuilder: contact tolerance must be non-negative");
  }
}

SupportPolygon SupportPolygonBuilder::build(
  std::span<const StackedObject> objects) const
{
  std::vector<Coordinate> contacts = collectContactPoints(objects);
  size_t const contactCount = contacts.size();

  SupportPolygon polygon =
    SupportPolygon::fromPoints(std::move(contacts), minContactPoints_);

  if (!polygon.isHull())
  {
    spdlog::debug(
      "SupportPolygonBuilder: {} contact point(s), below minimum of {}; "
      "hull skipped",
      contactCount,
      minContactPoints_);
  }
  else
  {
    spdlog::debug("SupportPolygonBuilder: {} contact points -> {} hull vertices",
                  contactCount,
                  polygon.getVertexCount());
  }

  return polygon;
}

std::vector<Coordinate> SupportPolygonBuilder::collectContactPoints(
  std::span<const StackedObject> objects) const
{
  std::vector<Coordinate> accepted;

  // Boxes are computed once per tick, not once per pair
  std::vector<BoundingBox> boxes;
  boxes.reserve(objects.size());
  for (const auto& object : objects)
  {
    boxes.push_back(object.getWorldBoundingBox());
  }

  for (size_t i = 0; i < objects.size(); ++i)
  {
    if (!objects[i].isPiece())
    {
      continue;
    }

    for (size_t j = 0; j < objects.size(); ++j)
    {
      if (i == j || !boxes[i].overlaps(boxes[j], contactTolerance_))
      {
        continue;
      }

      Coordinate const contact = objects[i].closestPoint(boxes[j].center());
      mergeContactPoint(accepted, projectToGround(contact));
    }
  }

  return accepted;
}

bool SupportPolygonBuilder::mergeContactPoint(std::vector<Coordinate>& accepted,
                                              const Coordinate& candidate) const
{
  for (const auto& existing : accepted)
  {
    if ((candidate - existing).norm() < mergeDistance_)
    {
      return false;
    }
  }
  accepted.push_back(candidate);
  return true;
}

}  // namespace stack_sim
