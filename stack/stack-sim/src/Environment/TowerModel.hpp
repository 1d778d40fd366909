// Ticket: 0002_tower_model

#ifndef STACK_SIM_ENVIRONMENT_TOWER_MODEL_HPP
#define STACK_SIM_ENVIRONMENT_TOWER_MODEL_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "stack-sim/src/Bodies/StackedObject.hpp"

namespace stack_sim
{

/**
 * @brief Owner of the bodies that make up a tower.
 *
 * Host-side container handed to the analysis components as a span; the
 * analysis never holds on to it between calls. Instance ids are assigned
 * monotonically and never reused within one model, even across clear().
 *
 * @note Not thread-safe - single-threaded simulation assumed.
 */
class TowerModel
{
public:
  TowerModel() = default;

  /**
   * @brief Add a static foundation body
   * @return Reference to the stored body (valid until the next mutation)
   */
  const StackedObject& addBase(const Coordinate& halfExtents,
                               const ReferenceFrame& frame);

  /**
   * @brief Add a stacked piece
   * @return Reference to the stored body (valid until the next mutation)
   * @throws std::invalid_argument if mass or half-extents are not positive
   */
  const StackedObject& addPiece(const Coordinate& halfExtents,
                                const ReferenceFrame& frame,
                                double mass,
                                const Coordinate& centerOfMassOffset =
                                  Coordinate{});

  /**
   * @brief Remove a body by instance id
   * @throws std::out_of_range if no body has this id
   */
  void removeObject(uint32_t instanceId);

  /**
   * @brief Remove every body
   */
  void clear();

  [[nodiscard]] std::span<const StackedObject> getObjects() const
  {
    return objects_;
  }

  /**
   * @brief Mutable lookup, used by the host to write back simulated poses
   * @return Pointer to the body, or nullptr if not found
   */
  StackedObject* findObject(uint32_t instanceId);

  [[nodiscard]] const StackedObject* findObject(uint32_t instanceId) const;

  [[nodiscard]] size_t getPieceCount() const;

  /**
   * @brief Highest point of any piece collider above the ground [m]
   *
   * Zero when the tower has no pieces.
   */
  [[nodiscard]] double getHeight() const;

private:
  std::vector<StackedObject> objects_;
  uint32_t nextInstanceId_{0};
};

}  // namespace stack_sim

#endif  // STACK_SIM_ENVIRONMENT_TOWER_MODEL_HPP
