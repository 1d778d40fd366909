// Ticket: 0002_tower_model

#ifndef STACK_SIM_BODIES_BODY_ROLE_HPP
#define STACK_SIM_BODIES_BODY_ROLE_HPP

#include <cstdint>
#include <string_view>

namespace stack_sim
{

/**
 * @brief Role of a body in the tower, fixed when the body is created.
 *
 * Base bodies are the static foundation the tower stands on. Piece bodies are
 * the stacked, dynamic elements that carry mass into the stability analysis.
 */
enum class BodyRole : uint8_t
{
  Base,
  Piece
};

constexpr std::string_view toString(BodyRole role)
{
  switch (role)
  {
    case BodyRole::Base:
      return "Base";
    case BodyRole::Piece:
      return "Piece";
  }
  return "Unknown";
}

}  // namespace stack_sim

#endif  // STACK_SIM_BODIES_BODY_ROLE_HPP
