// Ticket: 0001_stack_datatypes

#ifndef STACK_SIM_DATATYPES_COORDINATE_HPP
#define STACK_SIM_DATATYPES_COORDINATE_HPP

#include "stack-sim/src/DataTypes/Vec3DBase.hpp"

namespace stack_sim
{

/**
 * @brief World-space position.
 *
 * World convention for the whole library: +y is up and the ground plane is
 * the x-z plane.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

/**
 * @brief Drop the vertical component of a position.
 * @return (x, 0, z)
 */
inline Coordinate projectToGround(const Coordinate& point)
{
  return point.groundProjection();
}

}  // namespace stack_sim

#endif  // STACK_SIM_DATATYPES_COORDINATE_HPP
