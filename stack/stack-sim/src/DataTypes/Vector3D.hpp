// Ticket: 0001_stack_datatypes
// Generic 3D vector wrapper for directions and rates

#ifndef STACK_SIM_DATATYPES_VECTOR3D_HPP
#define STACK_SIM_DATATYPES_VECTOR3D_HPP

#include "stack-sim/src/DataTypes/Vec3DBase.hpp"

namespace stack_sim
{

/**
 * @brief Generic 3D vector type
 *
 * Used for directions (up axes), linear velocities and angular velocities.
 * For positions prefer Coordinate.
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  /// World up direction (+y)
  static Vector3D up()
  {
    return Vector3D{0.0, 1.0, 0.0};
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace stack_sim

#endif  // STACK_SIM_DATATYPES_VECTOR3D_HPP
