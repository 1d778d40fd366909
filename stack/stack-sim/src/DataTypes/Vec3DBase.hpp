// Ticket: 0001_stack_datatypes
// Shared base for the Eigen-backed 3D vector types

#ifndef STACK_SIM_DATATYPES_VEC3D_BASE_HPP
#define STACK_SIM_DATATYPES_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace stack_sim::detail
{

/**
 * @brief CRTP base for world-space 3D vectors (+y up, ground plane x-z).
 *
 * Derived types keep the full Eigen expression API and gain the ground-plane
 * accessors the support-polygon code works in:
 *
 *   struct MyVec3Type final : Vec3DBase<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  /// (x, z) components as a 2D vector in the ground plane
  [[nodiscard]] Eigen::Vector2d ground() const
  {
    return Eigen::Vector2d{x(), z()};
  }

  /// Same vector with the vertical component dropped
  [[nodiscard]] Derived groundProjection() const
  {
    return Derived{x(), 0.0, z()};
  }

  /// Length of the horizontal part
  [[nodiscard]] double groundNorm() const
  {
    return ground().norm();
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace stack_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // STACK_SIM_DATATYPES_VEC3D_BASE_HPP
