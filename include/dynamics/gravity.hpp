#pragma once

#include "dynamics/force.hpp"
#include "common/body_constants.hpp"

#include <Eigen/Dense>

#include <utility>

namespace dynamics {

/// @brief Central-body (two-body) gravity
/// @details Implements Newtonian gravity: a = -μ/r³ * r. Always active; it is the
///          baseline every optional perturbation is added to.
class CentralGravity : public IForce {
public:
    /// @brief Constructor
    /// @param GM Gravitational parameter (default is Earth's value)
    /// @throws common::ConfigurationError if GM is not positive
    explicit CentralGravity(double GM = 3.986004418e14);

    /// @brief Constructs from the central body's constants
    explicit CentralGravity(const common::CelestialBodyConstants& body);

    auto name() const -> std::string override { return "central_gravity"; }

    /// @brief Computes gravitational acceleration at position
    /// @details computes: f(x,v) = a = -μ/r³ * r
    /// @throws common::DegenerateGeometryError if |r| is below 1 m
    auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d override;

    /// @brief Computes Jacobian of gravitational acceleration
    /// @details computes: ∂a/∂r = μ/r⁵ (3 r rᵀ - r² I), ∂a/∂v = 0
    /// @throws common::DegenerateGeometryError if |r| is below 1 m
    auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> override;

    auto gm() const -> double { return GM_; }

private:
    double GM_; ///< Gravitational parameter (m^3/s^2)
};

} // namespace dynamics
