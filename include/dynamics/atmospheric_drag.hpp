#pragma once

#include "dynamics/force.hpp"
#include "dynamics/atmosphere.hpp"
#include "common/body_constants.hpp"

#include <Eigen/Dense>

#include <memory>

namespace dynamics {

/// @brief Atmospheric drag force model
///
/// @details Computes drag opposing the velocity relative to an atmosphere
///          co-rotating with the central body:
///
///          v_rel  = v - ω × r
///          a_drag = -0.5 * ρ(r) * (C_d * A / m) * |v_rel| * v_rel
///
///          where:
///          - ρ(r) is atmospheric density from the IAtmosphere provider (kg/m³)
///          - ω = [0, 0, ω_body] is the central body's spin vector (rad/s)
///          - C_d is drag coefficient (dimensionless)
///          - A is reference cross-sectional area (m²), m is mass (kg)
///
///          This force:
///          - Always opposes motion relative to the atmosphere
///          - Scales with relative velocity squared
///          - Depends on position through density and through ω × r
///
/// @note The ballistic coefficient β = m / (C_d * A) determines drag sensitivity.
class AtmosphericDrag : public IForce {
public:
    /// @brief Constructs an atmospheric drag model
    /// @param body Central body constants (rotation rate used for the co-rotating atmosphere)
    /// @param atmosphere Density provider
    /// @param area Reference cross-sectional area (m²)
    /// @param mass Object mass (kg)
    /// @param drag_coefficient Drag coefficient C_d (dimensionless, typically 1.0-2.5)
    /// @throws common::ConfigurationError for a null atmosphere or non-positive parameters
    AtmosphericDrag(const common::CelestialBodyConstants& body,
                    std::shared_ptr<const IAtmosphere> atmosphere,
                    double area, double mass, double drag_coefficient = 2.2);

    auto name() const -> std::string override { return "drag"; }

    /// @brief Computes drag acceleration a = -0.5 * ρ * (C_d * A / m) * |v_rel| * v_rel
    auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d override;

    /// @brief Computes Jacobians ∂a/∂r and ∂a/∂v
    ///
    /// @details With k = -0.5 * ρ * (C_d * A / m) and W = [ω×]:
    ///
    ///          ∂a/∂v = k * (|v_rel| I + v_rel v̂_relᵀ)
    ///          ∂a/∂r = -0.5 * (C_d * A / m) * |v_rel| * v_rel ∇ρᵀ - ∂a/∂v * W
    auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> override;

    /// @brief Velocity relative to the co-rotating atmosphere (m/s)
    auto relative_velocity(const ForceContext& ctx) const -> Eigen::Vector3d;

private:
    Eigen::Vector3d omega_;                        ///< Atmosphere spin vector (rad/s)
    std::shared_ptr<const IAtmosphere> atmosphere_; ///< Density provider
    double A_;                                     ///< Reference area (m²)
    double m_;                                     ///< Mass (kg)
    double Cd_;                                    ///< Drag coefficient (dimensionless)
};

} // namespace dynamics
