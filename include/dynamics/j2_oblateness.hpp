#pragma once

#include "dynamics/force.hpp"
#include "common/body_constants.hpp"

#include <Eigen/Dense>

#include <utility>

namespace dynamics {

/// @brief Second zonal harmonic (J2) perturbation evaluated in the RTN frame
///
/// @details With inclination i and argument of latitude u = ω + ν of the
///          osculating orbit, the perturbing acceleration in RTN is
///
///          f = -3μJ2R²/(2r⁴) [ 1 - 3 sin²i sin²u,
///                               2 sin²i sin u cos u,
///                               2 sin i cos i sin u ]
///
///          and is rotated to inertial coordinates with the RTN→inertial matrix.
///          This is the perturbation only; the central term comes from
///          CentralGravity.
///
/// @note The Jacobian of this term is not modelled: compute_jacobian() returns
///       zero matrices. State transition matrices propagated with J2 enabled
///       therefore omit the J2 gradient (a first-order bias in sensitivities).
/// @note Degenerate geometry (near-zero position or angular momentum) is a
///       recoverable failure: evaluate() returns ForceResult::failure() and the
///       composer decides whether to skip the term.
class J2Oblateness : public IForce {
public:
    /// @param body Central body constants; gm, equatorial_radius and j2 are used
    /// @throws common::ConfigurationError if the body has no J2 or invalid constants
    explicit J2Oblateness(const common::CelestialBodyConstants& body);

    auto name() const -> std::string override { return "j2"; }

    /// @throws common::DegenerateGeometryError if the orbit plane is undefined
    auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d override;

    /// @brief Zero matrices (the J2 gradient is not modelled)
    auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> override;

    /// @brief Converts degenerate geometry into a failure result
    auto evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult override;

    /// @brief Perturbing acceleration in RTN components (m/s²)
    auto compute_rtn_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d;

private:
    double GM_; ///< Gravitational parameter (m^3/s^2)
    double J2_; ///< J2 coefficient
    double Re_; ///< Equatorial radius (m)
};

} // namespace dynamics
