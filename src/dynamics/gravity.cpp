#include "dynamics/gravity.hpp"
#include "common/errors.hpp"
#include "transforms/orbital_frames.hpp"

#include <cmath>
#include <string>

namespace dynamics {

namespace {
auto checked_norm(const Eigen::Vector3d& r) -> double {
    double r_norm = r.norm();
    if (!(r_norm >= transforms::MIN_POSITION_NORM)) {
        throw common::DegenerateGeometryError(
            "Central gravity evaluated at |r| = " + std::to_string(r_norm) + " m");
    }
    return r_norm;
}
} // namespace

CentralGravity::CentralGravity(double GM)
    : GM_(GM)
{
    if (!(GM_ > 0.0) || !std::isfinite(GM_)) {
        throw common::ConfigurationError("Gravitational parameter must be positive");
    }
}

CentralGravity::CentralGravity(const common::CelestialBodyConstants& body)
    : CentralGravity(body.gm)
{}

auto CentralGravity::compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    double r_norm = checked_norm(ctx.position);
    return -GM_ / (r_norm * r_norm * r_norm) * ctx.position;
}

auto CentralGravity::compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> {
    const Eigen::Vector3d& r = ctx.position;
    double r_norm = checked_norm(r);
    double r2 = r_norm * r_norm;
    double r5 = r2 * r2 * r_norm;

    Eigen::Matrix3d da_dv = Eigen::Matrix3d::Zero();  // Gravity doesn't depend on velocity

    // ∂a/∂r = μ/r⁵ * (3 r rᵀ - r² I)
    Eigen::Matrix3d da_dr = (GM_ / r5) * (3.0 * r * r.transpose() - r2 * Eigen::Matrix3d::Identity());

    return {da_dr, da_dv};
}

} // namespace dynamics
