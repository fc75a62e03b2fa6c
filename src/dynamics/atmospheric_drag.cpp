#include "dynamics/atmospheric_drag.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <utility>

namespace dynamics {

namespace {
auto skew(const Eigen::Vector3d& w) -> Eigen::Matrix3d {
    Eigen::Matrix3d W;
    W <<   0.0, -w(2),  w(1),
          w(2),   0.0, -w(0),
         -w(1),  w(0),   0.0;
    return W;
}
} // namespace

AtmosphericDrag::AtmosphericDrag(const common::CelestialBodyConstants& body,
                                 std::shared_ptr<const IAtmosphere> atmosphere,
                                 double area, double mass, double drag_coefficient)
    : omega_(0.0, 0.0, body.rotation_rate)
    , atmosphere_(std::move(atmosphere))
    , A_(area)
    , m_(mass)
    , Cd_(drag_coefficient)
{
    if (!atmosphere_) {
        throw common::ConfigurationError("Drag requires an atmosphere model");
    }
    if (!(A_ > 0.0) || !std::isfinite(A_)) {
        throw common::ConfigurationError("Drag requires a positive cross-sectional area");
    }
    if (!(m_ > 0.0) || !std::isfinite(m_)) {
        throw common::ConfigurationError("Drag requires a positive mass");
    }
    if (!(Cd_ > 0.0) || !std::isfinite(Cd_)) {
        throw common::ConfigurationError("Drag coefficient must be positive");
    }
}

auto AtmosphericDrag::relative_velocity(const ForceContext& ctx) const -> Eigen::Vector3d {
    return ctx.velocity - omega_.cross(ctx.position);
}

auto AtmosphericDrag::compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    const Eigen::Vector3d v_rel = relative_velocity(ctx);
    const double v_mag = v_rel.norm();

    // No drag if at rest in the atmosphere
    if (v_mag < 1e-10) {
        return Eigen::Vector3d::Zero();
    }

    const double rho = atmosphere_->density(ctx.position, ctx.epoch);
    return -0.5 * rho * (Cd_ * A_ / m_) * v_mag * v_rel;
}

auto AtmosphericDrag::compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> {
    const Eigen::Vector3d v_rel = relative_velocity(ctx);
    const double v_mag = v_rel.norm();

    // If relative velocity is near zero, both Jacobians are zero
    if (v_mag < 1e-10) {
        return {Eigen::Matrix3d::Zero(), Eigen::Matrix3d::Zero()};
    }

    const double rho = atmosphere_->density(ctx.position, ctx.epoch);
    const Eigen::Vector3d grad_rho = atmosphere_->density_gradient(ctx.position, ctx.epoch);
    const Eigen::Vector3d v_rel_unit = v_rel / v_mag;

    // --- ∂a/∂v (velocity dependence) ---
    //
    //   a = k * |v_rel| * v_rel,  k = -0.5 * ρ * (C_d * A / m)
    //   ∂a/∂v = k * (|v_rel| * I + v_rel * v̂_relᵀ)
    const double k = -0.5 * rho * (Cd_ * A_ / m_);
    Eigen::Matrix3d da_dv = k * (v_mag * Eigen::Matrix3d::Identity() + v_rel * v_rel_unit.transpose());

    // --- ∂a/∂r (density variation plus the co-rotation term) ---
    //
    //   ∂v_rel/∂r = -[ω×]
    Eigen::Matrix3d da_dr = -0.5 * (Cd_ * A_ / m_) * v_mag * v_rel * grad_rho.transpose()
                            - da_dv * skew(omega_);

    return {da_dr, da_dv};
}

} // namespace dynamics
