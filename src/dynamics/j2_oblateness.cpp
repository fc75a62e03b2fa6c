#include "dynamics/j2_oblateness.hpp"
#include "common/errors.hpp"
#include "transforms/orbital_frames.hpp"

#include <cmath>

namespace dynamics {

J2Oblateness::J2Oblateness(const common::CelestialBodyConstants& body)
    : GM_(body.gm), J2_(body.j2), Re_(body.equatorial_radius)
{
    body.validate();
    if (J2_ == 0.0) {
        throw common::ConfigurationError("J2 perturbation enabled but " + body.name + " has no J2 coefficient");
    }
}

auto J2Oblateness::compute_rtn_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    Eigen::VectorXd state(6);
    state << ctx.position, ctx.velocity;
    transforms::OrbitalElements oe = transforms::cartesian_to_elements(state, GM_);

    double r_norm = ctx.position.norm();
    double r4 = r_norm * r_norm * r_norm * r_norm;
    double sin_i = std::sin(oe.inclination);
    double cos_i = std::cos(oe.inclination);
    double sin_u = std::sin(oe.argument_of_latitude);
    double cos_u = std::cos(oe.argument_of_latitude);

    double scale = -3.0 * GM_ * J2_ * Re_ * Re_ / (2.0 * r4);

    Eigen::Vector3d f_rtn;
    f_rtn << 1.0 - 3.0 * sin_i * sin_i * sin_u * sin_u,
             2.0 * sin_i * sin_i * sin_u * cos_u,
             2.0 * sin_i * cos_i * sin_u;
    return scale * f_rtn;
}

auto J2Oblateness::compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    Eigen::Vector3d f_rtn = compute_rtn_acceleration(ctx);
    Eigen::Matrix3d R = transforms::rtn_to_inertial(ctx.position, ctx.velocity);
    return R * f_rtn;
}

auto J2Oblateness::compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> {
    return {Eigen::Matrix3d::Zero(), Eigen::Matrix3d::Zero()};
}

auto J2Oblateness::evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult {
    ForceContribution contribution;
    try {
        contribution.acceleration = compute_acceleration(ctx);
    } catch (const common::DegenerateGeometryError& e) {
        return ForceResult::failure(e.what());
    }
    // Jacobians stay zero whether or not they were requested
    return ForceResult::success(contribution);
}

} // namespace dynamics
