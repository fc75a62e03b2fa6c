#include "dynamics/third_body_gravity.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace dynamics {

namespace {

/// Acceleration (and optionally ∂a/∂r) from one body at s
void accumulate(const Eigen::Vector3d& r, const Eigen::Vector3d& s, double gm,
                bool with_jacobian, ForceContribution& out, const std::string& body)
{
    const Eigen::Vector3d d = s - r;
    const double d_norm = d.norm();
    const double s_norm = s.norm();
    if (!(d_norm >= 1.0) || !(s_norm >= 1.0)) {
        throw common::DegenerateGeometryError("Object or central body coincides with " + body);
    }
    const double d3 = d_norm * d_norm * d_norm;
    const double s3 = s_norm * s_norm * s_norm;

    out.acceleration += gm * (d / d3 - s / s3);

    if (with_jacobian) {
        const double d5 = d3 * d_norm * d_norm;
        out.da_dr += gm * (3.0 * d * d.transpose() / d5 - Eigen::Matrix3d::Identity() / d3);
    }
}

} // namespace

ThirdBodyGravity::ThirdBodyGravity(std::shared_ptr<const environment::IEphemeris> ephemeris,
                                   std::vector<PerturbingBody> bodies)
    : ephemeris_(std::move(ephemeris)), bodies_(std::move(bodies))
{
    if (!ephemeris_) {
        throw common::ConfigurationError("Third-body gravity requires an ephemeris");
    }
    for (const auto& body : bodies_) {
        if (!(body.gm > 0.0) || !std::isfinite(body.gm)) {
            throw common::ConfigurationError("GM of perturbing body " + body.name + " must be positive");
        }
    }
}

auto ThirdBodyGravity::from_ephemeris(std::shared_ptr<const environment::IEphemeris> ephemeris,
                                      const std::vector<std::string>& body_names) -> ThirdBodyGravity
{
    if (!ephemeris) {
        throw common::ConfigurationError("Third-body gravity requires an ephemeris");
    }
    std::vector<PerturbingBody> bodies;
    bodies.reserve(body_names.size());
    for (const auto& name : body_names) {
        bodies.push_back({name, ephemeris->body_constant(name, environment::GM)});
    }
    return ThirdBodyGravity(std::move(ephemeris), std::move(bodies));
}

auto ThirdBodyGravity::evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult {
    ForceContribution contribution;
    for (const auto& body : bodies_) {
        Eigen::Vector3d s = ephemeris_->position_of(body.name, ctx.epoch, common::CoordinateFrame::ECI);
        accumulate(ctx.position, s, body.gm, with_jacobians, contribution, body.name);
    }
    return ForceResult::success(contribution);
}

auto ThirdBodyGravity::compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    return evaluate(ctx, false).contribution().acceleration;
}

auto ThirdBodyGravity::compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> {
    ForceResult result = evaluate(ctx, true);
    return {result.contribution().da_dr, result.contribution().da_dv};
}

} // namespace dynamics
