#include "dynamics/solar_radiation_pressure.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <string>

namespace dynamics {

SolarRadiationPressure::SolarRadiationPressure(std::shared_ptr<const environment::IEphemeris> ephemeris,
                                               std::shared_ptr<const ISolarPressure> pressure,
                                               double area, double mass, double srp_coefficient)
    : ephemeris_(std::move(ephemeris))
    , pressure_(std::move(pressure))
    , A_(area)
    , m_(mass)
    , c_srp_(srp_coefficient)
{
    if (!ephemeris_) {
        throw common::ConfigurationError("SRP requires an ephemeris for the Sun position");
    }
    if (!pressure_) {
        throw common::ConfigurationError("SRP requires a solar pressure model");
    }
    if (!(A_ > 0.0) || !std::isfinite(A_)) {
        throw common::ConfigurationError("SRP requires a positive cross-sectional area");
    }
    if (!(m_ > 0.0) || !std::isfinite(m_)) {
        throw common::ConfigurationError("SRP requires a positive mass");
    }
    if (!(c_srp_ > 0.0) || !std::isfinite(c_srp_)) {
        throw common::ConfigurationError("SRP coefficient must be positive");
    }
}

auto SolarRadiationPressure::sun_to_object(const ForceContext& ctx) const -> Eigen::Vector3d {
    Eigen::Vector3d r_sun = ephemeris_->position_of("SUN", ctx.epoch, common::CoordinateFrame::ECI);
    return ctx.position - r_sun;
}

auto SolarRadiationPressure::acceleration_from_sun(const Eigen::Vector3d& r) const -> Eigen::Vector3d {
    double d = r.norm();
    if (!(d >= 1.0)) {
        throw common::DegenerateGeometryError("SRP evaluated at the Sun's centre");
    }
    return pressure_->pressure(d) * c_srp_ * (A_ / m_) * (r / d);
}

auto SolarRadiationPressure::jacobian_from_sun(const Eigen::Vector3d& r) const -> Eigen::Matrix3d {
    double d = r.norm();
    if (!(d >= 1.0)) {
        throw common::DegenerateGeometryError("SRP evaluated at the Sun's centre");
    }
    Eigen::Vector3d r_hat = r / d;
    Eigen::Matrix3d radial = r_hat * r_hat.transpose();
    Eigen::Matrix3d I = Eigen::Matrix3d::Identity();

    double p = pressure_->pressure(d);
    double dp = pressure_->pressure_derivative(d);

    return c_srp_ * (A_ / m_) * (dp * radial + (p / d) * (I - radial));
}

auto SolarRadiationPressure::compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d {
    return acceleration_from_sun(sun_to_object(ctx));
}

auto SolarRadiationPressure::compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> {
    return {jacobian_from_sun(sun_to_object(ctx)), Eigen::Matrix3d::Zero()};
}

auto SolarRadiationPressure::evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult {
    Eigen::Vector3d r = sun_to_object(ctx);
    ForceContribution contribution;
    contribution.acceleration = acceleration_from_sun(r);
    if (with_jacobians) {
        contribution.da_dr = jacobian_from_sun(r);
    }
    return ForceResult::success(contribution);
}

} // namespace dynamics
