#include "transforms/orbital_frames.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace transforms {

namespace {

constexpr double TWO_PI = 2.0 * M_PI;
constexpr double CIRCULAR_TOLERANCE = 1e-11;
constexpr double EQUATORIAL_TOLERANCE = 1e-11;

auto wrap_two_pi(double angle) -> double {
    double wrapped = std::fmod(angle, TWO_PI);
    if (wrapped < 0.0) {
        wrapped += TWO_PI;
    }
    return wrapped;
}

/// Signed angle from a to b about the axis (all unit vectors)
auto signed_angle(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& axis) -> double {
    return wrap_two_pi(std::atan2(axis.dot(a.cross(b)), a.dot(b)));
}

/// Validates position and angular momentum, returning the unit orbit normal
auto orbit_normal(const Eigen::Vector3d& r, const Eigen::Vector3d& v) -> Eigen::Vector3d {
    const double r_norm = r.norm();
    if (!(r_norm >= MIN_POSITION_NORM)) {
        throw common::DegenerateGeometryError(
            "Position norm " + std::to_string(r_norm) + " m is too small to define a radial direction");
    }
    const Eigen::Vector3d h = r.cross(v);
    const double h_norm = h.norm();
    if (!(h_norm > MIN_RELATIVE_ANGULAR_MOMENTUM * r_norm * v.norm()) || h_norm == 0.0) {
        throw common::DegenerateGeometryError(
            "Angular momentum is too small to define an orbit plane (rectilinear or zero velocity)");
    }
    return h / h_norm;
}

} // namespace

auto cartesian_to_elements(const Eigen::VectorXd& state, double mu) -> OrbitalElements {
    if (state.size() < 6) {
        throw common::ConfigurationError("State vector must have 6 elements");
    }
    if (!(mu > 0.0)) {
        throw common::ConfigurationError("Gravitational parameter must be positive");
    }

    const Eigen::Vector3d r = state.head<3>();
    const Eigen::Vector3d v = state.segment<3>(3);
    const Eigen::Vector3d h_hat = orbit_normal(r, v);

    const double r_norm = r.norm();
    const double v_norm = v.norm();
    const Eigen::Vector3d r_hat = r / r_norm;

    OrbitalElements elements;

    // Energy and size
    const double energy = 0.5 * v_norm * v_norm - mu / r_norm;
    const Eigen::Vector3d e_vec = ((v_norm * v_norm - mu / r_norm) * r - r.dot(v) * v) / mu;
    elements.eccentricity = e_vec.norm();
    if (std::abs(energy) < std::numeric_limits<double>::epsilon() * mu / r_norm) {
        elements.semi_major_axis = std::numeric_limits<double>::infinity();
    } else {
        elements.semi_major_axis = -mu / (2.0 * energy);
    }

    // Orientation of the plane
    elements.inclination = std::acos(std::clamp(h_hat.z(), -1.0, 1.0));

    // Node line n = k x h; +x is used when the orbit is equatorial
    Eigen::Vector3d node(-h_hat.y(), h_hat.x(), 0.0);
    const double node_norm = node.norm();
    Eigen::Vector3d node_hat;
    if (node_norm > EQUATORIAL_TOLERANCE) {
        node_hat = node / node_norm;
        elements.raan = wrap_two_pi(std::atan2(node_hat.y(), node_hat.x()));
    } else {
        node_hat = Eigen::Vector3d::UnitX();
        elements.raan = 0.0;
    }

    // In-plane angles, all measured about the orbit normal
    elements.argument_of_latitude = signed_angle(node_hat, r_hat, h_hat);
    if (elements.eccentricity > CIRCULAR_TOLERANCE) {
        const Eigen::Vector3d e_hat = e_vec / elements.eccentricity;
        elements.argument_of_periapsis = signed_angle(node_hat, e_hat, h_hat);
        elements.true_anomaly = wrap_two_pi(elements.argument_of_latitude - elements.argument_of_periapsis);
    } else {
        elements.argument_of_periapsis = 0.0;
        elements.true_anomaly = elements.argument_of_latitude;
    }

    return elements;
}

auto elements_to_cartesian(const OrbitalElements& elements, double mu) -> Eigen::VectorXd {
    if (!(mu > 0.0)) {
        throw common::ConfigurationError("Gravitational parameter must be positive");
    }
    const double e = elements.eccentricity;
    const double a = elements.semi_major_axis;
    if (std::abs(e - 1.0) < 1e-12 || !std::isfinite(a)) {
        throw common::ConfigurationError("Parabolic element sets are not supported");
    }
    const double p = a * (1.0 - e * e);
    if (!(p > 0.0)) {
        throw common::ConfigurationError("Semi-latus rectum must be positive");
    }

    const double nu = elements.true_anomaly;
    const double r = p / (1.0 + e * std::cos(nu));

    // Perifocal position/velocity
    Eigen::Vector3d r_pf(r * std::cos(nu), r * std::sin(nu), 0.0);
    Eigen::Vector3d v_pf(-std::sqrt(mu / p) * std::sin(nu), std::sqrt(mu / p) * (e + std::cos(nu)), 0.0);

    // Perifocal to inertial: R3(-Ω) R1(-i) R3(-ω)
    const Eigen::Matrix3d R =
        (Eigen::AngleAxisd(elements.raan, Eigen::Vector3d::UnitZ()) *
         Eigen::AngleAxisd(elements.inclination, Eigen::Vector3d::UnitX()) *
         Eigen::AngleAxisd(elements.argument_of_periapsis, Eigen::Vector3d::UnitZ())).toRotationMatrix();

    Eigen::VectorXd state(6);
    state << R * r_pf, R * v_pf;
    return state;
}

auto rtn_to_inertial(const Eigen::Vector3d& position, const Eigen::Vector3d& velocity) -> Eigen::Matrix3d {
    const Eigen::Vector3d n_hat = orbit_normal(position, velocity);
    const Eigen::Vector3d r_hat = position.normalized();
    const Eigen::Vector3d t_hat = n_hat.cross(r_hat);

    Eigen::Matrix3d R;
    R.col(0) = r_hat;
    R.col(1) = t_hat;
    R.col(2) = n_hat;
    return R;
}

} // namespace transforms
