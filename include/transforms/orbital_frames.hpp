#pragma once

/// @file orbital_frames.hpp
/// @brief Classical orbital elements and the RTN <-> inertial rotation.
///
/// All angles are in radians, lengths in metres. Functions that need a
/// direction (unit position, orbit normal) throw common::DegenerateGeometryError
/// instead of letting a near-zero norm turn into NaN.

#include <Eigen/Dense>

namespace transforms {

/// Positions shorter than this (m) have no usable radial direction
constexpr double MIN_POSITION_NORM = 1.0;
/// Relative threshold |r x v| / (|r||v|) below which the orbit plane is undefined
constexpr double MIN_RELATIVE_ANGULAR_MOMENTUM = 1e-12;

/// @struct OrbitalElements
/// @brief Classical (Keplerian) orbital elements
///
/// For circular orbits the argument of periapsis is 0 and the true anomaly equals
/// the argument of latitude. For equatorial orbits the node line is taken along +x
/// (RAAN = 0). argument_of_latitude is always argument_of_periapsis + true_anomaly
/// modulo 2π.
struct OrbitalElements {
    double semi_major_axis;        ///< a (m), +inf for parabolic, negative for hyperbolic
    double eccentricity;           ///< e
    double inclination;            ///< i in [0, π]
    double raan;                   ///< Ω in [0, 2π)
    double argument_of_periapsis;  ///< ω in [0, 2π)
    double true_anomaly;           ///< ν in [0, 2π)
    double argument_of_latitude;   ///< u = ω + ν in [0, 2π)
};

/// @brief Converts an inertial Cartesian state to classical orbital elements
/// @param state 6D state [x, y, z, vx, vy, vz] (m, m/s)
/// @param mu Gravitational parameter of the central body (m^3/s^2)
/// @throws common::ConfigurationError if state is not 6D or mu is not positive
/// @throws common::DegenerateGeometryError for near-zero position or angular momentum
auto cartesian_to_elements(const Eigen::VectorXd& state, double mu) -> OrbitalElements;

/// @brief Converts classical orbital elements to an inertial Cartesian state
/// @throws common::ConfigurationError for parabolic/degenerate element sets (e = 1, p <= 0)
auto elements_to_cartesian(const OrbitalElements& elements, double mu) -> Eigen::VectorXd;

/// @brief Rotation matrix from the RTN frame to the inertial frame
///
/// @details Columns are the unit radial r̂ = r/|r|, transverse t̂ = n̂ × r̂ and
///          orbit-normal n̂ = (r × v)/|r × v| directions, expressed in inertial
///          coordinates, so a_inertial = R * a_rtn.
/// @throws common::DegenerateGeometryError for near-zero position or angular momentum
auto rtn_to_inertial(const Eigen::Vector3d& position, const Eigen::Vector3d& velocity) -> Eigen::Matrix3d;

} // namespace transforms
