#pragma once

#include "dynamics/force.hpp"
#include "dynamics/solar_pressure.hpp"
#include "environment/ephemeris.hpp"

#include <Eigen/Dense>

#include <memory>
#include <utility>

namespace dynamics {

/// @brief Cannonball solar radiation pressure
///
/// @details With r the Sun-to-object vector and d = |r|:
///
///          a = P(d) * c_srp * (A / m) * r̂
///
///          ∂a/∂r = c_srp * (A / m) * [ P'(d) r̂ r̂ᵀ + P(d) (I - r̂ r̂ᵀ) / d ]
///
///          which for an inverse-square P reduces to
///          P(d) d² c_srp (A/m) (I/|r|³ - 3 r rᵀ/|r|⁵). There is no velocity
///          dependence, so ∂a/∂v = 0.
///
/// @note No eclipse or shadow function is applied: the object is always fully
///       illuminated. Accelerations inside the central body's shadow are
///       therefore overestimated.
class SolarRadiationPressure : public IForce {
public:
    /// @param ephemeris Provides the Sun position relative to the central body
    /// @param pressure Solar pressure as a function of distance
    /// @param area Illuminated cross-sectional area (m²)
    /// @param mass Object mass (kg)
    /// @param srp_coefficient Absorption + reflection coefficient c_srp (default 1)
    /// @throws common::ConfigurationError for null collaborators or non-positive parameters
    SolarRadiationPressure(std::shared_ptr<const environment::IEphemeris> ephemeris,
                           std::shared_ptr<const ISolarPressure> pressure,
                           double area, double mass, double srp_coefficient = 1.0);

    auto name() const -> std::string override { return "srp"; }

    /// @throws common::MissingEphemerisData if the Sun position is unavailable
    auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d override;

    /// @throws common::MissingEphemerisData if the Sun position is unavailable
    auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> override;

    /// @brief Single Sun lookup shared by acceleration and Jacobian
    auto evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult override;

    /// @brief SRP acceleration for a Sun-to-object vector (m/s²)
    /// @throws common::DegenerateGeometryError if the vector is near zero
    auto acceleration_from_sun(const Eigen::Vector3d& r_sun_to_object) const -> Eigen::Vector3d;

    /// @brief ∂a/∂r for a Sun-to-object vector (1/s²)
    /// @throws common::DegenerateGeometryError if the vector is near zero
    auto jacobian_from_sun(const Eigen::Vector3d& r_sun_to_object) const -> Eigen::Matrix3d;

private:
    /// @brief Sun-to-object vector r_obj - r_sun (m)
    auto sun_to_object(const ForceContext& ctx) const -> Eigen::Vector3d;

    std::shared_ptr<const environment::IEphemeris> ephemeris_; ///< Sun position source
    std::shared_ptr<const ISolarPressure> pressure_;           ///< P(d)
    double A_;                                                 ///< Area (m²)
    double m_;                                                 ///< Mass (kg)
    double c_srp_;                                             ///< Radiation pressure coefficient
};

} // namespace dynamics
