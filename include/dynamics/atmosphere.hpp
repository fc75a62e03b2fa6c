#pragma once

#include "common/epoch.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace dynamics {
namespace atmosphere {

/// @brief US Standard Atmosphere 1976 (more accurate)
/// @param altitude Altitude above sea level (m)
/// @return Atmospheric density (kg/m³)
inline double get_density_us76(double altitude) {
    // Piecewise model for different atmospheric layers
    
    if (altitude < 0.0) {
        return 1.225;
    }
    
    // Troposphere (0-11 km)
    if (altitude < 11000.0) {
        double T = 288.15 - 0.0065 * altitude;  // Temperature (K)
        double p = 101325.0 * std::pow(T / 288.15, 5.2561);  // Pressure (Pa)
        return p / (287.05 * T);  // Density from ideal gas law
    }
    
    // Lower Stratosphere (11-25 km)
    if (altitude < 25000.0) {
        double T = 216.65;  // Isothermal layer
        double p = 22632.0 * std::exp(-0.0001577 * (altitude - 11000.0));
        return p / (287.05 * T);
    }
    
    // Upper Stratosphere (25-47 km)
    if (altitude < 47000.0) {
        double T = 216.65 + 0.003 * (altitude - 25000.0);
        double p = 2488.4 * std::pow(T / 216.65, -11.388);
        return p / (287.05 * T);
    }
    
    // Compute density at 47 km boundary for continuity
    // Using upper stratosphere formula at exactly 47 km
    constexpr double T_47km = 216.65 + 0.003 * (47000.0 - 25000.0);  // 282.65 K
    const double p_47km = 2488.4 * std::pow(T_47km / 216.65, -11.388);  // Pa
    const double rho_47km = p_47km / (287.05 * T_47km);  // kg/m³
    
    // Mesosphere and above (47+ km)
    // Use different scale heights for different altitude ranges
    // to better match observed atmospheric behavior
    
    if (altitude < 100000.0) {
        // Mesosphere (47-100 km): scale height ~7 km
        return rho_47km * std::exp(-(altitude - 47000.0) / 7200.0);
    } else if (altitude < 200000.0) {
        // Lower thermosphere (100-200 km): scale height ~20 km
        // Match density at 100 km boundary
        double rho_100km = rho_47km * std::exp(-(100000.0 - 47000.0) / 7200.0);
        return rho_100km * std::exp(-(altitude - 100000.0) / 20000.0);
    } else {
        // Upper thermosphere (200+ km): scale height ~50 km
        // Match density at 200 km boundary
        double rho_100km = rho_47km * std::exp(-(100000.0 - 47000.0) / 7200.0);
        double rho_200km = rho_100km * std::exp(-(200000.0 - 100000.0) / 20000.0);
        return rho_200km * std::exp(-(altitude - 200000.0) / 50000.0);
    }
}

} // namespace atmosphere

/// @brief Atmospheric density provider consumed by AtmosphericDrag
///
/// @details density() is a function of inertial position and epoch. The
///          gradient feeds ∂a/∂r of the drag model; the default implementation
///          uses central differences with a 1 m step along each inertial axis,
///          which is consistent with whatever closed form density() uses.
class IAtmosphere {
public:
    virtual ~IAtmosphere() = default;

    /// @brief Density at a position (kg/m³)
    virtual auto density(const Eigen::Vector3d& position, const common::Epoch& epoch) const -> double = 0;

    /// @brief Gradient of density with respect to position (kg/m⁴)
    virtual auto density_gradient(const Eigen::Vector3d& position, const common::Epoch& epoch) const -> Eigen::Vector3d {
        constexpr double h_step = 1.0;  // 1 meter step
        Eigen::Vector3d gradient;
        for (int i = 0; i < 3; ++i) {
            Eigen::Vector3d plus = position;
            Eigen::Vector3d minus = position;
            plus(i) += h_step;
            minus(i) -= h_step;
            gradient(i) = (density(plus, epoch) - density(minus, epoch)) / (2.0 * h_step);
        }
        return gradient;
    }
};

/// @brief Exponential atmosphere over a spherical body: ρ = ρ₀ e^(-(|r|-R)/H)
class ExponentialAtmosphere : public IAtmosphere {
public:
    /// @param body_radius Reference radius for altitude (m)
    /// @param surface_density ρ₀ (kg/m³)
    /// @param scale_height H (m)
    /// @throws common::ConfigurationError unless ρ₀ and H are positive and finite
    explicit ExponentialAtmosphere(double body_radius = 6378137.0,
                                   double surface_density = 1.225,
                                   double scale_height = 8500.0)
        : radius_(body_radius), rho0_(surface_density), H_(scale_height)
    {
        if (!(rho0_ > 0.0) || !std::isfinite(rho0_)) {
            throw common::ConfigurationError("Surface density must be positive and finite");
        }
        if (!(H_ > 0.0) || !std::isfinite(H_)) {
            throw common::ConfigurationError("Scale height must be positive and finite");
        }
    }

    auto density(const Eigen::Vector3d& position, const common::Epoch& epoch) const -> double override {
        double altitude = position.norm() - radius_;
        if (altitude < 0.0) {
            return rho0_;
        }
        return rho0_ * std::exp(-altitude / H_);
    }

    /// @brief Analytic gradient: ∇ρ = -ρ/H r̂ above the surface, zero below
    auto density_gradient(const Eigen::Vector3d& position, const common::Epoch& epoch) const -> Eigen::Vector3d override {
        double r_norm = position.norm();
        if (r_norm - radius_ < 0.0 || r_norm == 0.0) {
            return Eigen::Vector3d::Zero();
        }
        return -density(position, epoch) / H_ * position / r_norm;
    }

private:
    double radius_; ///< Reference radius (m)
    double rho0_;   ///< Surface density (kg/m³)
    double H_;      ///< Scale height (m)
};

/// @brief US Standard Atmosphere 1976 over a spherical body
class US76Atmosphere : public IAtmosphere {
public:
    explicit US76Atmosphere(double body_radius = 6378137.0)
        : radius_(body_radius)
    {}

    auto density(const Eigen::Vector3d& position, const common::Epoch& epoch) const -> double override {
        return atmosphere::get_density_us76(position.norm() - radius_);
    }

private:
    double radius_; ///< Reference radius (m)
};

} // namespace dynamics
