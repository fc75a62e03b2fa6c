#pragma once

#include "common/errors.hpp"

#include <cmath>

namespace dynamics {

/// @brief Solar radiation pressure as a function of distance from the Sun
class ISolarPressure {
public:
    virtual ~ISolarPressure() = default;

    /// @brief Pressure at distance d from the Sun (N/m²)
    virtual auto pressure(double distance) const -> double = 0;

    /// @brief dP/dd (N/m³), needed for the SRP position Jacobian
    virtual auto pressure_derivative(double distance) const -> double = 0;
};

/// @brief Inverse-square solar pressure: P(d) = P₀ (d₀ / d)²
class InverseSquareSolarPressure : public ISolarPressure {
public:
    /// @param reference_pressure P₀ at the reference distance (N/m²), default 4.56e-6 at 1 AU
    /// @param reference_distance d₀ (m), default 1 AU
    /// @throws common::ConfigurationError unless P₀ and d₀ are positive and finite
    explicit InverseSquareSolarPressure(double reference_pressure = 4.56e-6,
                                        double reference_distance = 149597870700.0)
        : p0_(reference_pressure), d0_(reference_distance)
    {
        if (!(p0_ > 0.0) || !std::isfinite(p0_)) {
            throw common::ConfigurationError("Reference solar pressure must be positive and finite");
        }
        if (!(d0_ > 0.0) || !std::isfinite(d0_)) {
            throw common::ConfigurationError("Reference distance must be positive and finite");
        }
    }

    auto pressure(double distance) const -> double override {
        double ratio = d0_ / distance;
        return p0_ * ratio * ratio;
    }

    auto pressure_derivative(double distance) const -> double override {
        return -2.0 * pressure(distance) / distance;
    }

private:
    double p0_; ///< Reference pressure (N/m²)
    double d0_; ///< Reference distance (m)
};

} // namespace dynamics
