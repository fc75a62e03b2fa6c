#pragma once

#include "integrator/integrator.hpp"

#include <Eigen/Dense>

namespace integrator {

/// @brief Classical fourth-order Runge-Kutta integrator (fixed step)
///
/// Evaluates the dynamics four times per step, twice at the midpoint time, so
/// ephemeris-backed forces benefit from environment::CachedEphemeris.
class RK4Integrator : public IIntegrator {
public:
    /// @throws std::runtime_error if the dynamics return a derivative of the wrong size
    auto step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd override;
};

} // namespace integrator
