#pragma once

#include "propagator/propagator.hpp"
#include "dynamics/dynamics.hpp"
#include "integrator/integrator.hpp"

#include <Eigen/Dense>

#include <memory>

namespace propagator {

/// @brief Fixed-step propagation of a dynamics model with a chosen integrator
class NumericalPropagator : public IPropagator {
public:
    /// @brief Constructor
    /// @param dynamics Dynamics model to use for propagation
    /// @param integrator Integrator to use for propagation
    /// @param timestep Timestep to use for propagation
    /// @throws std::invalid_argument for null collaborators or a non-positive timestep
    NumericalPropagator(
        std::shared_ptr<const dynamics::IDynamics> dynamics,
        std::shared_ptr<const integrator::IIntegrator> integrator,
        double timestep
    );

    /// @brief propagate state to specific time
    ///
    /// @details Steps forward or backward depending on the sign of tf - t0;
    ///          the final step is shortened to land exactly on tf. Works for
    ///          plain and STM-augmented states alike.
    ///
    /// @param t0 initial time
    /// @param initial_state initial state of the system before propagation
    /// @param tf time to propagate to
    ///
    /// @return propagated states
    auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Trajectory override;

    /// @brief Propagates a 6-element state together with its STM
    ///
    /// @details The state is augmented with an identity STM at t0, so each
    ///          returned sample holds Φ(t, t0) in its trailing 36 entries.
    /// @throws common::ConfigurationError if initial_state is not 6 elements
    auto propagate_with_stm(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Trajectory;

    /// @brief Compute state transition Jacobian using numerical differentiation
    /// @param t0 Initial time
    /// @param state Initial state
    /// @param dt Time step
    /// @return State transition matrix Φ(t0+dt, t0)
    auto compute_transition_jacobian(double t0, const Eigen::VectorXd& state, double dt) const -> Eigen::MatrixXd override;

    auto timestep() const -> double { return timestep_; }

private:
    /// @brief underlying system dynamics
    std::shared_ptr<const dynamics::IDynamics> dynamics_;
    /// @brief underlying integrator to use for propagation
    std::shared_ptr<const integrator::IIntegrator> integrator_;
    /// @brief timestep to use for propagation
    double timestep_;
};

} // namespace propagator
