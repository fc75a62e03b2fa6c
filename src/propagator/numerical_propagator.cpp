#include "propagator/numerical_propagator.hpp"
#include "common/stm.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace propagator {

NumericalPropagator::NumericalPropagator(
    std::shared_ptr<const dynamics::IDynamics> dynamics,
    std::shared_ptr<const integrator::IIntegrator> integrator,
    double timestep
) : dynamics_(std::move(dynamics)), integrator_(std::move(integrator)), timestep_(timestep)
{
    if (!dynamics_) {
        throw std::invalid_argument("Dynamics cannot be null");
    }
    if (!integrator_) {
        throw std::invalid_argument("Integrator cannot be null");
    }
    if (!(timestep_ > 0.0)) {
        throw std::invalid_argument("timestep must be positive");
    }
}

auto NumericalPropagator::propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Trajectory
{
    Trajectory trajectory;
    double t = t0;
    Eigen::VectorXd state = initial_state;
    trajectory.emplace_back(t, state);

    // Determine direction of propagation
    double direction = (tf >= t0) ? 1.0 : -1.0;

    // Step times are t0 + k*h, so round-off does not accumulate; the last step lands on tf
    auto steps = static_cast<long>(std::ceil(std::abs(tf - t0) / timestep_ - 1e-9));
    for (long k = 1; k <= steps; ++k) {
        double t_next = (k == steps) ? tf : t0 + direction * static_cast<double>(k) * timestep_;
        state = integrator_->step(t, state, t_next - t, *dynamics_);
        t = t_next;
        trajectory.emplace_back(t, state);
    }

    return trajectory;
}

auto NumericalPropagator::propagate_with_stm(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Trajectory
{
    return propagate(t0, common::augment_with_identity(initial_state), tf);
}

auto NumericalPropagator::compute_transition_jacobian(double t0, const Eigen::VectorXd& state, double dt) const -> Eigen::MatrixXd
{
    if (dt <= 0.0) {
        throw std::invalid_argument("Time step must be positive");
    }

    int n = state.size();
    Eigen::MatrixXd Phi = Eigen::MatrixXd::Zero(n, n);

    // Compute each column of Jacobian via central differences
    for (int i = 0; i < n; ++i) {
        // Relative perturbation for large components (positions in m, velocities in m/s),
        // absolute for components near zero
        double state_magnitude = std::abs(state(i));
        double epsilon = (state_magnitude > 1.0) ? state_magnitude * 1e-6 : 1e-3;

        Eigen::VectorXd x_plus = state;
        Eigen::VectorXd x_minus = state;
        x_plus(i) += epsilon;
        x_minus(i) -= epsilon;

        Eigen::VectorXd x_plus_final = propagate(t0, x_plus, t0 + dt).back().second;
        Eigen::VectorXd x_minus_final = propagate(t0, x_minus, t0 + dt).back().second;

        // ∂x_f/∂x_0[i] ≈ (x_plus_final - x_minus_final) / 2ε
        Phi.col(i) = (x_plus_final - x_minus_final) / (2.0 * epsilon);
    }

    return Phi;
}

} // namespace propagator
