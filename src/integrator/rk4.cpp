#include "integrator/rk4.hpp"

#include <stdexcept>
#include <string>

namespace integrator {

namespace {
auto checked(const Eigen::VectorXd& derivative, const Eigen::VectorXd& state) -> const Eigen::VectorXd& {
    if (derivative.size() != state.size()) {
        throw std::runtime_error("Dynamics returned a derivative of size " + std::to_string(derivative.size()) +
                                 " for a state of size " + std::to_string(state.size()));
    }
    return derivative;
}
} // namespace

auto RK4Integrator::step(double t, const Eigen::VectorXd& state, double dt, const dynamics::IDynamics& dyn) const -> Eigen::VectorXd {
    Eigen::VectorXd k1 = checked(dyn.compute_dynamics(t, state), state);
    Eigen::VectorXd k2 = checked(dyn.compute_dynamics(t + dt / 2.0, state + (dt / 2.0) * k1), state);
    Eigen::VectorXd k3 = checked(dyn.compute_dynamics(t + dt / 2.0, state + (dt / 2.0) * k2), state);
    Eigen::VectorXd k4 = checked(dyn.compute_dynamics(t + dt, state + dt * k3), state);
    return state + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

} // namespace integrator
