#pragma once

#include <Eigen/Dense>

#include <utility>
#include <vector>

namespace propagator {

/// @brief Samples of elapsed time (s) and state, in propagation order
///
/// States are 6 elements, or 42 when the column-major STM rides along.
using Trajectory = std::vector<std::pair<double, Eigen::VectorXd>>;

/// @brief Fixed-step trajectory generator
class IPropagator {
public:
    virtual ~IPropagator() = default;

    /// @brief Propagates from t0 to tf, forward or backward
    /// @param t0 Elapsed time of initial_state (s)
    /// @param initial_state State at t0
    /// @param tf Final elapsed time (s); the last sample lands on it exactly
    /// @return Samples including t0 and tf
    virtual auto propagate(double t0, const Eigen::VectorXd& initial_state, double tf) const -> Trajectory = 0;

    /// @brief Φ(t0+dt, t0) by central differences over whole propagations
    ///
    /// Independent of the variational equations, so it serves as a check on them.
    virtual auto compute_transition_jacobian(double t0, const Eigen::VectorXd& state, double dt) const -> Eigen::MatrixXd = 0;
};

} // namespace propagator
