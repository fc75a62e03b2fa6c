#pragma once

#include <Eigen/Dense>

namespace dynamics {

/// @brief State-space model ẋ = f(t, x) advanced by the integrators
///
/// @details For orbital motion x = [r, v] ∈ ℝ⁶, optionally followed by the
///          36 column-major entries of the state transition matrix Φ. The
///          Jacobian F = ∂f/∂x of the 6-element state is the system matrix
///          of the variational equations Φ̇ = F Φ.
class IDynamics {
public:
    virtual ~IDynamics() = default;

    /// @brief State derivative ẋ = f(t, x)
    /// @param t Elapsed time since the model's epoch (s)
    /// @param state Plain or STM-augmented state
    /// @return Derivative of the same length as state
    virtual auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd = 0;

    /// @brief System matrix F = ∂f/∂x of the non-augmented state
    virtual auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd = 0;

    /// @brief Dimension n of the non-augmented state
    virtual auto get_state_dimension() const -> int = 0;
};

} // namespace dynamics
