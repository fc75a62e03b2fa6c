#pragma once

#include "dynamics/dynamics.hpp"
#include "dynamics/force_composer.hpp"
#include "common/epoch.hpp"
#include "common/stm.hpp"

#include <Eigen/Dense>

#include <iostream>
#include <memory>

namespace dynamics {

/// @brief Builds the 6x6 system matrix of the variational equations
///
/// @details M = [ 0₃      I₃    ]
///              [ ∂a/∂r   ∂a/∂v ]
auto build_system_matrix(const Eigen::Matrix3d& da_dr, const Eigen::Matrix3d& da_dv) -> common::Matrix6d;

/// @brief Time derivative of a state, optionally augmented with its STM
///
/// @details Mode is selected by the length of the state:
///          - 6:  [ṙ; v̇] = [v; a_total]
///          - 42: additionally Φ̇ = M Φ with Φ unpacked from, and Φ̇ packed into,
///                the trailing 36 entries (column-major, see common::pack_stm)
///
/// @param t Elapsed time since epoch0 (s)
/// @param state State vector of length 6 or 42
/// @param epoch0 Propagation epoch; forces see epoch0 + t
/// @param composer Force model
/// @param diagnostics Optional accumulator for skipped optional terms
/// @return Derivative of the same length as state
/// @throws common::ConfigurationError for any other length; nothing is evaluated
auto derivative(double t, const Eigen::VectorXd& state, const common::Epoch& epoch0,
                const ForceComposer& composer, Diagnostics* diagnostics = nullptr) -> Eigen::VectorXd;

/// @brief Convenience form that validates the configuration and builds the force model per call
///
/// @details Prefer building a ForceComposer once and calling the overload above
///          from an integrator; this form exists for one-off evaluations.
/// @param log Sink for configuration warnings and skipped-term notices
auto derivative(double t, const Eigen::VectorXd& state, const common::Epoch& epoch0,
                const ForceModelConfig& config, const Environment& env,
                Diagnostics* diagnostics = nullptr, std::ostream& log = std::cerr) -> Eigen::VectorXd;

/// @brief IDynamics adapter around derivative() for the integrators
///
/// @details compute_dynamics() accepts 6- and 42-element states.
///          compute_jacobian() returns the 6x6 system matrix at the
///          position/velocity part of the state. Skipped optional terms are
///          accumulated in diagnostics() across all evaluations.
class VariationalDynamics : public IDynamics {
public:
    /// @throws std::invalid_argument if composer is null
    VariationalDynamics(std::shared_ptr<const ForceComposer> composer, const common::Epoch& epoch0);

    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override;

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override;

    auto get_state_dimension() const -> int override { return common::STATE_SIZE; }

    auto epoch0() const -> const common::Epoch& { return epoch0_; }

    auto diagnostics() const -> const Diagnostics& { return *diagnostics_; }

private:
    std::shared_ptr<const ForceComposer> composer_;
    common::Epoch epoch0_;
    std::shared_ptr<Diagnostics> diagnostics_;
};

} // namespace dynamics
