#include "dynamics/variational_dynamics.hpp"
#include "common/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace dynamics {

namespace {
auto make_context(double t, const Eigen::VectorXd& state, const common::Epoch& epoch0) -> ForceContext {
    ForceContext ctx;
    ctx.t = t;
    ctx.epoch = epoch0 + t;
    ctx.position = state.head<3>();
    ctx.velocity = state.segment<3>(3);
    return ctx;
}
} // namespace

auto build_system_matrix(const Eigen::Matrix3d& da_dr, const Eigen::Matrix3d& da_dv) -> common::Matrix6d {
    // F = [ ∂ṙ/∂r   ∂ṙ/∂v ]
    //     [ ∂v̇/∂r   ∂v̇/∂v ]
    common::Matrix6d M = common::Matrix6d::Zero();
    M.block<3,3>(0, 3) = Eigen::Matrix3d::Identity();
    M.block<3,3>(3, 0) = da_dr;
    M.block<3,3>(3, 3) = da_dv;
    return M;
}

auto derivative(double t, const Eigen::VectorXd& state, const common::Epoch& epoch0,
                const ForceComposer& composer, Diagnostics* diagnostics) -> Eigen::VectorXd
{
    const bool with_stm = state.size() == common::AUGMENTED_STATE_SIZE;
    if (!with_stm && state.size() != common::STATE_SIZE) {
        throw common::ConfigurationError("State vector must have 6 or 42 elements, got " + std::to_string(state.size()));
    }

    ForceContext ctx = make_context(t, state, epoch0);
    CompositeForce forces = composer.evaluate(ctx, with_stm, diagnostics);

    Eigen::VectorXd state_dot(state.size());
    state_dot.head<3>() = ctx.velocity;
    state_dot.segment<3>(3) = forces.total.acceleration;

    if (with_stm) {
        common::Matrix6d phi = common::unpack_stm(state.tail<common::STM_SIZE>());
        common::Matrix6d M = build_system_matrix(forces.total.da_dr, forces.total.da_dv);
        state_dot.tail<common::STM_SIZE>() = common::pack_stm(M * phi);
    }

    return state_dot;
}

auto derivative(double t, const Eigen::VectorXd& state, const common::Epoch& epoch0,
                const ForceModelConfig& config, const Environment& env,
                Diagnostics* diagnostics, std::ostream& log) -> Eigen::VectorXd
{
    // Shape is checked before anything is built or validated
    if (state.size() != common::STATE_SIZE && state.size() != common::AUGMENTED_STATE_SIZE) {
        throw common::ConfigurationError("State vector must have 6 or 42 elements, got " + std::to_string(state.size()));
    }
    auto composer = ForceComposer::from_config(config, env, log);
    return derivative(t, state, epoch0, *composer, diagnostics);
}

VariationalDynamics::VariationalDynamics(std::shared_ptr<const ForceComposer> composer, const common::Epoch& epoch0)
    : composer_(std::move(composer))
    , epoch0_(epoch0)
    , diagnostics_(std::make_shared<Diagnostics>())
{
    if (!composer_) {
        throw std::invalid_argument("Force composer cannot be null");
    }
}

auto VariationalDynamics::compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd {
    return derivative(t, state, epoch0_, *composer_, diagnostics_.get());
}

auto VariationalDynamics::compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd {
    if (state.size() != common::STATE_SIZE && state.size() != common::AUGMENTED_STATE_SIZE) {
        throw common::ConfigurationError("State vector must have 6 or 42 elements, got " + std::to_string(state.size()));
    }
    ForceContext ctx = make_context(t, state, epoch0_);
    CompositeForce forces = composer_->evaluate(ctx, true, diagnostics_.get());
    return build_system_matrix(forces.total.da_dr, forces.total.da_dv);
}

} // namespace dynamics
