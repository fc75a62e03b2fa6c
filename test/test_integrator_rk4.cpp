#include <gtest/gtest.h>

#include "integrator/rk4.hpp"
#include "dynamics/dynamics.hpp"
#include "common/stm.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace integrator;
using namespace dynamics;

constexpr double MU_EARTH = 3.986004418e14;  // m³/s²

// Mock dynamics: isotropic harmonic oscillator in 3D
// State: [r, v], dr/dt = v, dv/dt = -omega^2 * r
// With 42 elements the column-major STM is propagated alongside
class IsotropicOscillator : public IDynamics {
public:
    explicit IsotropicOscillator(double omega) : omega_(omega) {}

    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        Eigen::VectorXd deriv(state.size());
        deriv.head<3>() = state.segment<3>(3);
        deriv.segment<3>(3) = -omega_ * omega_ * state.head<3>();
        if (state.size() == common::AUGMENTED_STATE_SIZE) {
            common::Matrix6d phi = common::unpack_stm(state.tail<common::STM_SIZE>());
            deriv.tail<common::STM_SIZE>() = common::pack_stm(system_matrix() * phi);
        }
        return deriv;
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return system_matrix();
    }

    auto get_state_dimension() const -> int override {
        return common::STATE_SIZE;
    }

    auto system_matrix() const -> common::Matrix6d {
        common::Matrix6d M = common::Matrix6d::Zero();
        M.block<3,3>(0, 3) = Eigen::Matrix3d::Identity();
        M.block<3,3>(3, 0) = -omega_ * omega_ * Eigen::Matrix3d::Identity();
        return M;
    }

private:
    double omega_;
};

// Mock dynamics: point-mass two-body motion, state-only
class KeplerDynamics : public IDynamics {
public:
    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        Eigen::VectorXd deriv(6);
        Eigen::Vector3d r = state.head<3>();
        deriv.head<3>() = state.segment<3>(3);
        deriv.segment<3>(3) = -MU_EARTH / std::pow(r.norm(), 3) * r;
        return deriv;
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return Eigen::MatrixXd::Zero(6, 6);
    }

    auto get_state_dimension() const -> int override {
        return 6;
    }
};

// Mock dynamics returning a derivative of the wrong size
class TruncatingDynamics : public IDynamics {
public:
    auto compute_dynamics(double t, const Eigen::VectorXd& state) const -> Eigen::VectorXd override {
        return Eigen::VectorXd::Zero(state.size() - 1);
    }

    auto compute_jacobian(double t, const Eigen::VectorXd& state) const -> Eigen::MatrixXd override {
        return Eigen::MatrixXd::Zero(state.size(), state.size());
    }

    auto get_state_dimension() const -> int override {
        return 1;
    }
};

// ============================================================================
// RK4 INTEGRATOR TESTS
// ============================================================================

class RK4IntegratorTest : public ::testing::Test {
protected:
    Eigen::VectorXd oscillatorState() const {
        Eigen::VectorXd state(6);
        state << 1.0, -0.5, 0.25, 0.0, 0.3, -0.2;
        return state;
    }

    auto energy(const Eigen::VectorXd& state) const -> double {
        return 0.5 * state.segment<3>(3).squaredNorm() - MU_EARTH / state.head<3>().norm();
    }

    RK4Integrator integrator;
};

TEST_F(RK4IntegratorTest, OscillatorSingleStep) {
    IsotropicOscillator dyn(1.0);
    Eigen::VectorXd state = oscillatorState();
    double dt = 0.1;

    Eigen::VectorXd next = integrator.step(0.0, state, dt, dyn);

    // r(t) = r0 cos t + v0 sin t
    Eigen::Vector3d expected = state.head<3>() * std::cos(dt) + state.segment<3>(3) * std::sin(dt);
    EXPECT_TRUE(next.head<3>().isApprox(expected, 1e-6));
}

TEST_F(RK4IntegratorTest, StmMatchesAnalyticSolution) {
    const double omega = 2.0;
    IsotropicOscillator dyn(omega);
    Eigen::VectorXd state = common::augment_with_identity(oscillatorState());

    double t = 0.0;
    const double dt = 0.01;
    for (int i = 0; i < 100; ++i) {
        state = integrator.step(t, state, dt, dyn);
        t += dt;
    }

    // Φ = [cos(ωt) I, sin(ωt)/ω I; -ω sin(ωt) I, cos(ωt) I]
    common::Matrix6d expected = common::Matrix6d::Zero();
    expected.block<3,3>(0, 0) = std::cos(omega * t) * Eigen::Matrix3d::Identity();
    expected.block<3,3>(0, 3) = std::sin(omega * t) / omega * Eigen::Matrix3d::Identity();
    expected.block<3,3>(3, 0) = -omega * std::sin(omega * t) * Eigen::Matrix3d::Identity();
    expected.block<3,3>(3, 3) = std::cos(omega * t) * Eigen::Matrix3d::Identity();

    common::Matrix6d phi = common::stm_of(state);
    EXPECT_LT((phi - expected).cwiseAbs().maxCoeff(), 1e-8);
}

TEST_F(RK4IntegratorTest, AugmentedStateSizePreserved) {
    IsotropicOscillator dyn(1.0);
    Eigen::VectorXd state = common::augment_with_identity(oscillatorState());

    Eigen::VectorXd next = integrator.step(0.0, state, 0.5, dyn);

    EXPECT_EQ(next.size(), common::AUGMENTED_STATE_SIZE);
}

TEST_F(RK4IntegratorTest, ZeroTimeStep) {
    IsotropicOscillator dyn(1.0);
    Eigen::VectorXd state = oscillatorState();

    Eigen::VectorXd next = integrator.step(3.0, state, 0.0, dyn);

    EXPECT_TRUE(next.isApprox(state, 0.0));
}

TEST_F(RK4IntegratorTest, BackwardStepUndoesForwardStep) {
    IsotropicOscillator dyn(1.0);
    Eigen::VectorXd state = oscillatorState();

    Eigen::VectorXd forward = integrator.step(0.0, state, 0.05, dyn);
    Eigen::VectorXd back = integrator.step(0.05, forward, -0.05, dyn);

    EXPECT_TRUE(back.isApprox(state, 1e-7));
}

TEST_F(RK4IntegratorTest, FourthOrderConvergence) {
    IsotropicOscillator dyn(1.0);
    Eigen::VectorXd state = oscillatorState();
    const double T = 2.0;
    Eigen::Vector3d exact = state.head<3>() * std::cos(T) + state.segment<3>(3) * std::sin(T);

    std::vector<double> errors;
    for (int steps : {20, 40, 80}) {
        double dt = T / steps;
        Eigen::VectorXd current = state;
        for (int k = 0; k < steps; ++k) {
            current = integrator.step(k * dt, current, dt, dyn);
        }
        errors.push_back((current.head<3>() - exact).norm());
    }

    // Halving the step cuts the error by about 2^4
    EXPECT_NEAR(errors[0] / errors[1], 16.0, 2.0);
    EXPECT_NEAR(errors[1] / errors[2], 16.0, 2.0);
}

TEST_F(RK4IntegratorTest, CircularOrbitEnergyConserved) {
    KeplerDynamics dyn;
    const double r = 7000e3;
    const double v = std::sqrt(MU_EARTH / r);
    Eigen::VectorXd state(6);
    state << r, 0.0, 0.0, 0.0, v, 0.0;

    const double period = 2.0 * M_PI * std::sqrt(r * r * r / MU_EARTH);
    const int steps = 600;
    const double dt = period / steps;

    double initial_energy = energy(state);
    Eigen::VectorXd current = state;
    for (int k = 0; k < steps; ++k) {
        current = integrator.step(k * dt, current, dt, dyn);
    }

    EXPECT_NEAR(energy(current), initial_energy, 1e-6 * std::abs(initial_energy));
    EXPECT_NEAR(current.head<3>().norm(), r, 1.0);
    EXPECT_LT((current.head<3>() - state.head<3>()).norm(), 100.0);
}

// A derivative/state size mismatch is reported instead of read out of bounds
TEST_F(RK4IntegratorTest, DerivativeSizeMismatchThrows) {
    TruncatingDynamics dyn;
    Eigen::VectorXd state(3);
    state << 1.0, 2.0, 3.0;

    EXPECT_THROW(integrator.step(0.0, state, 0.1, dyn), std::runtime_error);
}
