#include <gtest/gtest.h>
#include "dynamics/gravity.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace dynamics;

// Earth gravitational parameter
constexpr double EARTH_MU = 3.986004418e14;  // m³/s²

// ============================================================================
// CENTRAL GRAVITY TESTS
// ============================================================================

class CentralGravityTest : public ::testing::Test {
protected:
    CentralGravity gravity_{EARTH_MU};

    static auto make_context(double x, double y, double z) -> ForceContext {
        ForceContext ctx;
        ctx.t = 0.0;
        ctx.position << x, y, z;
        ctx.velocity = Eigen::Vector3d::Zero();
        return ctx;
    }
};

TEST_F(CentralGravityTest, RadialAcceleration) {
    // At radius r, acceleration magnitude should be μ/r²
    ForceContext ctx = make_context(7e6, 0.0, 0.0);

    Eigen::Vector3d a = gravity_.compute_acceleration(ctx);
    double r = ctx.position.norm();

    EXPECT_NEAR(a.norm(), EARTH_MU / (r * r), 1e-9);
}

TEST_F(CentralGravityTest, DirectionTowardCenter) {
    ForceContext ctx = make_context(1e6, 2e6, 3e6);

    Eigen::Vector3d a_hat = gravity_.compute_acceleration(ctx).normalized();
    Eigen::Vector3d r_hat = ctx.position.normalized();

    // a and r should be anti-parallel
    EXPECT_NEAR((r_hat + a_hat).norm(), 0.0, 1e-12);
}

TEST_F(CentralGravityTest, InverseSquareLaw) {
    Eigen::Vector3d a1 = gravity_.compute_acceleration(make_context(7e6, 0.0, 0.0));
    Eigen::Vector3d a2 = gravity_.compute_acceleration(make_context(14e6, 0.0, 0.0));

    EXPECT_NEAR(a2.norm(), a1.norm() / 4.0, 1e-9);
}

TEST_F(CentralGravityTest, VelocityIndependent) {
    ForceContext ctx1 = make_context(7e6, 1e6, 2e6);
    ForceContext ctx2 = ctx1;
    ctx1.velocity << 100.0, 200.0, 300.0;
    ctx2.velocity << -500.0, 1000.0, -250.0;

    EXPECT_EQ(gravity_.compute_acceleration(ctx1), gravity_.compute_acceleration(ctx2));
}

TEST_F(CentralGravityTest, UsesBodyConstants) {
    common::CelestialBodyConstants body = common::CelestialBodyConstants::earth();
    body.gm = 2.0 * EARTH_MU;
    CentralGravity heavy(body);

    ForceContext ctx = make_context(7e6, 0.0, 0.0);
    EXPECT_NEAR(heavy.compute_acceleration(ctx).norm(), 2.0 * gravity_.compute_acceleration(ctx).norm(), 1e-9);
    EXPECT_EQ(heavy.name(), "central_gravity");
}

TEST_F(CentralGravityTest, RejectsNonPositiveGM) {
    EXPECT_THROW(CentralGravity(0.0), common::ConfigurationError);
    EXPECT_THROW(CentralGravity(-1.0), common::ConfigurationError);
}

TEST_F(CentralGravityTest, DegenerateAtOrigin) {
    // Below one metre the field is undefined
    ForceContext ctx = make_context(0.5, 0.0, 0.0);

    EXPECT_THROW(gravity_.compute_acceleration(ctx), common::DegenerateGeometryError);
    EXPECT_THROW(gravity_.compute_jacobian(ctx), common::DegenerateGeometryError);
    EXPECT_THROW(gravity_.evaluate(ctx, true), common::DegenerateGeometryError);
}

// ============================================================================
// CENTRAL GRAVITY JACOBIAN TESTS
// ============================================================================

// Central-difference ∂a/∂r with step epsilon along each axis
auto numerical_position_jacobian(const IForce& force, const ForceContext& ctx, double epsilon) -> Eigen::Matrix3d {
    Eigen::Matrix3d numerical;
    for (int i = 0; i < 3; ++i) {
        ForceContext ctx_plus = ctx;
        ForceContext ctx_minus = ctx;
        ctx_plus.position(i) += epsilon;
        ctx_minus.position(i) -= epsilon;

        numerical.col(i) = (force.compute_acceleration(ctx_plus)
                            - force.compute_acceleration(ctx_minus)) / (2.0 * epsilon);
    }
    return numerical;
}

TEST_F(CentralGravityTest, JacobianPositionNumerical) {
    const std::vector<Eigen::Vector3d> points = {
        Eigen::Vector3d(7e6, 1e6, 2e6),
        Eigen::Vector3d(-4e6, 5e6, -3e6),
        Eigen::Vector3d(1.2e7, -2.0e7, 9e6),
        Eigen::Vector3d(-3e6, -2e6, -6.5e6),
    };

    for (const auto& point : points) {
        ForceContext ctx = make_context(point.x(), point.y(), point.z());
        ctx.velocity << 100.0, 200.0, 300.0;
        auto [da_dr, da_dv] = gravity_.compute_jacobian(ctx);

        // Truncation error of the central difference is O(ε²)
        double epsilon = 1e-3 * point.norm();
        double error = (numerical_position_jacobian(gravity_, ctx, epsilon) - da_dr).norm() / da_dr.norm();
        double error_half = (numerical_position_jacobian(gravity_, ctx, epsilon / 2.0) - da_dr).norm() / da_dr.norm();

        double scaled_step = epsilon / point.norm();
        EXPECT_LT(error, 10.0 * scaled_step * scaled_step) << "at " << point.transpose();
        EXPECT_NEAR(error / error_half, 4.0, 0.4) << "at " << point.transpose();
    }
}

TEST_F(CentralGravityTest, JacobianVelocityZero) {
    ForceContext ctx = make_context(7e6, 1e6, 2e6);

    auto [da_dr, da_dv] = gravity_.compute_jacobian(ctx);

    EXPECT_DOUBLE_EQ(da_dv.norm(), 0.0);
}

TEST_F(CentralGravityTest, JacobianSymmetric) {
    ForceContext ctx = make_context(7e6, 1e6, 2e6);

    auto [da_dr, da_dv] = gravity_.compute_jacobian(ctx);

    EXPECT_LT((da_dr - da_dr.transpose()).norm(), 1e-20);
}

TEST_F(CentralGravityTest, JacobianStructure) {
    ForceContext ctx = make_context(7e6, 0.0, 0.0);

    auto [da_dr, da_dv] = gravity_.compute_jacobian(ctx);

    // On the x-axis: ∂a/∂r = diag(2μ/r³, -μ/r³, -μ/r³)
    double r = ctx.position(0);
    double mu_r3 = EARTH_MU / (r * r * r);

    EXPECT_NEAR(da_dr(0, 0), 2.0 * mu_r3, 1e-18);
    EXPECT_NEAR(da_dr(1, 1), -mu_r3, 1e-18);
    EXPECT_NEAR(da_dr(2, 2), -mu_r3, 1e-18);
    EXPECT_NEAR(da_dr(0, 1), 0.0, 1e-20);
    EXPECT_NEAR(da_dr(0, 2), 0.0, 1e-20);
    EXPECT_NEAR(da_dr(1, 2), 0.0, 1e-20);
}

TEST_F(CentralGravityTest, JacobianEigenvalues) {
    ForceContext ctx = make_context(7e6, 1e6, 2e6);

    auto [da_dr, da_dv] = gravity_.compute_jacobian(ctx);

    // One radial eigenvalue 2μ/r³, two tangential eigenvalues -μ/r³
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> eigensolver(da_dr);
    Eigen::Vector3d eigenvalues = eigensolver.eigenvalues();

    double r = ctx.position.norm();
    double mu_r3 = EARTH_MU / (r * r * r);

    std::vector<double> eigs = {eigenvalues(0), eigenvalues(1), eigenvalues(2)};
    std::sort(eigs.begin(), eigs.end());

    EXPECT_NEAR(eigs[0], -mu_r3, 1e-15);
    EXPECT_NEAR(eigs[1], -mu_r3, 1e-15);
    EXPECT_NEAR(eigs[2], 2 * mu_r3, 1e-15);
    // Trace-free (Laplace's equation)
    EXPECT_NEAR(da_dr.trace(), 0.0, 1e-18);
}

TEST_F(CentralGravityTest, EvaluateMatchesIndividualCalls) {
    ForceContext ctx = make_context(-4e6, 5e6, 1e6);

    ForceResult with = gravity_.evaluate(ctx, true);
    ForceResult without = gravity_.evaluate(ctx, false);

    ASSERT_TRUE(with.ok());
    ASSERT_TRUE(without.ok());
    EXPECT_EQ(with.contribution().acceleration, gravity_.compute_acceleration(ctx));
    EXPECT_EQ(with.contribution().da_dr, gravity_.compute_jacobian(ctx).first);
    EXPECT_EQ(without.contribution().acceleration, with.contribution().acceleration);
    EXPECT_TRUE(without.contribution().da_dr.isZero(0.0));
}
