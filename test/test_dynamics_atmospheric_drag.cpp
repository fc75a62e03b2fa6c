#include <gtest/gtest.h>

#include "dynamics/atmospheric_drag.hpp"
#include "dynamics/atmosphere.hpp"
#include "common/body_constants.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>
#include <memory>
#include <cmath>
#include <vector>

using namespace dynamics;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class AtmosphericDragTest : public ::testing::Test {
protected:
    // Typical satellite parameters
    double mass_;
    double drag_coeff_;
    double ref_area_;
    common::CelestialBodyConstants earth_;
    common::CelestialBodyConstants still_earth_;
    std::shared_ptr<const IAtmosphere> atmosphere_;

    AtmosphericDragTest()
        : mass_(100.0)           // 100 kg satellite
        , drag_coeff_(2.2)       // Typical for satellite
        , ref_area_(1.0)         // 1 m² cross-section
        , earth_(common::CelestialBodyConstants::earth())
        , still_earth_(common::CelestialBodyConstants::earth())
        , atmosphere_(std::make_shared<ExponentialAtmosphere>())
    {
        still_earth_.rotation_rate = 0.0;  // Non-rotating atmosphere
    }

    // Helper to create force context
    ForceContext createContext(const Eigen::Vector3d& pos, const Eigen::Vector3d& vel, double t = 0.0) {
        ForceContext ctx;
        ctx.t = t;
        ctx.position = pos;
        ctx.velocity = vel;
        return ctx;
    }

    AtmosphericDrag stillDrag(double mass, double cd, double area) {
        return AtmosphericDrag(still_earth_, atmosphere_, area, mass, cd);
    }

    // Central-difference Jacobians of the acceleration
    std::pair<Eigen::Matrix3d, Eigen::Matrix3d> numericalJacobian(const AtmosphericDrag& drag, const ForceContext& ctx) {
        Eigen::Matrix3d da_dr, da_dv;
        for (int i = 0; i < 3; ++i) {
            ForceContext plus = ctx, minus = ctx;
            plus.position(i) += 1.0;
            minus.position(i) -= 1.0;
            da_dr.col(i) = (drag.compute_acceleration(plus) - drag.compute_acceleration(minus)) / 2.0;

            plus = ctx;
            minus = ctx;
            plus.velocity(i) += 1e-3;
            minus.velocity(i) -= 1e-3;
            da_dv.col(i) = (drag.compute_acceleration(plus) - drag.compute_acceleration(minus)) / 2e-3;
        }
        return {da_dr, da_dv};
    }

    const Eigen::Vector3d pos_150km_{6.528137e6, 0.0, 0.0};
};

// ============================================================================
// BASIC FUNCTIONALITY TESTS
// ============================================================================

TEST_F(AtmosphericDragTest, ConstructorValidation) {
    EXPECT_THROW(AtmosphericDrag(earth_, nullptr, ref_area_, mass_), common::ConfigurationError);
    EXPECT_THROW(AtmosphericDrag(earth_, atmosphere_, 0.0, mass_), common::ConfigurationError);
    EXPECT_THROW(AtmosphericDrag(earth_, atmosphere_, ref_area_, -1.0), common::ConfigurationError);
    EXPECT_THROW(AtmosphericDrag(earth_, atmosphere_, ref_area_, mass_, 0.0), common::ConfigurationError);

    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_, drag_coeff_);
    EXPECT_EQ(drag.name(), "drag");
}

TEST_F(AtmosphericDragTest, AtRestInCorotatingAtmosphere) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);

    // Velocity equal to the atmosphere's own motion means no drag
    Eigen::Vector3d omega(0.0, 0.0, earth_.rotation_rate);
    ForceContext ctx = createContext(pos_150km_, omega.cross(pos_150km_));

    EXPECT_TRUE(drag.relative_velocity(ctx).isZero(1e-12));
    EXPECT_TRUE(drag.compute_acceleration(ctx).isZero(0.0));

    auto [da_dr, da_dv] = drag.compute_jacobian(ctx);
    EXPECT_TRUE(da_dr.isZero(0.0));
    EXPECT_TRUE(da_dv.isZero(0.0));
}

TEST_F(AtmosphericDragTest, DragOpposesRelativeVelocity) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);

    std::vector<Eigen::Vector3d> velocities = {
        Eigen::Vector3d(7500.0, 0.0, 0.0),
        Eigen::Vector3d(0.0, 7500.0, 0.0),
        Eigen::Vector3d(0.0, 0.0, 7500.0),
        Eigen::Vector3d(5000.0, 5000.0, 0.0),
        Eigen::Vector3d(1000.0, 2000.0, 3000.0)
    };

    for (const auto& vel : velocities) {
        ForceContext ctx = createContext(pos_150km_, vel);
        Eigen::Vector3d accel = drag.compute_acceleration(ctx);
        Eigen::Vector3d v_rel = drag.relative_velocity(ctx);

        EXPECT_LT(v_rel.normalized().dot(accel.normalized()), -1.0 + 1e-12);
    }
}

TEST_F(AtmosphericDragTest, RelativeVelocitySubtractsCorotation) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);
    ForceContext ctx = createContext(pos_150km_, Eigen::Vector3d(0.0, 7800.0, 0.0));

    // ω×r at (x, 0, 0) is (0, ωx, 0)
    Eigen::Vector3d v_rel = drag.relative_velocity(ctx);
    EXPECT_NEAR(v_rel(1), 7800.0 - earth_.rotation_rate * pos_150km_(0), 1e-9);
    EXPECT_NEAR(v_rel(0), 0.0, 1e-12);
    EXPECT_NEAR(v_rel(2), 0.0, 1e-12);
}

TEST_F(AtmosphericDragTest, MatchesClosedForm) {
    AtmosphericDrag drag = stillDrag(mass_, drag_coeff_, ref_area_);
    ForceContext ctx = createContext(pos_150km_, Eigen::Vector3d(0.0, 7800.0, 0.0));

    double rho = atmosphere_->density(pos_150km_, ctx.epoch);
    double expected = 0.5 * rho * drag_coeff_ * ref_area_ / mass_ * 7800.0 * 7800.0;

    Eigen::Vector3d accel = drag.compute_acceleration(ctx);
    EXPECT_NEAR(accel(1), -expected, 1e-12 * expected);
}

TEST_F(AtmosphericDragTest, DragScalesWithVelocitySquared) {
    AtmosphericDrag drag = stillDrag(mass_, drag_coeff_, ref_area_);

    Eigen::Vector3d accel1 = drag.compute_acceleration(createContext(pos_150km_, Eigen::Vector3d(0.0, 7500.0, 0.0)));
    Eigen::Vector3d accel2 = drag.compute_acceleration(createContext(pos_150km_, Eigen::Vector3d(0.0, 15000.0, 0.0)));

    EXPECT_NEAR(accel2.norm() / accel1.norm(), 4.0, 1e-9);
}

TEST_F(AtmosphericDragTest, DragDecreasesWithAltitude) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);
    Eigen::Vector3d vel(0.0, 7800.0, 0.0);

    double a_100 = drag.compute_acceleration(createContext(Eigen::Vector3d(6.478137e6, 0.0, 0.0), vel)).norm();
    double a_150 = drag.compute_acceleration(createContext(pos_150km_, vel)).norm();
    double a_200 = drag.compute_acceleration(createContext(Eigen::Vector3d(6.578137e6, 0.0, 0.0), vel)).norm();

    EXPECT_GT(a_100, a_150);
    EXPECT_GT(a_150, a_200);
}

TEST_F(AtmosphericDragTest, BallisticCoefficientScaling) {
    ForceContext ctx = createContext(pos_150km_, Eigen::Vector3d(0.0, 7800.0, 0.0));
    double base = stillDrag(mass_, drag_coeff_, ref_area_).compute_acceleration(ctx).norm();

    EXPECT_NEAR(stillDrag(2.0 * mass_, drag_coeff_, ref_area_).compute_acceleration(ctx).norm() / base, 0.5, 1e-12);
    EXPECT_NEAR(stillDrag(mass_, drag_coeff_, 2.0 * ref_area_).compute_acceleration(ctx).norm() / base, 2.0, 1e-12);
    EXPECT_NEAR(stillDrag(mass_, 2.0 * drag_coeff_, ref_area_).compute_acceleration(ctx).norm() / base, 2.0, 1e-12);
}

TEST_F(AtmosphericDragTest, TimeIndependent) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);
    Eigen::Vector3d vel(0.0, 7800.0, 0.0);

    Eigen::Vector3d a0 = drag.compute_acceleration(createContext(pos_150km_, vel, 0.0));
    Eigen::Vector3d a1 = drag.compute_acceleration(createContext(pos_150km_, vel, 1000.0));

    EXPECT_EQ(a0, a1);
}

// ============================================================================
// JACOBIAN TESTS
// ============================================================================

TEST_F(AtmosphericDragTest, JacobianNumericalValidation) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_, drag_coeff_);
    ForceContext ctx = createContext(
        Eigen::Vector3d(4.5e6, 3.2e6, 3.3e6).normalized() * pos_150km_.norm(),
        Eigen::Vector3d(-3000.0, 6000.0, 3500.0)
    );

    auto [da_dr, da_dv] = drag.compute_jacobian(ctx);
    auto [da_dr_num, da_dv_num] = numericalJacobian(drag, ctx);

    double err_r = (da_dr - da_dr_num).norm() / da_dr.norm();
    double err_v = (da_dv - da_dv_num).norm() / da_dv.norm();
    EXPECT_LT(err_r, 1e-5) << "Position Jacobian relative error: " << err_r;
    EXPECT_LT(err_v, 1e-6) << "Velocity Jacobian relative error: " << err_v;
}

TEST_F(AtmosphericDragTest, VelocityJacobianSymmetric) {
    AtmosphericDrag drag(earth_, atmosphere_, ref_area_, mass_);
    ForceContext ctx = createContext(pos_150km_, Eigen::Vector3d(1000.0, 7000.0, 2000.0));

    auto [da_dr, da_dv] = drag.compute_jacobian(ctx);

    EXPECT_LT((da_dv - da_dv.transpose()).norm(), 1e-12 * da_dv.norm());
    // Drag removes energy: ∂a/∂v is negative definite
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(da_dv);
    EXPECT_LT(solver.eigenvalues().maxCoeff(), 0.0);
}

TEST_F(AtmosphericDragTest, PositionJacobianIncludesCorotation) {
    // With a uniform density only the co-rotation term remains in ∂a/∂r
    auto uniform = std::make_shared<ExponentialAtmosphere>(earth_.equatorial_radius, 1e-9, 1e30);
    AtmosphericDrag drag(earth_, uniform, ref_area_, mass_);
    ForceContext ctx = createContext(pos_150km_, Eigen::Vector3d(0.0, 7800.0, 0.0));

    auto [da_dr, da_dv] = drag.compute_jacobian(ctx);
    Eigen::Matrix3d omega_cross;
    omega_cross << 0.0, -earth_.rotation_rate, 0.0,
                   earth_.rotation_rate, 0.0, 0.0,
                   0.0, 0.0, 0.0;

    EXPECT_LT((da_dr + da_dv * omega_cross).norm(), 1e-6 * (da_dv * omega_cross).norm());
}

// ============================================================================
// PHYSICAL VALIDATION TESTS
// ============================================================================

TEST_F(AtmosphericDragTest, RealisticDragMagnitude) {
    // US76 density at 400 km
    AtmosphericDrag drag(earth_, std::make_shared<US76Atmosphere>(), ref_area_, mass_, drag_coeff_);
    ForceContext ctx = createContext(Eigen::Vector3d(6.778137e6, 0.0, 0.0), Eigen::Vector3d(0.0, 7670.0, 0.0));

    Eigen::Vector3d accel = drag.compute_acceleration(ctx);

    EXPECT_GT(accel.norm(), 1e-9);
    EXPECT_LT(accel.norm(), 1e-3);
}
