#pragma once

#include "common/epoch.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <utility>

namespace dynamics {

/// @brief Context information available to all force models
struct ForceContext {
    double t = 0.0;             ///< Elapsed time since the propagation epoch (s)
    common::Epoch epoch;        ///< Absolute evaluation epoch (epoch0 + t)
    Eigen::Vector3d position;   ///< Position vector r relative to the central body (m)
    Eigen::Vector3d velocity;   ///< Velocity vector v (m/s)
};

/// @brief Acceleration produced by one force together with its partial derivatives
struct ForceContribution {
    Eigen::Vector3d acceleration = Eigen::Vector3d::Zero(); ///< a (m/s²)
    Eigen::Matrix3d da_dr = Eigen::Matrix3d::Zero();        ///< ∂a/∂r (1/s²)
    Eigen::Matrix3d da_dv = Eigen::Matrix3d::Zero();        ///< ∂a/∂v (1/s)

    /// @brief Exact zero contribution
    static auto zero() -> ForceContribution { return ForceContribution{}; }

    auto operator+=(const ForceContribution& other) -> ForceContribution& {
        acceleration += other.acceleration;
        da_dr += other.da_dr;
        da_dv += other.da_dv;
        return *this;
    }
};

/// @brief Outcome of one force evaluation: a contribution, or the reason there is none
///
/// Only forces whose failure is recoverable report it through a ForceResult;
/// fatal conditions (missing ephemeris, bad configuration) are thrown. The
/// composer decides what a failure means for the total.
class ForceResult {
public:
    static auto success(ForceContribution contribution) -> ForceResult {
        ForceResult result;
        result.contribution_ = std::move(contribution);
        return result;
    }

    static auto failure(std::string reason) -> ForceResult {
        ForceResult result;
        result.reason_ = std::move(reason);
        return result;
    }

    auto ok() const -> bool { return contribution_.has_value(); }

    /// @pre ok()
    auto contribution() const -> const ForceContribution& { return *contribution_; }

    /// @brief Failure reason, empty on success
    auto reason() const -> const std::string& { return reason_; }

private:
    ForceResult() = default;

    std::optional<ForceContribution> contribution_;
    std::string reason_;
};

/// @brief Interface for forces affecting translational motion
///
/// @details This interface represents any force that produces an acceleration
///          as a function of state and time:
///
///          **a** = f(**r**, **v**, t)
///
///          where:
///          - **a** ∈ ℝ³ is the acceleration vector (m/s²)
///          - **r** ∈ ℝ³ is the position vector (m)
///          - **v** ∈ ℝ³ is the velocity vector (m/s)
///          - t ∈ ℝ is time (s), with the absolute epoch carried alongside for
///            forces that consult an ephemeris (solar pressure, third bodies)
///
///          Implementations must provide both the force acceleration f(r,v,t)
///          and its Jacobian matrices ∂f/∂r and ∂f/∂v; the Jacobians feed the
///          variational equations that propagate the state transition matrix.
///
/// @note Some forces may not depend on all state variables (e.g., gravity is
///       velocity-independent). Unused Jacobians should return zero matrices.
/// @note Forces whose Jacobian is deliberately not modelled also return zero
///       matrices and say so in their documentation.
class IForce {
public:
    /// @brief Virtual destructor
    virtual ~IForce() = default;

    /// @brief Short identifier used in diagnostics ("central_gravity", "j2", ...)
    virtual auto name() const -> std::string = 0;

    /// @brief Computes the force acceleration a = f(r, v, t)
    /// @param ctx Force context containing time, epoch, position, and velocity
    /// @return Acceleration vector (m/s²)
    virtual auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d = 0;

    /// @brief Computes the Jacobian matrices ∂f/∂r and ∂f/∂v
    /// @param ctx Force context containing time, epoch, position, and velocity
    /// @return Pair of Jacobian matrices (∂f/∂r, ∂f/∂v)
    virtual auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> = 0;

    /// @brief Evaluates acceleration and (optionally) Jacobians in one pass
    ///
    /// @details The default implementation calls compute_acceleration() and
    ///          compute_jacobian() and lets exceptions propagate. Forces that can
    ///          fail recoverably override this to return ForceResult::failure().
    ///          Forces that consult collaborators override it to share lookups
    ///          between the acceleration and the Jacobian.
    /// @param ctx Force context
    /// @param with_jacobians When false the Jacobians are left at zero
    virtual auto evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult {
        ForceContribution contribution;
        contribution.acceleration = compute_acceleration(ctx);
        if (with_jacobians) {
            auto [da_dr, da_dv] = compute_jacobian(ctx);
            contribution.da_dr = da_dr;
            contribution.da_dv = da_dv;
        }
        return ForceResult::success(contribution);
    }
};

} // namespace dynamics
