#pragma once

#include "dynamics/force.hpp"
#include "environment/ephemeris.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dynamics {

/// @brief A perturbing body and its gravitational parameter
struct PerturbingBody {
    std::string name; ///< Ephemeris identifier, e.g. "MOON"
    double gm;        ///< Gravitational parameter (m^3/s^2)
};

/// @brief Point-mass gravity of bodies other than the central body
///
/// @details For each body with position s relative to the central body and
///          d = s - r:
///
///          a     = μ_b (d/|d|³ - s/|s|³)
///          ∂a/∂r = μ_b (3 d dᵀ/|d|⁵ - I/|d|³)
///
///          The second term of a is the indirect acceleration of the central
///          body itself. Contributions are summed over all bodies.
class ThirdBodyGravity : public IForce {
public:
    /// @throws common::ConfigurationError for a null ephemeris or a non-positive GM
    ThirdBodyGravity(std::shared_ptr<const environment::IEphemeris> ephemeris,
                     std::vector<PerturbingBody> bodies);

    /// @brief Resolves each body's GM from the ephemeris, once
    /// @throws common::MissingEphemerisData if a body's GM is unknown
    static auto from_ephemeris(std::shared_ptr<const environment::IEphemeris> ephemeris,
                               const std::vector<std::string>& body_names) -> ThirdBodyGravity;

    auto name() const -> std::string override { return "third_body"; }

    /// @throws common::MissingEphemerisData if any body position is unavailable
    auto compute_acceleration(const ForceContext& ctx) const -> Eigen::Vector3d override;

    /// @throws common::MissingEphemerisData if any body position is unavailable
    auto compute_jacobian(const ForceContext& ctx) const -> std::pair<Eigen::Matrix3d, Eigen::Matrix3d> override;

    /// @brief One ephemeris lookup per body for both acceleration and Jacobian
    auto evaluate(const ForceContext& ctx, bool with_jacobians) const -> ForceResult override;

    auto bodies() const -> const std::vector<PerturbingBody>& { return bodies_; }

private:
    std::shared_ptr<const environment::IEphemeris> ephemeris_;
    std::vector<PerturbingBody> bodies_;
};

} // namespace dynamics
