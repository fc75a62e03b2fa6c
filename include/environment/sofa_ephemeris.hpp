#pragma once

#include "environment/ephemeris.hpp"

#include <map>
#include <string>

namespace environment {

/// @class SofaEphemeris
/// @brief Analytic solar-system ephemeris built on the SOFA library
///
/// Heliocentric positions come from SOFA's iauEpv00 (Earth), iauMoon98 (Moon,
/// geocentric) and iauPlan94 (Mercury..Neptune, excluding Earth), and are
/// re-centred on the configured centre body. Accuracy is at the few-arcsecond
/// level for the Sun and Moon, which is adequate for perturbation modelling.
/// Only the inertial (ECI, J2000-aligned) frame is served.
///
/// A built-in table supplies GM, equatorial radius and, where relevant, J2 and
/// spin rate for SUN, MERCURY, VENUS, EARTH, MOON, MARS, JUPITER, SATURN,
/// URANUS and NEPTUNE.
class SofaEphemeris : public IEphemeris {
public:
    /// @param center Body positions are measured from (default "EARTH")
    /// @throws common::MissingEphemerisData if the centre body is unsupported
    explicit SofaEphemeris(std::string center = "EARTH");

    /// @throws common::MissingEphemerisData for unknown bodies, non-inertial frames,
    ///         or epochs outside the validity range of the SOFA models
    auto position_of(const std::string& body, const common::Epoch& epoch,
                     common::CoordinateFrame frame) const -> Eigen::Vector3d override;

    /// @throws common::MissingEphemerisData for unknown bodies or constants
    auto body_constant(const std::string& body, const std::string& constant) const -> double override;

    auto center() const -> std::string override { return center_; }

private:
    /// @brief Sun-centred position of a body in metres
    auto heliocentric_position(const std::string& body, const common::Epoch& epoch) const -> Eigen::Vector3d;

    std::string center_; ///< Centre body name
    std::map<std::string, std::map<std::string, double>> constants_; ///< Per-body constant table
};

} // namespace environment
