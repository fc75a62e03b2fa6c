#pragma once

#include "common/body_constants.hpp"
#include "common/coordinate_frame.hpp"
#include "common/epoch.hpp"

#include <Eigen/Dense>

#include <string>

namespace environment {

/// Constant names understood by IEphemeris::body_constant
constexpr const char* GM = "GM";                        ///< m^3/s^2
constexpr const char* RADIUS = "RADIUS";                ///< equatorial radius, m
constexpr const char* J2 = "J2";                        ///< dimensionless
constexpr const char* ROTATION_RATE = "ROTATION_RATE";  ///< rad/s

/// @brief Source of celestial body positions and physical constants
///
/// @details Positions are returned relative to the provider's centre body
///          (normally the central body of the propagation) in the requested
///          frame. Lookups that cannot be satisfied throw
///          common::MissingEphemerisData; implementations never return a
///          placeholder position.
class IEphemeris {
public:
    virtual ~IEphemeris() = default;

    /// @brief Position of a body relative to the centre body
    /// @param body Body identifier (upper case, e.g. "SUN", "MOON")
    /// @param epoch Evaluation epoch
    /// @param frame Frame of the returned vector
    /// @return Position (m)
    virtual auto position_of(const std::string& body, const common::Epoch& epoch,
                             common::CoordinateFrame frame) const -> Eigen::Vector3d = 0;

    /// @brief Physical constant of a body (see the constant names above)
    virtual auto body_constant(const std::string& body, const std::string& constant) const -> double = 0;

    /// @brief Name of the body positions are measured from
    virtual auto center() const -> std::string = 0;
};

/// @brief Resolves every constant a central body needs, once, into a value object
/// @details J2 and rotation rate default to zero when the provider does not know them.
/// @throws common::MissingEphemerisData if GM or radius are unknown
auto resolve_body_constants(const IEphemeris& ephemeris, const std::string& body) -> common::CelestialBodyConstants;

} // namespace environment
