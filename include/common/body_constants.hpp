#pragma once

#include <string>

namespace common {

/// @brief Physical constants of a celestial body
///
/// @details Resolved once at configuration time (usually from an ephemeris
///          provider) and injected into the force models, so that no force
///          evaluation reaches for a global constant table.
struct CelestialBodyConstants {
    std::string name;               ///< Body identifier, e.g. "EARTH"
    double gm = 0.0;                ///< Gravitational parameter (m^3/s^2)
    double equatorial_radius = 0.0; ///< Equatorial radius (m)
    double j2 = 0.0;                ///< Second zonal harmonic (dimensionless)
    double rotation_rate = 0.0;     ///< Spin rate about +z (rad/s)

    /// @brief Earth values (EGM2008 GM/J2, WGS84 radius, IERS spin rate)
    static auto earth() -> CelestialBodyConstants {
        return {"EARTH", 3.986004418e14, 6378137.0, 1.08262668e-3, 7.292115e-5};
    }

    /// @throws common::ConfigurationError if gm or radius are not positive and finite
    void validate() const;
};

} // namespace common
