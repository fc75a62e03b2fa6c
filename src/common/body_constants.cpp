#include "common/body_constants.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace common {

void CelestialBodyConstants::validate() const {
    if (name.empty()) {
        throw ConfigurationError("Body constants must name their body");
    }
    if (!std::isfinite(gm) || gm <= 0.0) {
        throw ConfigurationError("GM of " + name + " must be positive");
    }
    if (!std::isfinite(equatorial_radius) || equatorial_radius <= 0.0) {
        throw ConfigurationError("Equatorial radius of " + name + " must be positive");
    }
    if (!std::isfinite(j2) || !std::isfinite(rotation_rate)) {
        throw ConfigurationError("J2 and rotation rate of " + name + " must be finite");
    }
}

} // namespace common
