#include "environment/ephemeris.hpp"
#include "common/errors.hpp"

namespace environment {

namespace {
auto optional_constant(const IEphemeris& ephemeris, const std::string& body, const std::string& name) -> double {
    try {
        return ephemeris.body_constant(body, name);
    } catch (const common::MissingEphemerisData&) {
        return 0.0;  // body has no such coefficient (e.g. J2 of the Sun)
    }
}
} // namespace

auto resolve_body_constants(const IEphemeris& ephemeris, const std::string& body) -> common::CelestialBodyConstants {
    common::CelestialBodyConstants constants;
    constants.name = body;
    constants.gm = ephemeris.body_constant(body, GM);
    constants.equatorial_radius = ephemeris.body_constant(body, RADIUS);
    constants.j2 = optional_constant(ephemeris, body, J2);
    constants.rotation_rate = optional_constant(ephemeris, body, ROTATION_RATE);
    constants.validate();
    return constants;
}

} // namespace environment
