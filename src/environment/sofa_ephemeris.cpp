#include "environment/sofa_ephemeris.hpp"
#include "common/errors.hpp"

#include <sofa.h>

#include <utility>

namespace environment {

namespace {

constexpr double AU = 149597870700.0; // m

/// iauPlan94 planet numbers
auto plan94_index(const std::string& body) -> int {
    if (body == "MERCURY") return 1;
    if (body == "VENUS") return 2;
    if (body == "MARS") return 4;
    if (body == "JUPITER") return 5;
    if (body == "SATURN") return 6;
    if (body == "URANUS") return 7;
    if (body == "NEPTUNE") return 8;
    return 0;
}

auto to_vector(const double pv[2][3]) -> Eigen::Vector3d {
    return Eigen::Vector3d(pv[0][0], pv[0][1], pv[0][2]) * AU;
}

} // namespace

SofaEphemeris::SofaEphemeris(std::string center)
    : center_(std::move(center))
{
    // GM: DE440, radii: IAU 2015, Earth J2: EGM2008, Moon J2: GRGM1200A
    constants_["SUN"] = {{GM, 1.32712440041279e20}, {RADIUS, 6.957e8}};
    constants_["MERCURY"] = {{GM, 2.2031868551e13}, {RADIUS, 2.44053e6}};
    constants_["VENUS"] = {{GM, 3.24858592e14}, {RADIUS, 6.0518e6}};
    constants_["EARTH"] = {{GM, 3.986004418e14}, {RADIUS, 6.378137e6},
                           {J2, 1.08262668e-3}, {ROTATION_RATE, 7.292115e-5}};
    constants_["MOON"] = {{GM, 4.902800118e12}, {RADIUS, 1.7381e6},
                          {J2, 2.0330530e-4}, {ROTATION_RATE, 2.6616995e-6}};
    constants_["MARS"] = {{GM, 4.2828375816e13}, {RADIUS, 3.39619e6},
                          {J2, 1.96045e-3}, {ROTATION_RATE, 7.088218e-5}};
    constants_["JUPITER"] = {{GM, 1.26712764100e17}, {RADIUS, 7.1492e7}};
    constants_["SATURN"] = {{GM, 3.7940584841e16}, {RADIUS, 6.0268e7}};
    constants_["URANUS"] = {{GM, 5.794556400e15}, {RADIUS, 2.5559e7}};
    constants_["NEPTUNE"] = {{GM, 6.836527100e15}, {RADIUS, 2.4764e7}};

    if (constants_.find(center_) == constants_.end()) {
        throw common::MissingEphemerisData("Unsupported ephemeris centre body: " + center_);
    }
}

auto SofaEphemeris::position_of(const std::string& body, const common::Epoch& epoch,
                                common::CoordinateFrame frame) const -> Eigen::Vector3d {
    if (frame != common::CoordinateFrame::ECI) {
        throw common::MissingEphemerisData("SOFA ephemeris only serves the ECI frame, requested " + common::to_string(frame));
    }
    if (body == center_) {
        return Eigen::Vector3d::Zero();
    }
    return heliocentric_position(body, epoch) - heliocentric_position(center_, epoch);
}

auto SofaEphemeris::heliocentric_position(const std::string& body, const common::Epoch& epoch) const -> Eigen::Vector3d {
    auto [date1, date2] = epoch.tdb_julian_date();

    if (body == "SUN") {
        return Eigen::Vector3d::Zero();
    }

    if (body == "EARTH" || body == "MOON") {
        double pvh[2][3], pvb[2][3];
        int status = iauEpv00(date1, date2, pvh, pvb);
        if (status != 0) {
            throw common::MissingEphemerisData("Epoch " + epoch.to_iso_utc() + " is outside the iauEpv00 range (1900-2100)");
        }
        Eigen::Vector3d earth = to_vector(pvh);
        if (body == "EARTH") {
            return earth;
        }
        double pv_moon[2][3];
        iauMoon98(date1, date2, pv_moon);
        return earth + to_vector(pv_moon);
    }

    int np = plan94_index(body);
    if (np == 0) {
        throw common::MissingEphemerisData("No ephemeris for body: " + body);
    }
    double pv[2][3];
    int status = iauPlan94(date1, date2, np, pv);
    if (status != 0) {
        throw common::MissingEphemerisData("iauPlan94 failed for " + body + " with status: " + std::to_string(status));
    }
    return to_vector(pv);
}

auto SofaEphemeris::body_constant(const std::string& body, const std::string& constant) const -> double {
    auto body_it = constants_.find(body);
    if (body_it == constants_.end()) {
        throw common::MissingEphemerisData("No constants for body: " + body);
    }
    auto it = body_it->second.find(constant);
    if (it == body_it->second.end()) {
        throw common::MissingEphemerisData("No " + constant + " for body: " + body);
    }
    return it->second;
}

} // namespace environment
