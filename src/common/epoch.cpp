#include "common/epoch.hpp"
#include "common/errors.hpp"

#include <sofa.h>

#include <cmath>
#include <cstdio>

namespace common {

namespace {
constexpr double J2000_JD = 2451545.0;
constexpr double SECONDS_PER_DAY = 86400.0;
} // namespace

auto Epoch::from_tdb_seconds(double seconds_past_j2000) -> Epoch {
    if (!std::isfinite(seconds_past_j2000)) {
        throw ConfigurationError("Epoch seconds must be finite");
    }
    return Epoch(seconds_past_j2000);
}

auto Epoch::from_utc(int year, int month, int day, int hour, int minute, double second) -> Epoch {
    double utc1, utc2;
    int status = iauDtf2d("UTC", year, month, day, hour, minute, second, &utc1, &utc2);
    if (status < 0) {
        throw ConfigurationError("Invalid UTC calendar date (SOFA status " + std::to_string(status) + ")");
    }

    double tai1, tai2;
    status = iauUtctai(utc1, utc2, &tai1, &tai2);
    if (status < 0) {
        throw ConfigurationError("UTC to TAI conversion failed with status: " + std::to_string(status));
    }

    double tt1, tt2;
    iauTaitt(tai1, tai2, &tt1, &tt2);

    // TDB-TT periodic term, geocentric observer
    double ut_fraction = std::fmod(utc1 - 0.5, 1.0) + utc2;
    ut_fraction -= std::floor(ut_fraction);
    double dtr = iauDtdb(tt1, tt2, ut_fraction, 0.0, 0.0, 0.0);

    double days = (tt1 - J2000_JD) + tt2;
    return Epoch(days * SECONDS_PER_DAY + dtr);
}

auto Epoch::from_iso_utc(const std::string& text) -> Epoch {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    char date_sep = 0;

    std::string s = text;
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }

    int fields = std::sscanf(s.c_str(), "%d-%d-%d%c%d:%d:%lf",
                             &year, &month, &day, &date_sep, &hour, &minute, &second);
    if (fields == 3) {
        return from_utc(year, month, day, 0, 0, 0.0);
    }
    if (fields != 7 || (date_sep != 'T' && date_sep != ' ')) {
        throw ConfigurationError("Malformed ISO-8601 UTC epoch: '" + text + "'");
    }
    return from_utc(year, month, day, hour, minute, second);
}

auto Epoch::tdb_julian_date() const -> std::pair<double, double> {
    return {J2000_JD, seconds_ / SECONDS_PER_DAY};
}

auto Epoch::to_iso_utc() const -> std::string {
    auto [tdb1, tdb2] = tdb_julian_date();

    // Invert the TDB-TT term using TT as its argument (sub-microsecond difference)
    double dtr = iauDtdb(tdb1, tdb2, 0.0, 0.0, 0.0, 0.0);

    double tt1, tt2, tai1, tai2, utc1, utc2;
    iauTdbtt(tdb1, tdb2, dtr, &tt1, &tt2);
    iauTttai(tt1, tt2, &tai1, &tai2);
    int status = iauTaiutc(tai1, tai2, &utc1, &utc2);
    if (status < 0) {
        throw ConfigurationError("TAI to UTC conversion failed with status: " + std::to_string(status));
    }

    int iy, im, id, ihmsf[4];
    status = iauD2dtf("UTC", 3, utc1, utc2, &iy, &im, &id, ihmsf);
    if (status < 0) {
        throw ConfigurationError("UTC formatting failed with status: " + std::to_string(status));
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                  iy, im, id, ihmsf[0], ihmsf[1], ihmsf[2], ihmsf[3]);
    return std::string(buffer);
}

auto Epoch::operator+(double elapsed_seconds) const -> Epoch {
    return Epoch(seconds_ + elapsed_seconds);
}

auto Epoch::operator-(const Epoch& other) const -> double {
    return seconds_ - other.seconds_;
}

} // namespace common
