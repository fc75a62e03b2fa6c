#pragma once

#include <string>
#include <utility>

namespace common {

/// @brief Absolute time reference used to query ephemeris collaborators
///
/// @details Stored as TDB seconds past J2000.0 (JD 2451545.0 TDB), the same
///          convention as SPICE ephemeris time. An Epoch is immutable; an
///          evaluation epoch is formed as `epoch0 + elapsed_seconds`.
///
///          Conversions from/to UTC calendar representations go through SOFA
///          (UTC -> TAI -> TT -> TDB).
class Epoch {
public:
    /// @brief J2000.0 itself
    Epoch() = default;

    /// @brief Builds an epoch from TDB seconds past J2000.0
    static auto from_tdb_seconds(double seconds_past_j2000) -> Epoch;

    /// @brief Builds an epoch from a UTC calendar date and time of day
    /// @throws common::ConfigurationError if SOFA rejects the date
    static auto from_utc(int year, int month, int day, int hour, int minute, double second) -> Epoch;

    /// @brief Parses "YYYY-MM-DDTHH:MM:SS[.fff]" (a space or 'T' separator, optional trailing 'Z')
    /// @throws common::ConfigurationError on malformed input
    static auto from_iso_utc(const std::string& text) -> Epoch;

    /// @brief TDB seconds past J2000.0
    auto tdb_seconds() const -> double { return seconds_; }

    /// @brief Two-part TDB Julian date (J2000 day number, fraction) suitable for SOFA calls
    auto tdb_julian_date() const -> std::pair<double, double>;

    /// @brief Formats the epoch as an ISO-8601 UTC string with millisecond precision
    auto to_iso_utc() const -> std::string;

    /// @brief Epoch offset by elapsed seconds
    auto operator+(double elapsed_seconds) const -> Epoch;

    /// @brief Elapsed seconds between two epochs
    auto operator-(const Epoch& other) const -> double;

    auto operator==(const Epoch& other) const -> bool { return seconds_ == other.seconds_; }
    auto operator!=(const Epoch& other) const -> bool { return seconds_ != other.seconds_; }

private:
    explicit Epoch(double seconds) : seconds_(seconds) {}

    double seconds_ = 0.0; ///< TDB seconds past J2000.0
};

} // namespace common
