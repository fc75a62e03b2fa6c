#pragma once

#include <iostream>
#include <string>

namespace common {

/// @brief Enum to specify a coordinate frame
enum class CoordinateFrame {
    ECI,  // Earth-Centered Inertial (J2000 / ICRF aligned)
    ECEF  // Earth-Centered Earth-Fixed
};

/// @brief Name of the frame as used in scenario files ("ECI", "ECEF")
auto to_string(CoordinateFrame frame) -> std::string;

/// @brief Parses a frame name. "J2000" is accepted as an alias of ECI.
/// @throws std::invalid_argument on an unknown name
auto frame_from_string(const std::string& name) -> CoordinateFrame;

std::istream& operator>>(std::istream& is, CoordinateFrame& frame);
std::ostream& operator<<(std::ostream& os, const CoordinateFrame& frame);

} // namespace common
