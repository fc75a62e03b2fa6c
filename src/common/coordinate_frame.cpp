#include "common/coordinate_frame.hpp"

#include <stdexcept>

namespace common {

auto to_string(CoordinateFrame frame) -> std::string {
    switch (frame) {
        case CoordinateFrame::ECI: return "ECI";
        case CoordinateFrame::ECEF: return "ECEF";
    }
    return "UNKNOWN";
}

auto frame_from_string(const std::string& name) -> CoordinateFrame {
    if (name == "ECI" || name == "eci" || name == "J2000" || name == "j2000") {
        return CoordinateFrame::ECI;
    }
    if (name == "ECEF" || name == "ecef") {
        return CoordinateFrame::ECEF;
    }
    throw std::invalid_argument("Invalid coordinate frame: " + name);
}

std::istream& operator>>(std::istream& is, CoordinateFrame& frame) {
    std::string s;
    is >> s;
    frame = frame_from_string(s);
    return is;
}

std::ostream& operator<<(std::ostream& os, const CoordinateFrame& frame) {
    os << to_string(frame);
    return os;
}

} // namespace common
