#include "environment/static_ephemeris.hpp"
#include "common/errors.hpp"

#include <stdexcept>

namespace environment {

StaticEphemeris::StaticEphemeris(std::string center)
    : center_(std::move(center))
{}

void StaticEphemeris::set_position(const std::string& body, const Eigen::Vector3d& position) {
    trajectories_[body] = [position](const common::Epoch&) { return position; };
}

void StaticEphemeris::set_trajectory(const std::string& body, Trajectory trajectory) {
    if (!trajectory) {
        throw std::invalid_argument("Trajectory for " + body + " cannot be empty");
    }
    trajectories_[body] = std::move(trajectory);
}

void StaticEphemeris::set_constant(const std::string& body, const std::string& constant, double value) {
    constants_[body][constant] = value;
}

auto StaticEphemeris::position_of(const std::string& body, const common::Epoch& epoch,
                                  common::CoordinateFrame frame) const -> Eigen::Vector3d {
    if (frame != common::CoordinateFrame::ECI) {
        throw common::MissingEphemerisData("Static ephemeris only serves the ECI frame, requested " + common::to_string(frame));
    }
    if (body == center_) {
        return Eigen::Vector3d::Zero();
    }
    auto it = trajectories_.find(body);
    if (it == trajectories_.end()) {
        throw common::MissingEphemerisData("No ephemeris for body: " + body);
    }
    return it->second(epoch);
}

auto StaticEphemeris::body_constant(const std::string& body, const std::string& constant) const -> double {
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

CachedEphemeris::CachedEphemeris(std::shared_ptr<const IEphemeris> source)
    : source_(std::move(source))
{
    if (!source_) {
        throw std::invalid_argument("Ephemeris source cannot be null");
    }
}

auto CachedEphemeris::position_of(const std::string& body, const common::Epoch& epoch,
                                  common::CoordinateFrame frame) const -> Eigen::Vector3d {
    auto key = std::make_pair(body, frame);
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.epoch == epoch) {
        return it->second.position;
    }

    Eigen::Vector3d position = source_->position_of(body, epoch, frame);
    ++misses_;
    cache_[key] = Entry{epoch, position};
    return position;
}

auto CachedEphemeris::body_constant(const std::string& body, const std::string& constant) const -> double {
    return source_->body_constant(body, constant);
}

} // namespace environment
