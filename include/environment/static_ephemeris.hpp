#pragma once

#include "environment/ephemeris.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <map>
#include <string>
#include <utility>

namespace environment {

/// @class StaticEphemeris
/// @brief Table-driven ephemeris with user-supplied positions and constants
///
/// Bodies are either fixed in the centre-body frame or follow a user-supplied
/// trajectory function of epoch. Only the ECI frame is served.
class StaticEphemeris : public IEphemeris {
public:
    using Trajectory = std::function<Eigen::Vector3d(const common::Epoch&)>;

    explicit StaticEphemeris(std::string center = "EARTH");

    /// @brief Registers a body at a fixed position relative to the centre (m)
    void set_position(const std::string& body, const Eigen::Vector3d& position);

    /// @brief Registers a body following a trajectory relative to the centre (m)
    void set_trajectory(const std::string& body, Trajectory trajectory);

    /// @brief Registers a physical constant
    void set_constant(const std::string& body, const std::string& constant, double value);

    auto position_of(const std::string& body, const common::Epoch& epoch,
                     common::CoordinateFrame frame) const -> Eigen::Vector3d override;

    auto body_constant(const std::string& body, const std::string& constant) const -> double override;

    auto center() const -> std::string override { return center_; }

private:
    std::string center_;
    std::map<std::string, Trajectory> trajectories_;
    std::map<std::string, std::map<std::string, double>> constants_;
};

/// @class CachedEphemeris
/// @brief Memoises the most recent position lookup per body and frame
///
/// Integrators evaluate the derivative several times per step, often at the same
/// epoch (RK4 evaluates the midpoint twice). The cache holds one entry per body,
/// keyed on the exact epoch, and is not safe to share between threads; use one
/// instance per propagation.
class CachedEphemeris : public IEphemeris {
public:
    /// @throws std::invalid_argument if source is null
    explicit CachedEphemeris(std::shared_ptr<const IEphemeris> source);

    auto position_of(const std::string& body, const common::Epoch& epoch,
                     common::CoordinateFrame frame) const -> Eigen::Vector3d override;

    auto body_constant(const std::string& body, const std::string& constant) const -> double override;

    auto center() const -> std::string override { return source_->center(); }

    /// @brief Number of lookups forwarded to the wrapped provider
    auto misses() const -> std::size_t { return misses_; }

private:
    struct Entry {
        common::Epoch epoch;
        Eigen::Vector3d position;
    };

    std::shared_ptr<const IEphemeris> source_;
    mutable std::map<std::pair<std::string, common::CoordinateFrame>, Entry> cache_;
    mutable std::size_t misses_ = 0;
};

} // namespace environment
