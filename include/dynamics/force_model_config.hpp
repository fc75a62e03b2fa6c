#pragma once

#include "dynamics/atmosphere.hpp"
#include "dynamics/solar_pressure.hpp"
#include "environment/ephemeris.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dynamics {

/// @brief What the composer does when a recoverable force term fails
enum class OptionalFailurePolicy {
    SkipAndRecord, ///< Zero the term for this evaluation, count it, log it
    Abort          ///< Throw common::OptionalModuleFailure
};

auto to_string(OptionalFailurePolicy policy) -> std::string;

/// @throws common::ConfigurationError on an unknown name
auto policy_from_string(const std::string& name) -> OptionalFailurePolicy;

/// @brief Selection and parameters of the perturbing forces
///
/// Central-body gravity is always on and has no flag.
struct ForceModelConfig {
    bool drag = false;        ///< Atmospheric drag
    bool srp = false;         ///< Solar radiation pressure
    bool third_body = false;  ///< Point-mass gravity of third_bodies
    bool j2 = false;          ///< Central-body oblateness

    std::optional<double> area;  ///< Cross-sectional area (m²), required by drag and SRP
    std::optional<double> mass;  ///< Mass (kg), required by drag and SRP

    double drag_coefficient = 2.2; ///< C_d
    double srp_coefficient = 1.0;  ///< c_srp

    std::vector<std::string> third_bodies; ///< Perturbing body identifiers
    std::string central_body = "EARTH";    ///< Central body identifier

    OptionalFailurePolicy optional_failure_policy = OptionalFailurePolicy::SkipAndRecord;

    /// @brief Validates flags and parameters as a unit
    ///
    /// @details Errors: drag or SRP without positive finite area and mass,
    ///          non-positive coefficients, empty central body, central body or
    ///          duplicates in the third-body list. Warnings (written to log):
    ///          third-body enabled with no bodies, area/mass supplied with no
    ///          force consuming them, bodies listed while third-body is off.
    /// @throws common::ConfigurationError
    void validate(std::ostream& log = std::cerr) const;
};

/// @brief External collaborators the force models consult
struct Environment {
    std::shared_ptr<const environment::IEphemeris> ephemeris; ///< Required
    std::shared_ptr<const IAtmosphere> atmosphere;            ///< Required when drag is on
    std::shared_ptr<const ISolarPressure> solar_pressure;     ///< Required when SRP is on
};

} // namespace dynamics
