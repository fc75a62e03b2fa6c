#pragma once

/// @file scenario.hpp
/// @brief JSON scenario input and trajectory output for propagation runs.
///
/// Scenario files describe the epoch, initial state, propagation span, force
/// model and environment; trajectory files carry the propagated samples (and
/// STM when present) plus the force model summary and diagnostics.

#include "common/epoch.hpp"
#include "dynamics/force_composer.hpp"
#include "dynamics/force_model_config.hpp"
#include "propagator/propagator.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <string>

namespace io {

/// @struct EnvironmentSpec
/// @brief Which environment collaborators to instantiate
struct EnvironmentSpec {
    std::string ephemeris = "sofa";       ///< "sofa" or "static"
    nlohmann::json static_bodies;         ///< For "static": {BODY: {"position": [..], "GM": .., ...}}
    std::string atmosphere = "exponential"; ///< "exponential" or "us76"
    double surface_density = 1.225;       ///< Exponential model ρ₀ (kg/m³)
    double scale_height = 8500.0;         ///< Exponential model H (m)
    double solar_pressure = 4.56e-6;      ///< Pressure at 1 AU (N/m²)
};

/// @struct Scenario
/// @brief Everything needed to run one propagation
struct Scenario {
    common::Epoch epoch;               ///< Propagation epoch (t = 0)
    Eigen::VectorXd initial_state;     ///< 6 elements (m, m/s)
    double duration = 0.0;             ///< Span (s), negative propagates backward
    double timestep = 10.0;            ///< Fixed step (s)
    bool with_stm = true;              ///< Propagate the STM alongside the state
    dynamics::ForceModelConfig forces; ///< Force model selection
    EnvironmentSpec environment;       ///< Collaborators
};

/// @brief Builds a scenario from parsed JSON
/// @throws common::ConfigurationError for missing, mistyped or out-of-range fields
auto parse_scenario(const nlohmann::json& json) -> Scenario;

/// @brief Reads and parses a scenario file
/// @throws std::runtime_error if the file cannot be opened
/// @throws common::ConfigurationError for malformed content
auto load_scenario(const std::string& path) -> Scenario;

/// @brief Instantiates the ephemeris, atmosphere and solar pressure models of a scenario
/// @throws common::ConfigurationError for unknown model names
auto build_environment(const Scenario& scenario) -> dynamics::Environment;

/// @brief Serialises a propagated trajectory
///
/// @details Each point holds "time" and the 6-element "state"; augmented
///          samples also hold "stm" as 36 column-major values.
auto trajectory_to_json(const propagator::Trajectory& trajectory,
                        const Scenario& scenario,
                        const dynamics::ForceComposer& composer,
                        const dynamics::Diagnostics& diagnostics) -> nlohmann::json;

/// @brief Writes JSON to a file with 4-space indentation
/// @throws std::runtime_error if the file cannot be written
void write_json(const std::string& path, const nlohmann::json& json);

} // namespace io
