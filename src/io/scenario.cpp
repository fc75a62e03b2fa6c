#include "io/scenario.hpp"
#include "common/errors.hpp"
#include "common/stm.hpp"
#include "dynamics/atmosphere.hpp"
#include "dynamics/solar_pressure.hpp"
#include "environment/sofa_ephemeris.hpp"
#include "environment/static_ephemeris.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace io {

namespace {

template <typename T>
auto required(const nlohmann::json& json, const std::string& key) -> T {
    if (!json.contains(key)) {
        throw common::ConfigurationError("Scenario is missing required field '" + key + "'");
    }
    try {
        return json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigurationError("Scenario field '" + key + "' has the wrong type: " + e.what());
    }
}

template <typename T>
auto optional(const nlohmann::json& json, const std::string& key, T fallback) -> T {
    if (!json.contains(key)) {
        return fallback;
    }
    return required<T>(json, key);
}

auto positive_finite(const nlohmann::json& json, const std::string& key, double fallback) -> double {
    double value = optional<double>(json, key, fallback);
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw common::ConfigurationError("Scenario field 'environment." + key + "' must be positive and finite");
    }
    return value;
}

auto parse_vector3(const nlohmann::json& json, const std::string& what) -> Eigen::Vector3d {
    if (!json.is_array() || json.size() != 3) {
        throw common::ConfigurationError(what + " must be an array of 3 numbers");
    }
    try {
        return Eigen::Vector3d(json[0].get<double>(), json[1].get<double>(), json[2].get<double>());
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigurationError(what + " must hold numbers: " + e.what());
    }
}

auto parse_forces(const nlohmann::json& json) -> dynamics::ForceModelConfig {
    if (!json.is_object()) {
        throw common::ConfigurationError("Scenario field 'forces' must be an object");
    }
    dynamics::ForceModelConfig config;
    config.drag = optional<bool>(json, "drag", false);
    config.srp = optional<bool>(json, "srp", false);
    config.third_body = optional<bool>(json, "third_body", false);
    config.j2 = optional<bool>(json, "j2", false);
    if (json.contains("area")) {
        config.area = required<double>(json, "area");
    }
    if (json.contains("mass")) {
        config.mass = required<double>(json, "mass");
    }
    config.drag_coefficient = optional<double>(json, "drag_coefficient", config.drag_coefficient);
    config.srp_coefficient = optional<double>(json, "srp_coefficient", config.srp_coefficient);
    config.third_bodies = optional<std::vector<std::string>>(json, "third_bodies", {});
    config.central_body = optional<std::string>(json, "central_body", config.central_body);
    config.optional_failure_policy = dynamics::policy_from_string(
        optional<std::string>(json, "on_optional_failure", "skip"));
    return config;
}

auto parse_environment(const nlohmann::json& json) -> EnvironmentSpec {
    if (!json.is_object()) {
        throw common::ConfigurationError("Scenario field 'environment' must be an object");
    }
    EnvironmentSpec spec;
    spec.ephemeris = optional<std::string>(json, "ephemeris", spec.ephemeris);
    spec.atmosphere = optional<std::string>(json, "atmosphere", spec.atmosphere);
    spec.surface_density = positive_finite(json, "surface_density", spec.surface_density);
    spec.scale_height = positive_finite(json, "scale_height", spec.scale_height);
    spec.solar_pressure = positive_finite(json, "solar_pressure", spec.solar_pressure);
    if (json.contains("bodies")) {
        spec.static_bodies = json.at("bodies");
        if (!spec.static_bodies.is_object()) {
            throw common::ConfigurationError("Scenario field 'environment.bodies' must be an object");
        }
    }
    return spec;
}

auto build_static_ephemeris(const Scenario& scenario) -> std::shared_ptr<const environment::IEphemeris> {
    auto ephemeris = std::make_shared<environment::StaticEphemeris>(scenario.forces.central_body);
    for (const auto& body_item : scenario.environment.static_bodies.items()) {
        const std::string& body = body_item.key();
        for (const auto& item : body_item.value().items()) {
            const std::string& key = item.key();
            const auto& value = item.value();
            if (key == "position") {
                ephemeris->set_position(body, parse_vector3(value, "Position of " + body));
            } else if (value.is_number()) {
                ephemeris->set_constant(body, key, value.get<double>());
            } else {
                throw common::ConfigurationError("Constant " + key + " of " + body + " must be a number");
            }
        }
    }
    return ephemeris;
}

} // namespace

auto parse_scenario(const nlohmann::json& json) -> Scenario {
    if (!json.is_object()) {
        throw common::ConfigurationError("Scenario must be a JSON object");
    }

    Scenario scenario;
    scenario.epoch = common::Epoch::from_iso_utc(required<std::string>(json, "epoch"));

    auto state = required<std::vector<double>>(json, "initial_state");
    if (state.size() != static_cast<std::size_t>(common::STATE_SIZE)) {
        throw common::ConfigurationError("initial_state must have 6 elements, got " + std::to_string(state.size()));
    }
    scenario.initial_state = Eigen::Map<const Eigen::VectorXd>(state.data(), common::STATE_SIZE);

    scenario.duration = required<double>(json, "duration");
    scenario.timestep = optional<double>(json, "timestep", scenario.timestep);
    if (!(scenario.timestep > 0.0)) {
        throw common::ConfigurationError("timestep must be positive");
    }
    scenario.with_stm = optional<bool>(json, "with_stm", scenario.with_stm);

    if (json.contains("forces")) {
        scenario.forces = parse_forces(json.at("forces"));
    }
    if (json.contains("environment")) {
        scenario.environment = parse_environment(json.at("environment"));
    }
    return scenario;
}

auto load_scenario(const std::string& path) -> Scenario {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open scenario file " + path);
    }
    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigurationError("Failed to parse scenario file " + path + ": " + e.what());
    }
    return parse_scenario(json);
}

auto build_environment(const Scenario& scenario) -> dynamics::Environment {
    const EnvironmentSpec& spec = scenario.environment;
    dynamics::Environment env;

    std::shared_ptr<const environment::IEphemeris> source;
    if (spec.ephemeris == "sofa") {
        source = std::make_shared<environment::SofaEphemeris>(scenario.forces.central_body);
    } else if (spec.ephemeris == "static") {
        source = build_static_ephemeris(scenario);
    } else {
        throw common::ConfigurationError("Unknown ephemeris '" + spec.ephemeris + "' (expected 'sofa' or 'static')");
    }
    env.ephemeris = std::make_shared<environment::CachedEphemeris>(source);

    const double radius = source->body_constant(scenario.forces.central_body, environment::RADIUS);
    if (spec.atmosphere == "exponential") {
        env.atmosphere = std::make_shared<dynamics::ExponentialAtmosphere>(radius, spec.surface_density, spec.scale_height);
    } else if (spec.atmosphere == "us76") {
        env.atmosphere = std::make_shared<dynamics::US76Atmosphere>(radius);
    } else {
        throw common::ConfigurationError("Unknown atmosphere '" + spec.atmosphere + "' (expected 'exponential' or 'us76')");
    }

    env.solar_pressure = std::make_shared<dynamics::InverseSquareSolarPressure>(spec.solar_pressure);
    return env;
}

auto trajectory_to_json(const propagator::Trajectory& trajectory,
                        const Scenario& scenario,
                        const dynamics::ForceComposer& composer,
                        const dynamics::Diagnostics& diagnostics) -> nlohmann::json
{
    nlohmann::json output;
    output["summary"]["epoch"] = scenario.epoch.to_iso_utc();
    output["summary"]["central_body"] = composer.central_body().name;
    output["summary"]["forces"] = composer.active_modules();
    output["summary"]["with_stm"] = scenario.with_stm;
    output["summary"]["stm_layout"] = "column-major";
    output["summary"]["diagnostics"]["evaluations"] = diagnostics.evaluations;
    output["summary"]["diagnostics"]["skipped_terms"] = diagnostics.skipped_terms;
    output["summary"]["diagnostics"]["skips_by_module"] = diagnostics.skips_by_module;
    if (!diagnostics.clean()) {
        output["summary"]["diagnostics"]["last_failure_reason"] = diagnostics.last_failure_reason;
        output["summary"]["diagnostics"]["last_failure_time"] = diagnostics.last_failure_time;
    }

    nlohmann::json points = nlohmann::json::array();
    for (const auto& [t, state] : trajectory) {
        nlohmann::json point;
        point["time"] = t;
        point["state"] = std::vector<double>(state.data(), state.data() + common::STATE_SIZE);
        if (state.size() == common::AUGMENTED_STATE_SIZE) {
            point["stm"] = std::vector<double>(state.data() + common::STATE_SIZE, state.data() + state.size());
        }
        points.push_back(point);
    }
    output["points"] = points;
    return output;
}

void write_json(const std::string& path, const nlohmann::json& json) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Error opening output file " + path);
    }
    file << json.dump(4); // Pretty-print with 4-space indentation
    if (!file) {
        throw std::runtime_error("Failed writing output file " + path);
    }
}

} // namespace io
