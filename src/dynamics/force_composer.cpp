#include "dynamics/force_composer.hpp"
#include "dynamics/atmospheric_drag.hpp"
#include "dynamics/gravity.hpp"
#include "dynamics/j2_oblateness.hpp"
#include "dynamics/solar_radiation_pressure.hpp"
#include "dynamics/third_body_gravity.hpp"
#include "common/errors.hpp"

#include <set>

namespace dynamics {

void Diagnostics::record_skip(const std::string& module, const std::string& reason, double t) {
    ++skipped_terms;
    ++skips_by_module[module];
    last_failure_reason = reason;
    last_failure_time = t;
}

auto CompositeForce::contribution_of(const std::string& name) const -> ForceContribution {
    auto it = contributions.find(name);
    if (it == contributions.end()) {
        return ForceContribution::zero();
    }
    return it->second;
}

ForceComposer::ForceComposer(const common::CelestialBodyConstants& central_body,
                             std::vector<std::shared_ptr<const IForce>> perturbations,
                             OptionalFailurePolicy policy,
                             std::ostream& log)
    : central_body_(central_body)
    , central_(std::make_shared<CentralGravity>(central_body))
    , perturbations_(std::move(perturbations))
    , policy_(policy)
    , log_(&log)
{
    std::set<std::string> names{central_->name()};
    for (const auto& force : perturbations_) {
        if (!force) {
            throw common::ConfigurationError("Force model cannot be null");
        }
        if (!names.insert(force->name()).second) {
            throw common::ConfigurationError("Force model " + force->name() + " registered twice");
        }
    }
}

auto ForceComposer::from_config(const ForceModelConfig& config, const Environment& env,
                                std::ostream& log) -> std::shared_ptr<const ForceComposer>
{
    config.validate(log);

    if (!env.ephemeris) {
        throw common::ConfigurationError("An ephemeris provider is required");
    }
    if (env.ephemeris->center() != config.central_body) {
        throw common::ConfigurationError("Ephemeris is centred on " + env.ephemeris->center() +
                                         " but the central body is " + config.central_body);
    }

    // Constants resolved once here, never per evaluation
    common::CelestialBodyConstants central = environment::resolve_body_constants(*env.ephemeris, config.central_body);

    std::vector<std::shared_ptr<const IForce>> perturbations;
    if (config.drag) {
        if (!env.atmosphere) {
            throw common::ConfigurationError("Drag enabled but no atmosphere model supplied");
        }
        perturbations.push_back(std::make_shared<AtmosphericDrag>(
            central, env.atmosphere, *config.area, *config.mass, config.drag_coefficient));
    }
    if (config.srp) {
        if (!env.solar_pressure) {
            throw common::ConfigurationError("SRP enabled but no solar pressure model supplied");
        }
        perturbations.push_back(std::make_shared<SolarRadiationPressure>(
            env.ephemeris, env.solar_pressure, *config.area, *config.mass, config.srp_coefficient));
    }
    if (config.third_body && !config.third_bodies.empty()) {
        perturbations.push_back(std::make_shared<ThirdBodyGravity>(
            ThirdBodyGravity::from_ephemeris(env.ephemeris, config.third_bodies)));
    }
    if (config.j2) {
        perturbations.push_back(std::make_shared<J2Oblateness>(central));
    }

    return std::make_shared<const ForceComposer>(central, std::move(perturbations),
                                                 config.optional_failure_policy, log);
}

auto ForceComposer::evaluate(const ForceContext& ctx, bool with_jacobians, Diagnostics* diagnostics) const -> CompositeForce {
    CompositeForce result;

    // Central term: failures here are never recoverable
    ForceResult central = central_->evaluate(ctx, with_jacobians);
    result.total = central.contribution();
    result.contributions.emplace(central_->name(), central.contribution());

    for (const auto& force : perturbations_) {
        ForceResult outcome = force->evaluate(ctx, with_jacobians);
        if (outcome.ok()) {
            result.total += outcome.contribution();
            result.contributions.emplace(force->name(), outcome.contribution());
            continue;
        }

        if (policy_ == OptionalFailurePolicy::Abort) {
            throw common::OptionalModuleFailure(force->name(), outcome.reason());
        }

        result.skipped.push_back(force->name());
        if (diagnostics) {
            diagnostics->record_skip(force->name(), outcome.reason(), ctx.t);
        }
        *log_ << "Warning: skipped " << force->name() << " term at t = " << ctx.t
              << " s: " << outcome.reason() << std::endl;
    }

    if (diagnostics) {
        ++diagnostics->evaluations;
    }
    return result;
}

auto ForceComposer::active_modules() const -> std::vector<std::string> {
    std::vector<std::string> names{central_->name()};
    for (const auto& force : perturbations_) {
        names.push_back(force->name());
    }
    return names;
}

} // namespace dynamics
