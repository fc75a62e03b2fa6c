#include "dynamics/force_model_config.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <set>

namespace dynamics {

namespace {
auto positive(const std::optional<double>& value) -> bool {
    return value.has_value() && std::isfinite(*value) && *value > 0.0;
}
} // namespace

auto to_string(OptionalFailurePolicy policy) -> std::string {
    switch (policy) {
        case OptionalFailurePolicy::SkipAndRecord: return "skip";
        case OptionalFailurePolicy::Abort: return "abort";
    }
    return "unknown";
}

auto policy_from_string(const std::string& name) -> OptionalFailurePolicy {
    if (name == "skip") {
        return OptionalFailurePolicy::SkipAndRecord;
    }
    if (name == "abort") {
        return OptionalFailurePolicy::Abort;
    }
    throw common::ConfigurationError("Unknown optional failure policy: " + name + " (expected 'skip' or 'abort')");
}

void ForceModelConfig::validate(std::ostream& log) const {
    if (central_body.empty()) {
        throw common::ConfigurationError("Central body must be named");
    }

    const bool needs_ballistics = drag || srp;
    if (needs_ballistics) {
        const std::string who = drag ? "Drag" : "SRP";
        if (!positive(area)) {
            throw common::ConfigurationError(who + " enabled but no positive cross-sectional area given");
        }
        if (!positive(mass)) {
            throw common::ConfigurationError(who + " enabled but no positive mass given");
        }
    } else if (area.has_value() || mass.has_value()) {
        log << "Warning: area/mass supplied but neither drag nor SRP is enabled; they are ignored" << std::endl;
    }

    if (drag && !(std::isfinite(drag_coefficient) && drag_coefficient > 0.0)) {
        throw common::ConfigurationError("Drag coefficient must be positive");
    }
    if (srp && !(std::isfinite(srp_coefficient) && srp_coefficient > 0.0)) {
        throw common::ConfigurationError("SRP coefficient must be positive");
    }

    std::set<std::string> seen;
    for (const auto& body : third_bodies) {
        if (body.empty()) {
            throw common::ConfigurationError("Third-body list contains an empty name");
        }
        if (body == central_body) {
            throw common::ConfigurationError("Central body " + body + " cannot also be a third body");
        }
        if (!seen.insert(body).second) {
            throw common::ConfigurationError("Third body " + body + " listed twice");
        }
    }

    if (third_body && third_bodies.empty()) {
        log << "Warning: third-body gravity enabled with an empty body list; it contributes nothing" << std::endl;
    }
    if (!third_body && !third_bodies.empty()) {
        log << "Warning: third bodies listed but third-body gravity is disabled; they are ignored" << std::endl;
    }
}

} // namespace dynamics
