#pragma once

#include "dynamics/force.hpp"
#include "dynamics/force_model_config.hpp"
#include "common/body_constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dynamics {

/// @brief Running record of force terms skipped across derivative evaluations
///
/// Owned by whoever drives the propagation; the composer only appends to it.
struct Diagnostics {
    std::size_t evaluations = 0;                     ///< Composer evaluations observed
    std::size_t skipped_terms = 0;                   ///< Total skipped optional terms
    std::map<std::string, std::size_t> skips_by_module; ///< Skips per force name
    std::string last_failure_reason;                 ///< Reason of the most recent skip
    double last_failure_time = 0.0;                  ///< Elapsed time of the most recent skip (s)

    /// @brief True when no term has been skipped
    auto clean() const -> bool { return skipped_terms == 0; }

    void record_skip(const std::string& module, const std::string& reason, double t);
};

/// @brief Summed force model output for one evaluation
struct CompositeForce {
    ForceContribution total;                             ///< Sum over all evaluated modules
    std::map<std::string, ForceContribution> contributions; ///< Per module that contributed
    std::vector<std::string> skipped;                    ///< Modules zeroed in this evaluation

    /// @brief Contribution of one module; exact zero when the module is inactive or skipped
    auto contribution_of(const std::string& name) const -> ForceContribution;
};

/// @brief Evaluates central gravity and the enabled perturbations and sums them
///
/// @details Central gravity is always evaluated first; perturbations follow in
///          the order given. Summation is order independent up to floating-point
///          rounding. A module that is not in the list contributes exactly zero.
///
///          A perturbation returning ForceResult::failure() is handled according
///          to the OptionalFailurePolicy: skipped (contribution zero, recorded in
///          Diagnostics and logged) or aborted with common::OptionalModuleFailure.
///          Exceptions thrown by modules (missing ephemeris, degenerate central
///          geometry) always propagate.
class ForceComposer {
public:
    /// @param central_body Constants of the central body
    /// @param perturbations Enabled perturbation models, evaluated in order
    /// @param policy Handling of recoverable module failures
    /// @param log Sink for warnings
    /// @throws common::ConfigurationError for null modules or duplicate module names
    ForceComposer(const common::CelestialBodyConstants& central_body,
                  std::vector<std::shared_ptr<const IForce>> perturbations,
                  OptionalFailurePolicy policy = OptionalFailurePolicy::SkipAndRecord,
                  std::ostream& log = std::cerr);

    /// @brief Validates the configuration and builds the enabled modules
    /// @throws common::ConfigurationError for invalid configuration or missing collaborators
    /// @throws common::MissingEphemerisData if required body constants are unavailable
    static auto from_config(const ForceModelConfig& config, const Environment& env,
                            std::ostream& log = std::cerr) -> std::shared_ptr<const ForceComposer>;

    /// @brief Evaluates all active modules at the given context
    /// @param ctx Force context
    /// @param with_jacobians Whether ∂a/∂r and ∂a/∂v are needed (STM propagation)
    /// @param diagnostics Optional accumulator for skipped terms
    auto evaluate(const ForceContext& ctx, bool with_jacobians, Diagnostics* diagnostics = nullptr) const -> CompositeForce;

    /// @brief Names of the active modules, central gravity first
    auto active_modules() const -> std::vector<std::string>;

    auto central_body() const -> const common::CelestialBodyConstants& { return central_body_; }

private:
    common::CelestialBodyConstants central_body_;
    std::shared_ptr<const IForce> central_;
    std::vector<std::shared_ptr<const IForce>> perturbations_;
    OptionalFailurePolicy policy_;
    std::ostream* log_;
};

} // namespace dynamics
