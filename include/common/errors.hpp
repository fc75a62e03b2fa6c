#pragma once

#include <stdexcept>
#include <string>

namespace common {

/// @brief Invalid state-vector shape or a force enabled without its required parameters.
///
/// Fatal to the current call; never defaulted away.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what)
    {}
};

/// @brief Near-zero position or angular momentum where a direction is required.
class DegenerateGeometryError : public std::runtime_error {
public:
    explicit DegenerateGeometryError(const std::string& what)
        : std::runtime_error(what)
    {}
};

/// @brief An ephemeris lookup (body position or body constant) could not be satisfied.
class MissingEphemerisData : public std::runtime_error {
public:
    explicit MissingEphemerisData(const std::string& what)
        : std::runtime_error(what)
    {}
};

/// @brief A recoverable force term failed and the configured policy is to abort.
///
/// Under the default policy the same failure is recorded in the diagnostics and
/// the term contributes zero instead.
class OptionalModuleFailure : public std::runtime_error {
public:
    OptionalModuleFailure(const std::string& module, const std::string& reason)
        : std::runtime_error("Optional force '" + module + "' failed: " + reason)
        , module_(module)
    {}

    auto module() const -> const std::string& { return module_; }

private:
    std::string module_;
};

} // namespace common
