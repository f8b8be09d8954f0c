#pragma once
/**
 * @file runtime_errors.hpp
 * @brief Error codes, severities and the structured ComponentError record.
 *
 * Lifecycle operations never throw for a single component's failure. Each failure is
 * captured as a ComponentError and returned in a LifecycleReport. Resolution and module
 * loading return Result<T, E>; behavior chains return Result<std::any, ChainFailure>.
 */
#include "conduit_runtime_export.h"

#include <chrono>
#include <exception>
#include <string>
#include <string_view>

namespace conduit::runtime
{

enum class RuntimeErrorCode : int
{
    None = 0,
    UnknownDependency,     ///< A required dependency id is not in the descriptor set.
    CyclicDependency,      ///< The dependency graph contains a cycle.
    DuplicateComponentId,  ///< Two descriptors share an id.
    RestrictedModule,      ///< The isolation policy rejected a module.
    DuplicateRegistration, ///< The registry already holds the id.
    LoadFailure,           ///< The loader could not produce a component instance.
    AttachFailure,         ///< on_attach() threw.
    ContributionFailure,   ///< contribute_behaviors() threw or returned an invalid contribution.
    DetachFailure,         ///< on_detach() threw.
    DetachTimeout,         ///< on_detach() did not return within the detach timeout.
    DrainTimeout,          ///< Requests still ran the component's behaviors after the drain timeout.
    DependencyFailed,      ///< A required dependency is not Running.
    InvalidState,          ///< The operation is not legal in the component's current state.
    ReloadInProgress,      ///< A hot reload of the same component is already running.
    UnknownComponent,      ///< The id is not known to the lifecycle manager.
    DiscoveryFailure       ///< A component directory or manifest could not be read.
};

CONDUIT_RUNTIME_EXPORT const char *to_string(RuntimeErrorCode code) noexcept;

enum class ErrorSeverity : int
{
    Information = 0,
    Warning = 1,
    Error = 2,
    Critical = 3
};

CONDUIT_RUNTIME_EXPORT const char *to_string(ErrorSeverity severity) noexcept;

/**
 * @brief One failed lifecycle transition.
 */
struct CONDUIT_RUNTIME_EXPORT ComponentError
{
    std::string component_id;
    RuntimeErrorCode code{RuntimeErrorCode::None};
    std::string message;
    ErrorSeverity severity{ErrorSeverity::Error};
    std::exception_ptr cause{nullptr}; ///< The exception that caused the failure, if any.
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static ComponentError make(std::string_view component_id, RuntimeErrorCode code,
                               std::string message, ErrorSeverity severity);

    /// Builds an error from @p ex; the message is `context: what()`.
    static ComponentError from_exception(std::string_view component_id, RuntimeErrorCode code,
                                         std::exception_ptr ex, std::string_view context,
                                         ErrorSeverity severity = ErrorSeverity::Error);

    bool is_critical() const noexcept { return severity == ErrorSeverity::Critical; }

    /// "[Error] component 'b' AttachFailure: on_attach failed: socket closed"
    std::string to_string() const;
};

/// what() of @p ex, or a placeholder for non-std exceptions and null pointers.
CONDUIT_RUNTIME_EXPORT std::string describe_exception(const std::exception_ptr &ex);

} // namespace conduit::runtime
