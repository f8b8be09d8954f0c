#include "cdt_base.hpp"
#include "runtime/runtime_errors.hpp"

namespace conduit::runtime
{

const char *to_string(RuntimeErrorCode code) noexcept
{
    switch (code)
    {
    case RuntimeErrorCode::None:
        return "None";
    case RuntimeErrorCode::UnknownDependency:
        return "UnknownDependency";
    case RuntimeErrorCode::CyclicDependency:
        return "CyclicDependency";
    case RuntimeErrorCode::DuplicateComponentId:
        return "DuplicateComponentId";
    case RuntimeErrorCode::RestrictedModule:
        return "RestrictedModule";
    case RuntimeErrorCode::DuplicateRegistration:
        return "DuplicateRegistration";
    case RuntimeErrorCode::LoadFailure:
        return "LoadFailure";
    case RuntimeErrorCode::AttachFailure:
        return "AttachFailure";
    case RuntimeErrorCode::ContributionFailure:
        return "ContributionFailure";
    case RuntimeErrorCode::DetachFailure:
        return "DetachFailure";
    case RuntimeErrorCode::DetachTimeout:
        return "DetachTimeout";
    case RuntimeErrorCode::DrainTimeout:
        return "DrainTimeout";
    case RuntimeErrorCode::DependencyFailed:
        return "DependencyFailed";
    case RuntimeErrorCode::InvalidState:
        return "InvalidState";
    case RuntimeErrorCode::ReloadInProgress:
        return "ReloadInProgress";
    case RuntimeErrorCode::UnknownComponent:
        return "UnknownComponent";
    case RuntimeErrorCode::DiscoveryFailure:
        return "DiscoveryFailure";
    default:
        return "Unknown";
    }
}

const char *to_string(ErrorSeverity severity) noexcept
{
    switch (severity)
    {
    case ErrorSeverity::Information:
        return "Information";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Critical:
        return "Critical";
    default:
        return "Unknown";
    }
}

std::string describe_exception(const std::exception_ptr &ex)
{
    if (!ex)
    {
        return "no exception";
    }
    try
    {
        std::rethrow_exception(ex);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

ComponentError ComponentError::make(std::string_view component_id, RuntimeErrorCode code,
                                    std::string message, ErrorSeverity severity)
{
    ComponentError err;
    err.component_id = std::string(component_id);
    err.code = code;
    err.message = std::move(message);
    err.severity = severity;
    return err;
}

ComponentError ComponentError::from_exception(std::string_view component_id,
                                              RuntimeErrorCode code, std::exception_ptr ex,
                                              std::string_view context, ErrorSeverity severity)
{
    ComponentError err =
        make(component_id, code, fmt::format("{}: {}", context, describe_exception(ex)), severity);
    err.cause = std::move(ex);
    return err;
}

std::string ComponentError::to_string() const
{
    return fmt::format("[{}] component '{}' {}: {}", runtime::to_string(severity), component_id,
                       runtime::to_string(code), message);
}

} // namespace conduit::runtime
