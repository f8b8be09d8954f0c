#include "cdt_base.hpp"
#include "runtime/component_descriptor.hpp"

#include <cctype>
#include <fmt/ranges.h>
#include <stdexcept>

namespace conduit::runtime
{

const char *to_string(IsolationLevel level) noexcept
{
    switch (level)
    {
    case IsolationLevel::None:
        return "None";
    case IsolationLevel::Standard:
        return "Standard";
    case IsolationLevel::Strict:
        return "Strict";
    default:
        return "Unknown";
    }
}

const char *to_string(ComponentState state) noexcept
{
    switch (state)
    {
    case ComponentState::Registered:
        return "Registered";
    case ComponentState::Resolved:
        return "Resolved";
    case ComponentState::Initializing:
        return "Initializing";
    case ComponentState::Initialized:
        return "Initialized";
    case ComponentState::Starting:
        return "Starting";
    case ComponentState::Running:
        return "Running";
    case ComponentState::Stopping:
        return "Stopping";
    case ComponentState::Stopped:
        return "Stopped";
    case ComponentState::Failed:
        return "Failed";
    case ComponentState::Unloaded:
        return "Unloaded";
    default:
        return "Unknown";
    }
}

bool is_terminal(ComponentState state) noexcept
{
    return state == ComponentState::Failed || state == ComponentState::Unloaded;
}

bool can_transition_to(ComponentState from, ComponentState to) noexcept
{
    if (to == ComponentState::Failed)
    {
        return !is_terminal(from);
    }
    switch (from)
    {
    case ComponentState::Registered:
        return to == ComponentState::Resolved;
    case ComponentState::Resolved:
        return to == ComponentState::Initializing;
    case ComponentState::Initializing:
        return to == ComponentState::Initialized;
    case ComponentState::Initialized:
        return to == ComponentState::Starting;
    case ComponentState::Starting:
        return to == ComponentState::Running;
    case ComponentState::Running:
        return to == ComponentState::Stopping;
    case ComponentState::Stopping:
        return to == ComponentState::Stopped;
    case ComponentState::Stopped:
        return to == ComponentState::Unloaded;
    case ComponentState::Failed:
    case ComponentState::Unloaded:
        return to == ComponentState::Resolved;
    default:
        return false;
    }
}

std::string ComponentDescriptor::to_string() const
{
    return fmt::format("{} '{}' v{} [{}] deps={{{}}} optional={{{}}} isolation={}", id, name,
                       version, runtime::to_string(state), fmt::join(dependencies, ","),
                       fmt::join(optional_dependencies, ","), runtime::to_string(isolation.level));
}

void validate_component_id(std::string_view id)
{
    if (id.empty())
    {
        throw std::invalid_argument("Runtime: component id must not be empty.");
    }
    if (id.size() > MAX_COMPONENT_ID_LEN)
    {
        throw std::length_error(fmt::format(
            "Runtime: component id exceeds maximum of {} characters.", MAX_COMPONENT_ID_LEN));
    }
    for (const char c : id)
    {
        if (std::isspace(static_cast<unsigned char>(c)) != 0)
        {
            throw std::invalid_argument(
                fmt::format("Runtime: component id '{}' must not contain whitespace.", id));
        }
    }
}

} // namespace conduit::runtime
