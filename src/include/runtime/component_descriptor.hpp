#pragma once
/**
 * @file component_descriptor.hpp
 * @brief Immutable-by-convention metadata describing a component, and its state machine.
 */
#include "conduit_runtime_export.h"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::runtime
{

/// Maximum length of a component id.
inline constexpr size_t MAX_COMPONENT_ID_LEN = 256;

enum class IsolationLevel : int
{
    None = 0,     ///< Resolution may fall back to the host's search path.
    Standard = 1, ///< Shared core plus the component's private directory.
    Strict = 2    ///< Like Standard; only allow-listed shared modules are visible.
};

CONDUIT_RUNTIME_EXPORT const char *to_string(IsolationLevel level) noexcept;

/**
 * @brief Per-component module visibility policy.
 *
 * A module named in both sets is blocked.
 */
struct IsolationRequirements
{
    IsolationLevel level{IsolationLevel::Standard};
    std::set<std::string> allowed_modules;
    std::set<std::string> blocked_modules;
};

/**
 * @brief Lifecycle states of a component.
 *
 * Legal transitions:
 * @code
 *   Registered -> Resolved -> Initializing -> Initialized -> Starting -> Running
 *   Running -> Stopping -> Stopped -> Unloaded
 *   any non-terminal state -> Failed
 *   Failed | Unloaded -> Resolved   (a fresh attempt, e.g. hot reload)
 * @endcode
 */
enum class ComponentState : int
{
    Registered = 0,
    Resolved,
    Initializing,
    Initialized,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed,
    Unloaded
};

CONDUIT_RUNTIME_EXPORT const char *to_string(ComponentState state) noexcept;

/// True if the state machine permits moving from @p from to @p to.
CONDUIT_RUNTIME_EXPORT bool can_transition_to(ComponentState from, ComponentState to) noexcept;

/// Failed and Unloaded.
CONDUIT_RUNTIME_EXPORT bool is_terminal(ComponentState state) noexcept;

/**
 * @brief What the runtime knows about a component before loading it.
 *
 * `dependencies` must be Running before this component starts. `optional_dependencies`
 * only influence ordering when present. `entry_module` names the module the loader
 * opens; when empty the component id is used. `imports` lists further modules the
 * component needs; each passes through the component's isolation boundary.
 */
struct CONDUIT_RUNTIME_EXPORT ComponentDescriptor
{
    std::string id;
    std::string name;
    std::string version{"1.0.0"};
    std::string description;
    std::set<std::string> dependencies;
    std::set<std::string> optional_dependencies;
    ComponentState state{ComponentState::Registered};
    IsolationRequirements isolation;
    std::string entry_module;
    std::vector<std::string> imports;
    std::map<std::string, std::string> metadata;

    const std::string &module_name() const noexcept
    {
        return entry_module.empty() ? id : entry_module;
    }

    std::string to_string() const;
};

/**
 * @brief Validates a component id.
 * @throws std::invalid_argument if @p id is empty or contains whitespace.
 * @throws std::length_error     if @p id is longer than MAX_COMPONENT_ID_LEN.
 */
CONDUIT_RUNTIME_EXPORT void validate_component_id(std::string_view id);

} // namespace conduit::runtime
