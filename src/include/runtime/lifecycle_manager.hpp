#pragma once
/**
 * @file lifecycle_manager.hpp
 * @brief Drives components through their state machine in dependency order.
 *
 * The manager owns, per component, its descriptor (and therefore its state), its
 * instance, and its LoadBoundary. It owns the ComponentRegistry and publishes running
 * components' behaviors to a BehaviorChainEngine.
 *
 * Start is best effort per subgraph: a component whose start fails is marked Failed
 * and every component that requires it (directly or transitively) is marked Failed
 * with DependencyFailed without being attempted; unrelated components still start.
 * Components that are already Running are never touched by a later failure. Every
 * failure is returned as a ComponentError in the LifecycleReport; no member throws for
 * a single component's failure.
 *
 * Operations are serialized. Component callbacks run without the manager's state lock
 * held, so on_attach() may query the manager and the registry.
 *
 * Stopping a component (stop_all(), hot_reload()) waits for requests that are still
 * running its behaviors from an earlier chain snapshot. A behavior must therefore not
 * stop or reload its own component from inside a request: the stop would wait for the
 * request until the drain timeout expires.
 *
 * The BehaviorChainEngine must outlive the manager.
 */
#include "conduit_runtime_export.h"
#include "runtime/behavior_chain_engine.hpp"
#include "runtime/component_descriptor.hpp"
#include "runtime/component_events.hpp"
#include "runtime/component_registry.hpp"
#include "runtime/module_loader.hpp"
#include "runtime/runtime_errors.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{
class RuntimeConfig;
}

namespace conduit::runtime
{

enum class CyclePolicy : int
{
    FailAll = 0,   ///< A cycle anywhere fails every component of the batch.
    FailDependents ///< Only cycle members and components requiring them fail.
};

struct CONDUIT_RUNTIME_EXPORT LifecycleOptions
{
    /// Parent of each component's private directory (`<module_root>/<component id>`).
    /// Empty means components have no private location.
    std::filesystem::path module_root;
    std::chrono::milliseconds detach_timeout{5000};
    /// How long a stop waits for in-flight requests to leave the component's behaviors.
    std::chrono::milliseconds drain_timeout{5000};
    CyclePolicy cycle_policy{CyclePolicy::FailAll};

    static LifecycleOptions from_config(const utils::RuntimeConfig &config);
};

struct ComponentOutcome
{
    std::string component_id;
    ComponentState state{ComponentState::Registered};
};

struct CONDUIT_RUNTIME_EXPORT LifecycleReport
{
    std::vector<ComponentOutcome> outcomes;
    std::vector<ComponentError> errors;

    bool ok() const noexcept { return errors.empty(); }
    std::optional<ComponentState> state_of(const std::string &component_id) const;
    bool has_error(const std::string &component_id, RuntimeErrorCode code) const;
    std::string to_string() const;
};

class LifecycleManagerImpl;

class CONDUIT_RUNTIME_EXPORT LifecycleManager
{
  public:
    LifecycleManager(LifecycleOptions options, std::shared_ptr<ModuleLoader> loader,
                     BehaviorChainEngine &engine);

    /// Stops every Running component.
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    /**
     * @brief Resolves and starts @p descriptors.
     * @details Components already Running may be named as dependencies. A descriptor
     *          whose id is already managed and not Failed, Stopped or Unloaded is
     *          rejected with DuplicateComponentId.
     * @throws std::invalid_argument / std::length_error for an invalid component id.
     */
    LifecycleReport start_all(const std::vector<ComponentDescriptor> &descriptors);

    /// Stops every Running component in reverse start order.
    LifecycleReport stop_all();

    /**
     * @brief Stops, unloads and restarts one Running component under a new boundary.
     * @details The component's behaviors leave the active chain in one swap before it
     *          stops and return in one swap once it is Running again. Requests already
     *          running against the previous chain finish with the old instance, which is
     *          detached only after they return. If the restart fails the component stays
     *          Failed and its behaviors stay removed. Dependents are not stopped.
     */
    LifecycleReport hot_reload(const std::string &component_id);

    /**
     * @brief Forgets a component that is not Running.
     * @details A Stopped component moves to Unloaded first. Its descriptor is destroyed.
     */
    LifecycleReport remove(const std::string &component_id);

    std::optional<ComponentState> get_state(const std::string &component_id) const;
    std::map<std::string, ComponentState> states() const;
    std::optional<ComponentDescriptor> get_descriptor(const std::string &component_id) const;

    /// Every error recorded since construction or the last clear_errors().
    std::vector<ComponentError> get_errors() const;
    void clear_errors();

    /// Start order of the last start_all(), including components that did not start.
    std::vector<std::string> start_order() const;

    const ComponentRegistry &registry() const noexcept;
    ComponentRegistry &registry() noexcept;
    const LifecycleOptions &options() const noexcept;

    /**
     * @brief Subscribes to component lifecycle events.
     * @param types Event types to deliver; empty delivers every type.
     * @see component_events.hpp for the delivery rules.
     */
    ComponentEventDispatcher::SubscriptionId
    subscribe(ComponentEventDispatcher::EventCallback callback,
              std::set<ComponentEventType> types = {});

    bool unsubscribe(ComponentEventDispatcher::SubscriptionId id);

  private:
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
