/**
 * @file lifecycle_manager.cpp
 * @brief Dependency-ordered start, reverse-ordered stop and hot reload of components.
 *
 * Start of one component:
 *   Registered|Failed|Unloaded -> Resolved      required dependencies Running, new boundary
 *                              -> (imports)     each import classified by the boundary
 *                              -> (load)        loader produces the instance
 *   Resolved     -> Initializing -> Initialized on_attach()
 *   Initialized  -> Starting     -> Running     contribute_behaviors(), register,
 *                                               publish behaviors
 *
 * Stop of one component:
 *   Running -> Stopping   behaviors withdrawn, unregistered, requests drained,
 *                         on_detach() (timed)
 *   Stopping -> Stopped   instance released, then its boundary
 *
 * Withdrawing behaviors only affects requests that start afterwards. A request that took
 * the previous chain snapshot keeps running the component's behaviors, so the manager
 * waits (up to the drain timeout) until the engine no longer references the component
 * before on_detach() runs and the instance and boundary are released.
 *
 * A drain or detach that times out leaves code running inside the component; the
 * component is marked Failed and its instance and boundary are parked, never unloaded.
 */
#include "cdt_service.hpp"
#include "runtime/component.hpp"
#include "runtime/component_events.hpp"
#include "runtime/dependency_graph.hpp"
#include "runtime/isolation_boundary.hpp"
#include "runtime/lifecycle_manager.hpp"

#include <fmt/ranges.h>

#include <algorithm>
#include <mutex>
#include <set>

namespace conduit::runtime
{

// ============================================================================
// LifecycleOptions / LifecycleReport
// ============================================================================

LifecycleOptions LifecycleOptions::from_config(const utils::RuntimeConfig &config)
{
    LifecycleOptions options;
    options.module_root = config.module_root();
    options.detach_timeout = config.detach_timeout();
    options.drain_timeout = config.drain_timeout();
    options.cycle_policy =
        config.fail_dependents_on_cycle() ? CyclePolicy::FailDependents : CyclePolicy::FailAll;
    return options;
}

std::optional<ComponentState> LifecycleReport::state_of(const std::string &component_id) const
{
    for (const auto &outcome : outcomes)
    {
        if (outcome.component_id == component_id)
        {
            return outcome.state;
        }
    }
    return std::nullopt;
}

bool LifecycleReport::has_error(const std::string &component_id, RuntimeErrorCode code) const
{
    return std::any_of(errors.begin(), errors.end(), [&](const ComponentError &e)
                       { return e.component_id == component_id && e.code == code; });
}

std::string LifecycleReport::to_string() const
{
    std::string out = fmt::format("LifecycleReport: {} component(s), {} error(s)\n",
                                  outcomes.size(), errors.size());
    for (const auto &outcome : outcomes)
    {
        out += fmt::format("  - {:<32} {}\n", outcome.component_id, runtime::to_string(outcome.state));
    }
    for (const auto &error : errors)
    {
        out += fmt::format("  ! {}\n", error.to_string());
    }
    return out;
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

namespace
{

// Clears a flag on scope exit.
class FlagReset
{
  public:
    FlagReset(std::mutex &mutex, bool &flag) : m_mutex(mutex), m_flag(flag) {}
    ~FlagReset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_flag = false;
    }
    FlagReset(const FlagReset &) = delete;
    FlagReset &operator=(const FlagReset &) = delete;

  private:
    std::mutex &m_mutex;
    bool &m_flag;
};

} // namespace

// Kept alive until the manager is destroyed: code may still run inside it.
struct ParkedComponent
{
    std::string component_id;
    std::shared_ptr<Component> instance;
    std::unique_ptr<LoadBoundary> boundary;
    bool detach_abandoned{false}; ///< an on_detach() thread may still be running
};

struct ManagedComponent
{
    ComponentDescriptor descriptor;
    std::shared_ptr<Component> instance;
    std::unique_ptr<LoadBoundary> boundary;
    bool attached{false};
    bool reloading{false};
};

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl(LifecycleOptions options, std::shared_ptr<ModuleLoader> loader,
                         BehaviorChainEngine &engine)
        : m_options(std::move(options)), m_loader(std::move(loader)), m_engine(engine)
    {
        if (!m_loader)
        {
            throw std::invalid_argument("LifecycleManager: loader must not be null.");
        }
    }

    ~LifecycleManagerImpl()
    {
        // A parked component whose requests have all returned can be released. One that a
        // request can still reach, or whose on_detach() was abandoned, is leaked: its
        // libraries are never unloaded.
        for (auto &parked : m_parked)
        {
            const bool busy = m_engine.is_referenced(parked.component_id);
            if (!busy && !parked.detach_abandoned)
            {
                parked.instance.reset();
                parked.boundary.reset();
                continue;
            }
            if (parked.instance && busy)
            {
                LOGGER_WARN("LifecycleManager: leaking parked instance of '{}'.",
                            parked.component_id);
                static_cast<void>(new std::shared_ptr<Component>(std::move(parked.instance)));
            }
            parked.instance.reset();
            if (parked.boundary)
            {
                LOGGER_WARN("LifecycleManager: leaking parked boundary of '{}' (#{}).",
                            parked.component_id, parked.boundary->instance_id());
                static_cast<void>(parked.boundary.release());
            }
        }
    }

    LifecycleReport start_all(const std::vector<ComponentDescriptor> &descriptors);
    LifecycleReport stop_all();
    LifecycleReport hot_reload(const std::string &id);
    LifecycleReport remove(const std::string &id);

    bool any_running() const;

    LifecycleOptions m_options;
    std::shared_ptr<ModuleLoader> m_loader;
    BehaviorChainEngine &m_engine;
    ComponentRegistry m_registry;

    mutable std::mutex m_mutex; // guards m_components, m_errors, m_start_order
    std::map<std::string, ManagedComponent> m_components;
    std::vector<ComponentError> m_errors;
    std::vector<std::string> m_start_order;

    std::mutex m_op_mutex; // serializes start/stop/reload/remove

    ComponentEventDispatcher m_events;

  private:
    ComponentState state_of(const std::string &id) const;
    bool transition(const std::string &id, ComponentState to, LifecycleReport &report);
    void record(LifecycleReport &report, ComponentError error);
    void fail(const std::string &id, ComponentError error, LifecycleReport &report);
    void outcome(const std::string &id, LifecycleReport &report) const;
    void notify(ComponentEventType type, const std::string &id, ComponentState from,
                ComponentState to, std::optional<ComponentError> error = std::nullopt) const;
    void park(const std::string &id, std::shared_ptr<Component> instance,
              std::unique_ptr<LoadBoundary> boundary, bool detach_abandoned);

    bool start_one(const std::string &id, LifecycleReport &report);
    bool stop_one(const std::string &id, LifecycleReport &report);

    // Best-effort cleanup of a component whose start failed after loading.
    void discard(const std::string &id);

    // Runs on_detach() under the detach timeout.
    utils::TimedCallOutcome detach(const std::shared_ptr<Component> &instance) const;

    void prune_missing(DependencyGraph &graph, const std::set<std::string> &batch,
                       std::set<std::string> &failed, LifecycleReport &report);

    std::vector<ParkedComponent> m_parked;
};

ComponentState LifecycleManagerImpl::state_of(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_components.find(id);
    return it == m_components.end() ? ComponentState::Unloaded : it->second.descriptor.state;
}

void LifecycleManagerImpl::record(LifecycleReport &report, ComponentError error)
{
    switch (error.severity)
    {
    case ErrorSeverity::Information:
        LOGGER_INFO("LifecycleManager: {}", error.to_string());
        break;
    case ErrorSeverity::Warning:
        LOGGER_WARN("LifecycleManager: {}", error.to_string());
        break;
    default:
        LOGGER_ERROR("LifecycleManager: {}", error.to_string());
        break;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errors.push_back(error);
    }
    report.errors.push_back(std::move(error));
}

bool LifecycleManagerImpl::transition(const std::string &id, ComponentState to,
                                      LifecycleReport &report)
{
    ComponentState from;
    bool failed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_components.find(id);
        if (it == m_components.end())
        {
            return false;
        }
        from = it->second.descriptor.state;
        if (can_transition_to(from, to))
        {
            it->second.descriptor.state = to;
            m_registry.update_descriptor(id, [to](ComponentDescriptor &d) { d.state = to; });
        }
        else if (can_transition_to(from, ComponentState::Failed))
        {
            // An illegal transition leaves the component Failed.
            it->second.descriptor.state = ComponentState::Failed;
            failed = true;
        }
    }
    if (can_transition_to(from, to))
    {
        LOGGER_DEBUG("LifecycleManager: '{}' {} -> {}.", id, to_string(from), to_string(to));
        notify(ComponentEventType::StateChanged, id, from, to);
        if (to == ComponentState::Stopped)
        {
            notify(ComponentEventType::Stopped, id, from, to);
        }
        else if (to == ComponentState::Unloaded)
        {
            notify(ComponentEventType::Unloaded, id, from, to);
        }
        return true;
    }
    auto error = ComponentError::make(id, RuntimeErrorCode::InvalidState,
                                      fmt::format("illegal transition {} -> {}", to_string(from),
                                                  to_string(to)),
                                      ErrorSeverity::Critical);
    if (failed)
    {
        notify(ComponentEventType::StateChanged, id, from, ComponentState::Failed);
        notify(ComponentEventType::Failed, id, from, ComponentState::Failed, error);
    }
    record(report, std::move(error));
    return false;
}

void LifecycleManagerImpl::fail(const std::string &id, ComponentError error,
                                LifecycleReport &report)
{
    std::optional<ComponentState> from;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_components.find(id);
        if (it != m_components.end() && can_transition_to(it->second.descriptor.state,
                                                          ComponentState::Failed))
        {
            from = it->second.descriptor.state;
            it->second.descriptor.state = ComponentState::Failed;
        }
    }
    if (from)
    {
        notify(ComponentEventType::StateChanged, id, *from, ComponentState::Failed);
        notify(ComponentEventType::Failed, id, *from, ComponentState::Failed, error);
    }
    record(report, std::move(error));
}

void LifecycleManagerImpl::outcome(const std::string &id, LifecycleReport &report) const
{
    report.outcomes.push_back(ComponentOutcome{id, state_of(id)});
}

void LifecycleManagerImpl::notify(ComponentEventType type, const std::string &id,
                                  ComponentState from, ComponentState to,
                                  std::optional<ComponentError> error) const
{
    ComponentEvent event;
    event.type = type;
    event.component_id = id;
    event.from = from;
    event.to = to;
    event.error = std::move(error);
    m_events.dispatch(event);
}

void LifecycleManagerImpl::park(const std::string &id, std::shared_ptr<Component> instance,
                                std::unique_ptr<LoadBoundary> boundary, bool detach_abandoned)
{
    if (instance || boundary)
    {
        m_parked.push_back(
            ParkedComponent{id, std::move(instance), std::move(boundary), detach_abandoned});
    }
}

utils::TimedCallOutcome
LifecycleManagerImpl::detach(const std::shared_ptr<Component> &instance) const
{
    // The helper thread holds its own reference so a timed-out detach keeps the instance.
    return utils::run_with_timeout([instance]() { instance->on_detach(); },
                                   m_options.detach_timeout);
}

void LifecycleManagerImpl::discard(const std::string &id)
{
    std::shared_ptr<Component> instance;
    std::unique_ptr<LoadBoundary> boundary;
    bool attached = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &mc = m_components.at(id);
        instance = std::move(mc.instance);
        boundary = std::move(mc.boundary);
        attached = mc.attached;
        mc.attached = false;
    }
    if (instance && attached)
    {
        const auto res = detach(instance);
        if (res.timed_out)
        {
            LOGGER_ERROR("LifecycleManager: cleanup detach of '{}' timed out; parking its "
                         "boundary.",
                         id);
            instance.reset();
            park(id, nullptr, std::move(boundary), true);
            return;
        }
        if (!res.success)
        {
            LOGGER_WARN("LifecycleManager: cleanup detach of '{}' failed: {}", id,
                        res.exception_msg);
        }
    }
    // Instance first: its code lives in the boundary's libraries.
    instance.reset();
    boundary.reset();
}

// ----------------------------------------------------------------------------
// start
// ----------------------------------------------------------------------------

bool LifecycleManagerImpl::start_one(const std::string &id, LifecycleReport &report)
{
    ComponentDescriptor desc;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        desc = m_components.at(id).descriptor;
    }

    for (const auto &dep : desc.dependencies)
    {
        const auto dep_state = state_of(dep);
        if (dep_state != ComponentState::Running)
        {
            fail(id,
                 ComponentError::make(id, RuntimeErrorCode::DependencyFailed,
                                      fmt::format("required dependency '{}' is {}", dep,
                                                  to_string(dep_state)),
                                      ErrorSeverity::Error),
                 report);
            return false;
        }
    }

    if (!transition(id, ComponentState::Resolved, report))
    {
        return false;
    }

    auto boundary = std::make_unique<LoadBoundary>(
        id, m_options.module_root.empty() ? std::filesystem::path{} : m_options.module_root / id,
        desc.isolation);

    for (const auto &import : desc.imports)
    {
        const auto resolution = boundary->resolve(import);
        if (resolution.is_rejected())
        {
            fail(id,
                 ComponentError::make(id, RuntimeErrorCode::RestrictedModule, resolution.error,
                                      ErrorSeverity::Critical),
                 report);
            return false;
        }
    }

    auto loaded = m_loader->load(desc.module_name(), *boundary);
    if (loaded.is_error())
    {
        const auto &err = loaded.error();
        fail(id,
             ComponentError::make(id, err.code, err.message,
                                  err.code == RuntimeErrorCode::RestrictedModule
                                      ? ErrorSeverity::Critical
                                      : ErrorSeverity::Error),
             report);
        return false;
    }

    std::shared_ptr<Component> instance;
    try
    {
        instance = loaded.content()();
    }
    catch (...)
    {
        fail(id,
             ComponentError::from_exception(id, RuntimeErrorCode::LoadFailure,
                                            std::current_exception(), "component factory threw"),
             report);
        return false;
    }
    if (!instance)
    {
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::LoadFailure,
                                  fmt::format("module '{}' produced no component",
                                              desc.module_name()),
                                  ErrorSeverity::Error),
             report);
        return false;
    }
    if (!instance->descriptor().id.empty() && instance->descriptor().id != id)
    {
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::LoadFailure,
                                  fmt::format("module '{}' produced component '{}'",
                                              desc.module_name(), instance->descriptor().id),
                                  ErrorSeverity::Error),
             report);
        return false;
    }

    const LoadBoundary *boundary_view = boundary.get();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &mc = m_components.at(id);
        mc.instance = instance;
        mc.boundary = std::move(boundary);
        mc.attached = false;
    }
    notify(ComponentEventType::Loaded, id, ComponentState::Resolved, ComponentState::Resolved);

    // ---- Initializing ----
    if (!transition(id, ComponentState::Initializing, report))
    {
        discard(id);
        return false;
    }
    try
    {
        ComponentContext ctx(id, m_registry, *boundary_view);
        instance->on_attach(ctx);
    }
    catch (...)
    {
        fail(id,
             ComponentError::from_exception(id, RuntimeErrorCode::AttachFailure,
                                            std::current_exception(), "on_attach failed"),
             report);
        discard(id);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_components.at(id).attached = true;
    }
    if (!transition(id, ComponentState::Initialized, report) ||
        !transition(id, ComponentState::Starting, report))
    {
        discard(id);
        return false;
    }

    // ---- Starting ----
    std::vector<BehaviorContribution> contributions;
    try
    {
        contributions = instance->contribute_behaviors();
        for (auto &c : contributions)
        {
            validate_contribution(c);
            if (c.owner_component_id.empty())
            {
                c.owner_component_id = id;
            }
        }
    }
    catch (...)
    {
        fail(id,
             ComponentError::from_exception(id, RuntimeErrorCode::ContributionFailure,
                                            std::current_exception(),
                                            "contribute_behaviors failed"),
             report);
        discard(id);
        return false;
    }

    if (!transition(id, ComponentState::Running, report))
    {
        discard(id);
        return false;
    }

    ComponentDescriptor running_desc = desc;
    running_desc.state = ComponentState::Running;
    if (!m_registry.register_component(id, instance, running_desc))
    {
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::DuplicateRegistration,
                                  "registry already holds this id", ErrorSeverity::Critical),
             report);
        discard(id);
        return false;
    }

    try
    {
        if (!contributions.empty())
        {
            m_engine.add_contributions(id, std::move(contributions));
        }
    }
    catch (...)
    {
        m_registry.unregister(id);
        fail(id,
             ComponentError::from_exception(id, RuntimeErrorCode::ContributionFailure,
                                            std::current_exception(),
                                            "behaviors rejected by the chain engine"),
             report);
        discard(id);
        return false;
    }

    LOGGER_INFO("LifecycleManager: '{}' v{} is Running (boundary #{}).", id, desc.version,
                boundary_view->instance_id());
    notify(ComponentEventType::Started, id, ComponentState::Starting, ComponentState::Running);
    return true;
}

void LifecycleManagerImpl::prune_missing(DependencyGraph &graph, const std::set<std::string> &batch,
                                         std::set<std::string> &failed, LifecycleReport &report)
{
    for (;;)
    {
        const auto missing = graph.missing_dependencies();
        if (missing.empty())
        {
            return;
        }
        std::set<std::string> removed;
        for (const auto &[component, dep] : missing)
        {
            if (removed.count(component) != 0 || batch.count(component) == 0)
            {
                continue;
            }
            removed.insert(component);
            if (failed.count(dep) != 0)
            {
                fail(component,
                     ComponentError::make(component, RuntimeErrorCode::DependencyFailed,
                                          fmt::format("required dependency '{}' failed", dep),
                                          ErrorSeverity::Error),
                     report);
            }
            else
            {
                fail(component,
                     ComponentError::make(component, RuntimeErrorCode::UnknownDependency,
                                          fmt::format("UnknownDependency({})", dep),
                                          ErrorSeverity::Error),
                     report);
            }
        }
        if (removed.empty())
        {
            // Only components outside the batch have missing edges; nothing to prune.
            return;
        }
        for (const auto &component : removed)
        {
            graph.remove_node(component);
            failed.insert(component);
        }
    }
}

LifecycleReport LifecycleManagerImpl::start_all(const std::vector<ComponentDescriptor> &descriptors)
{
    std::lock_guard<std::mutex> op_lock(m_op_mutex);
    LifecycleReport report;

    for (const auto &desc : descriptors)
    {
        validate_component_id(desc.id);
    }

    // ---- Accept the batch ----
    std::vector<std::string> batch_order;
    std::set<std::string> batch;
    for (const auto &desc : descriptors)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_components.find(desc.id);
        const bool reusable = it == m_components.end() ||
                              it->second.descriptor.state == ComponentState::Failed ||
                              it->second.descriptor.state == ComponentState::Stopped ||
                              it->second.descriptor.state == ComponentState::Unloaded ||
                              it->second.descriptor.state == ComponentState::Registered;
        if (batch.count(desc.id) != 0 || !reusable)
        {
            auto err = ComponentError::make(desc.id, RuntimeErrorCode::DuplicateComponentId,
                                            "component id is already in use",
                                            ErrorSeverity::Error);
            m_errors.push_back(err);
            LOGGER_ERROR("LifecycleManager: {}", err.to_string());
            report.errors.push_back(std::move(err));
            continue;
        }
        ManagedComponent mc;
        mc.descriptor = desc;
        mc.descriptor.state = ComponentState::Registered;
        if (it != m_components.end() && it->second.descriptor.state == ComponentState::Failed)
        {
            // A new attempt for a failed component goes through Resolved again.
            mc.descriptor.state = ComponentState::Failed;
        }
        m_components[desc.id] = std::move(mc);
        batch.insert(desc.id);
        batch_order.push_back(desc.id);
    }

    // ---- Graph: the batch plus everything already Running ----
    DependencyGraph graph;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[id, mc] : m_components)
        {
            if (batch.count(id) != 0 || mc.descriptor.state == ComponentState::Running)
            {
                graph.add_node(id, mc.descriptor.dependencies, mc.descriptor.optional_dependencies);
            }
        }
    }

    std::set<std::string> failed;
    prune_missing(graph, batch, failed, report);

    auto plan = graph.resolve();
    while (plan.is_error() && plan.error().code == RuntimeErrorCode::CyclicDependency)
    {
        const auto cycle = plan.error().cycle;
        const auto cycle_text = format_tools::format_cycle(cycle);
        if (m_options.cycle_policy == CyclePolicy::FailAll)
        {
            const std::set<std::string> members(cycle.begin(), cycle.end());
            for (const auto &id : batch_order)
            {
                if (failed.count(id) != 0)
                {
                    continue;
                }
                const bool member = members.count(id) != 0;
                fail(id,
                     ComponentError::make(id, RuntimeErrorCode::CyclicDependency,
                                          member ? fmt::format("CyclicDependency: {}", cycle_text)
                                                 : fmt::format("startup aborted by cyclic "
                                                               "dependency: {}",
                                                               cycle_text),
                                          ErrorSeverity::Critical),
                     report);
                failed.insert(id);
            }
            for (const auto &id : batch_order)
            {
                outcome(id, report);
            }
            return report;
        }

        for (const auto &id : cycle)
        {
            fail(id,
                 ComponentError::make(id, RuntimeErrorCode::CyclicDependency,
                                      fmt::format("CyclicDependency: {}", cycle_text),
                                      ErrorSeverity::Critical),
                 report);
            graph.remove_node(id);
            failed.insert(id);
        }
        prune_missing(graph, batch, failed, report);
        plan = graph.resolve();
    }
    if (plan.is_error())
    {
        // Missing edges were pruned and duplicates never enter the graph.
        CDT_PANIC("LifecycleManager: unexpected resolution failure: {}", plan.error().message);
    }

    const auto &order = plan.content().start_order;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_start_order = order;
    }
    LOGGER_INFO("LifecycleManager: start order [{}].", fmt::join(order, ", "));

    // ---- Start, in order ----
    for (const auto &id : order)
    {
        if (batch.count(id) == 0)
        {
            continue; // already Running
        }
        start_one(id, report);
    }

    for (const auto &id : batch_order)
    {
        outcome(id, report);
    }
    return report;
}

// ----------------------------------------------------------------------------
// stop
// ----------------------------------------------------------------------------

bool LifecycleManagerImpl::stop_one(const std::string &id, LifecycleReport &report)
{
    if (!transition(id, ComponentState::Stopping, report))
    {
        return false;
    }
    m_engine.remove_contributions(id);
    m_registry.unregister(id);

    // Requests that took an earlier snapshot may still be inside this component's behaviors.
    if (!m_engine.wait_for_release(id, m_options.drain_timeout))
    {
        std::shared_ptr<Component> busy;
        std::unique_ptr<LoadBoundary> busy_boundary;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto &mc = m_components.at(id);
            busy = std::move(mc.instance);
            busy_boundary = std::move(mc.boundary);
            mc.attached = false;
        }
        park(id, std::move(busy), std::move(busy_boundary), false);
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::DrainTimeout,
                                  fmt::format("requests still ran its behaviors after {} ms; "
                                              "on_detach skipped and the instance parked",
                                              m_options.drain_timeout.count()),
                                  ErrorSeverity::Critical),
             report);
        return false;
    }

    std::shared_ptr<Component> instance;
    bool attached = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &mc = m_components.at(id);
        instance = mc.instance;
        attached = mc.attached;
    }

    const auto res = (instance && attached) ? detach(instance) : utils::TimedCallOutcome{true, false, {}};

    std::unique_ptr<LoadBoundary> boundary;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &mc = m_components.at(id);
        mc.instance.reset();
        mc.attached = false;
        boundary = std::move(mc.boundary);
    }
    instance.reset();

    if (res.timed_out)
    {
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::DetachTimeout,
                                  fmt::format("on_detach did not return within {} ms",
                                              m_options.detach_timeout.count()),
                                  ErrorSeverity::Critical),
             report);
        park(id, nullptr, std::move(boundary), true);
        return false;
    }

    boundary.reset();
    if (!res.success)
    {
        fail(id,
             ComponentError::make(id, RuntimeErrorCode::DetachFailure,
                                  fmt::format("on_detach failed: {}", res.exception_msg),
                                  ErrorSeverity::Error),
             report);
        return false;
    }
    if (!transition(id, ComponentState::Stopped, report))
    {
        return false;
    }
    LOGGER_INFO("LifecycleManager: '{}' stopped.", id);
    return true;
}

LifecycleReport LifecycleManagerImpl::stop_all()
{
    std::lock_guard<std::mutex> op_lock(m_op_mutex);
    LifecycleReport report;

    std::vector<std::string> order;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        order.assign(m_start_order.rbegin(), m_start_order.rend());
        // Components started outside the recorded order still stop, before the rest.
        for (const auto &[id, mc] : m_components)
        {
            if (std::find(order.begin(), order.end(), id) == order.end())
            {
                order.insert(order.begin(), id);
            }
        }
    }

    for (const auto &id : order)
    {
        if (state_of(id) != ComponentState::Running)
        {
            continue;
        }
        stop_one(id, report);
        outcome(id, report);
    }
    return report;
}

bool LifecycleManagerImpl::any_running() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_components.begin(), m_components.end(), [](const auto &entry)
                       { return entry.second.descriptor.state == ComponentState::Running; });
}

// ----------------------------------------------------------------------------
// hot reload / remove
// ----------------------------------------------------------------------------

LifecycleReport LifecycleManagerImpl::hot_reload(const std::string &id)
{
    LifecycleReport report;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_components.find(id);
        ComponentError err;
        if (it == m_components.end())
        {
            err = ComponentError::make(id, RuntimeErrorCode::UnknownComponent,
                                       "no such component", ErrorSeverity::Error);
        }
        else if (it->second.reloading)
        {
            err = ComponentError::make(id, RuntimeErrorCode::ReloadInProgress,
                                       "a reload of this component is already running",
                                       ErrorSeverity::Warning);
        }
        else if (it->second.descriptor.state != ComponentState::Running)
        {
            err = ComponentError::make(
                id, RuntimeErrorCode::InvalidState,
                fmt::format("hot reload requires Running, component is {}",
                            to_string(it->second.descriptor.state)),
                ErrorSeverity::Error);
        }
        else
        {
            it->second.reloading = true;
        }
        if (err.code != RuntimeErrorCode::None)
        {
            lock.unlock();
            record(report, std::move(err));
            if (it != m_components.end())
            {
                outcome(id, report);
            }
            return report;
        }
    }

    std::lock_guard<std::mutex> op_lock(m_op_mutex);
    bool *reloading = nullptr;
    {
        // std::map nodes are stable; remove() refuses an entry while reloading is set.
        std::lock_guard<std::mutex> lock(m_mutex);
        reloading = &m_components.at(id).reloading;
    }
    FlagReset reset(m_mutex, *reloading);

    // An operation that held m_op_mutex first may have stopped the component.
    const auto current = state_of(id);
    if (current != ComponentState::Running)
    {
        record(report, ComponentError::make(id, RuntimeErrorCode::InvalidState,
                                            fmt::format("hot reload requires Running, "
                                                        "component is {}",
                                                        to_string(current)),
                                            ErrorSeverity::Error));
        outcome(id, report);
        return report;
    }
    LOGGER_INFO("LifecycleManager: hot reload of '{}' begins.", id);

    if (stop_one(id, report) && transition(id, ComponentState::Unloaded, report))
    {
        if (start_one(id, report))
        {
            LOGGER_INFO("LifecycleManager: hot reload of '{}' complete.", id);
            notify(ComponentEventType::Reloaded, id, ComponentState::Unloaded,
                   ComponentState::Running);
        }
    }

    outcome(id, report);
    return report;
}

LifecycleReport LifecycleManagerImpl::remove(const std::string &id)
{
    std::lock_guard<std::mutex> op_lock(m_op_mutex);
    LifecycleReport report;

    const auto state = state_of(id);
    bool known = false;
    bool reloading = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_components.find(id);
        known = it != m_components.end();
        reloading = known && it->second.reloading;
    }
    if (reloading)
    {
        record(report, ComponentError::make(id, RuntimeErrorCode::ReloadInProgress,
                                            "a reload of this component is running",
                                            ErrorSeverity::Warning));
        return report;
    }
    if (!known)
    {
        record(report, ComponentError::make(id, RuntimeErrorCode::UnknownComponent,
                                            "no such component", ErrorSeverity::Error));
        return report;
    }
    if (state != ComponentState::Stopped && state != ComponentState::Failed &&
        state != ComponentState::Registered && state != ComponentState::Unloaded)
    {
        record(report, ComponentError::make(id, RuntimeErrorCode::InvalidState,
                                            fmt::format("cannot remove a component that is {}",
                                                        to_string(state)),
                                            ErrorSeverity::Error));
        outcome(id, report);
        return report;
    }
    if (state == ComponentState::Stopped && !transition(id, ComponentState::Unloaded, report))
    {
        outcome(id, report);
        return report;
    }

    discard(id);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_components.erase(id);
        m_start_order.erase(std::remove(m_start_order.begin(), m_start_order.end(), id),
                            m_start_order.end());
    }
    LOGGER_INFO("LifecycleManager: '{}' removed.", id);
    report.outcomes.push_back(ComponentOutcome{id, ComponentState::Unloaded});
    return report;
}

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager(LifecycleOptions options, std::shared_ptr<ModuleLoader> loader,
                                   BehaviorChainEngine &engine)
    : pImpl(std::make_unique<LifecycleManagerImpl>(std::move(options), std::move(loader), engine))
{
}

LifecycleManager::~LifecycleManager()
{
    if (pImpl && pImpl->any_running())
    {
        const auto report = pImpl->stop_all();
        if (!report.ok())
        {
            LOGGER_WARN("LifecycleManager: {} error(s) while stopping at destruction.",
                        report.errors.size());
        }
    }
}

LifecycleReport LifecycleManager::start_all(const std::vector<ComponentDescriptor> &descriptors)
{
    return pImpl->start_all(descriptors);
}

LifecycleReport LifecycleManager::stop_all()
{
    return pImpl->stop_all();
}

LifecycleReport LifecycleManager::hot_reload(const std::string &component_id)
{
    return pImpl->hot_reload(component_id);
}

LifecycleReport LifecycleManager::remove(const std::string &component_id)
{
    return pImpl->remove(component_id);
}

std::optional<ComponentState> LifecycleManager::get_state(const std::string &component_id) const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    auto it = pImpl->m_components.find(component_id);
    if (it == pImpl->m_components.end())
    {
        return std::nullopt;
    }
    return it->second.descriptor.state;
}

std::map<std::string, ComponentState> LifecycleManager::states() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    std::map<std::string, ComponentState> out;
    for (const auto &[id, mc] : pImpl->m_components)
    {
        out.emplace(id, mc.descriptor.state);
    }
    return out;
}

std::optional<ComponentDescriptor>
LifecycleManager::get_descriptor(const std::string &component_id) const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    auto it = pImpl->m_components.find(component_id);
    if (it == pImpl->m_components.end())
    {
        return std::nullopt;
    }
    return it->second.descriptor;
}

std::vector<ComponentError> LifecycleManager::get_errors() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    return pImpl->m_errors;
}

void LifecycleManager::clear_errors()
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    pImpl->m_errors.clear();
}

std::vector<std::string> LifecycleManager::start_order() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    return pImpl->m_start_order;
}

const ComponentRegistry &LifecycleManager::registry() const noexcept
{
    return pImpl->m_registry;
}

ComponentRegistry &LifecycleManager::registry() noexcept
{
    return pImpl->m_registry;
}

const LifecycleOptions &LifecycleManager::options() const noexcept
{
    return pImpl->m_options;
}

ComponentEventDispatcher::SubscriptionId
LifecycleManager::subscribe(ComponentEventDispatcher::EventCallback callback,
                            std::set<ComponentEventType> types)
{
    return pImpl->m_events.subscribe(std::move(callback), std::move(types));
}

bool LifecycleManager::unsubscribe(ComponentEventDispatcher::SubscriptionId id)
{
    return pImpl->m_events.unsubscribe(id);
}

} // namespace conduit::runtime
