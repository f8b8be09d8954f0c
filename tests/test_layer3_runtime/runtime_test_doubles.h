// tests/test_layer3_runtime/runtime_test_doubles.h
#pragma once
/**
 * @file runtime_test_doubles.h
 * @brief Scriptable components, a shared event journal and a gmock loader for the
 *        runtime tests.
 */
#include "cdt_runtime.hpp"
#include "gmock/gmock.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace conduit::tests::helper
{

/// Thread-safe, ordered record of lifecycle events ("attach:a", "detach:b", ...).
class LifecycleJournal
{
  public:
    void record(std::string event)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(std::move(event));
    }

    std::vector<std::string> events() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    /// Events starting with @p prefix, in order, with the prefix stripped.
    std::vector<std::string> with_prefix(const std::string &prefix) const
    {
        std::vector<std::string> out;
        for (const auto &e : events())
        {
            if (e.rfind(prefix, 0) == 0)
                out.push_back(e.substr(prefix.size()));
        }
        return out;
    }

    bool contains(const std::string &event) const
    {
        const auto ev = events();
        return std::find(ev.begin(), ev.end(), event) != ev.end();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

  private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_events;
};

/**
 * @brief How a ScriptedComponent behaves. Shared with the factory, so a test may change
 *        the script between a start and a hot reload.
 */
struct ComponentScript
{
    bool fail_attach{false};
    bool fail_contribute{false};
    bool fail_detach{false};
    std::chrono::milliseconds detach_delay{0};

    /// Builds the component's contributions; called with the instance number (1, 2, ...).
    std::function<std::vector<runtime::BehaviorContribution>(int instance)> contributions;

    /// Extra work done inside on_attach().
    std::function<void(runtime::ComponentContext &)> on_attach;

    std::atomic<int> instances_created{0};
    std::atomic<int> instances_alive{0};
};

class ScriptedComponent : public runtime::Component
{
  public:
    ScriptedComponent(runtime::ComponentDescriptor descriptor,
                      std::shared_ptr<ComponentScript> script,
                      std::shared_ptr<LifecycleJournal> journal)
        : m_descriptor(std::move(descriptor)), m_script(std::move(script)),
          m_journal(std::move(journal))
    {
        m_instance = ++m_script->instances_created;
        ++m_script->instances_alive;
    }

    ~ScriptedComponent() override { --m_script->instances_alive; }

    const runtime::ComponentDescriptor &descriptor() const override { return m_descriptor; }

    void on_attach(runtime::ComponentContext &ctx) override
    {
        m_journal->record("attach:" + id());
        if (m_script->on_attach)
            m_script->on_attach(ctx);
        if (m_script->fail_attach)
            throw std::runtime_error("attach refused");
    }

    std::vector<runtime::BehaviorContribution> contribute_behaviors() override
    {
        m_journal->record("contribute:" + id());
        if (m_script->fail_contribute)
            throw std::runtime_error("no behaviors today");
        if (m_script->contributions)
            return m_script->contributions(m_instance);
        return {};
    }

    void on_detach() override
    {
        if (m_script->detach_delay.count() > 0)
            std::this_thread::sleep_for(m_script->detach_delay);
        m_journal->record("detach:" + id());
        if (m_script->fail_detach)
            throw std::runtime_error("detach refused");
    }

    int instance_number() const { return m_instance; }

  private:
    runtime::ComponentDescriptor m_descriptor;
    std::shared_ptr<ComponentScript> m_script;
    std::shared_ptr<LifecycleJournal> m_journal;
    int m_instance{0};
};

inline runtime::ComponentDescriptor make_descriptor(const std::string &id,
                                                    std::set<std::string> deps = {},
                                                    std::set<std::string> optional_deps = {})
{
    runtime::ComponentDescriptor d;
    d.id = id;
    d.name = id;
    d.dependencies = std::move(deps);
    d.optional_dependencies = std::move(optional_deps);
    return d;
}

/// Behavior that appends @p tag to the "trace" property and continues the chain.
inline std::shared_ptr<runtime::Behavior> tracing_behavior(std::string tag)
{
    return runtime::make_behavior(
        [tag = std::move(tag)](runtime::PipelineContext &ctx, const runtime::Behavior::Next &next)
        {
            auto trace = ctx.get_property<std::string>("trace").value_or("");
            ctx.set_property("trace", trace + tag + ";");
            return next(ctx);
        });
}

inline runtime::BehaviorContribution tracing_contribution(const std::string &id, int priority)
{
    return runtime::BehaviorContributionBuilder(id)
        .with_behavior(tracing_behavior(id))
        .with_priority(priority)
        .build();
}

/**
 * @brief A StaticFactoryLoader whose factories build ScriptedComponents.
 *
 * Each component gets a ComponentScript the test can reach through script().
 */
class ScriptedRuntime
{
  public:
    ScriptedRuntime()
        : loader(std::make_shared<runtime::StaticFactoryLoader>()),
          journal(std::make_shared<LifecycleJournal>())
    {
    }

    /// Registers a factory for @p descriptor and returns the descriptor unchanged.
    runtime::ComponentDescriptor add(const runtime::ComponentDescriptor &descriptor)
    {
        auto script = std::make_shared<ComponentScript>();
        m_scripts.emplace_back(descriptor.id, script);
        auto journal_copy = journal;
        loader->register_factory(descriptor.module_name(),
                                 [descriptor, script, journal_copy]()
                                 {
                                     return std::make_shared<ScriptedComponent>(descriptor, script,
                                                                                journal_copy);
                                 });
        return descriptor;
    }

    ComponentScript &script(const std::string &id)
    {
        for (auto &[sid, script] : m_scripts)
        {
            if (sid == id)
                return *script;
        }
        throw std::out_of_range("no script for component '" + id + "'");
    }

    std::shared_ptr<runtime::StaticFactoryLoader> loader;
    std::shared_ptr<LifecycleJournal> journal;

  private:
    std::vector<std::pair<std::string, std::shared_ptr<ComponentScript>>> m_scripts;
};

/// gmock double for loader failure paths.
class MockModuleLoader : public runtime::ModuleLoader
{
  public:
    MOCK_METHOD((utils::Result<runtime::ComponentFactory, runtime::LoadError>), load,
                (const std::string &module_name, runtime::LoadBoundary &boundary), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

} // namespace conduit::tests::helper
