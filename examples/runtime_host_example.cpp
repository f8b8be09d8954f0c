/**
 * @file runtime_host_example.cpp
 * @brief Example: a host process running three compiled-in components.
 *
 * Demonstrates the full runtime flow:
 *  - LifecycleGuard brings up the Logger and RuntimeConfig services.
 *  - Components registered with CONDUIT_REGISTER_STATIC_COMPONENT are started by a
 *    LifecycleManager in dependency order (store -> auth -> greeter).
 *  - Requests run through the active behavior chain owned by a BehaviorChainEngine.
 *  - "greeter" is hot reloaded while the others keep running.
 *  - stop_all() detaches everything in reverse order.
 *
 * Usage: runtime_host_example [config.json]
 */
#include "cdt_runtime.hpp"

#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>

using namespace conduit::runtime;
using namespace conduit::utils;
using namespace std::chrono_literals;

// ─── Components ──────────────────────────────────────────────────────────────

namespace
{

ComponentDescriptor describe(const char *id, std::set<std::string> deps = {})
{
    ComponentDescriptor d;
    d.id = id;
    d.name = id;
    d.dependencies = std::move(deps);
    return d;
}

/// Greeting templates per language. Contributes no behaviors of its own.
class StoreComponent : public BasicComponent
{
  public:
    StoreComponent() : BasicComponent(describe("store")) {}

    void on_attach(ComponentContext &) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_greetings = {{"en", "hello"}, {"fr", "bonjour"}, {"de", "hallo"}};
    }

    std::string greeting(const std::string &lang) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_greetings.find(lang);
        return it == m_greetings.end() ? "hi" : it->second;
    }

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_greetings;
};

/// Turns away requests without a "user" property.
class AuthComponent : public BasicComponent
{
  public:
    AuthComponent() : BasicComponent(describe("auth", {"store"})) {}

    std::vector<BehaviorContribution> contribute_behaviors() override
    {
        return {BehaviorContributionBuilder("auth.require_user")
                    .with_behavior(make_behavior(
                        [](PipelineContext &, const Behavior::Next &) -> std::any
                        { return std::string("denied: no user"); }))
                    .with_priority(10)
                    .in_phase(BehaviorPhase::PreProcessing)
                    .when(Not(when_property_exists("user")))
                    .with_tag("security")
                    .build()};
    }
};

class GreeterComponent : public BasicComponent
{
  public:
    GreeterComponent() : BasicComponent(describe("greeter", {"auth", "store"}))
    {
        m_descriptor.version = "2.0.0";
    }

    void on_attach(ComponentContext &ctx) override
    {
        m_store = ctx.registry().get_as<StoreComponent>("store");
        if (!m_store)
        {
            throw std::runtime_error("store is not running");
        }
        LOGGER_INFO("greeter: attached with boundary #{}.", ctx.boundary().instance_id());
    }

    std::vector<BehaviorContribution> contribute_behaviors() override
    {
        auto store = m_store;
        return {BehaviorContributionBuilder("greeter.reply")
                    .with_behavior(make_behavior(
                        [store](PipelineContext &ctx, const Behavior::Next &) -> std::any
                        {
                            const auto user = ctx.get_property<std::string>("user").value_or("?");
                            const auto lang = ctx.get_property<std::string>("lang").value_or("en");
                            return store->greeting(lang) + ", " + user;
                        }))
                    .with_priority(500)
                    .build()};
    }

    void on_detach() override { m_store.reset(); }

  private:
    std::shared_ptr<StoreComponent> m_store;
};

} // namespace

CONDUIT_REGISTER_STATIC_COMPONENT("store", StoreComponent);
CONDUIT_REGISTER_STATIC_COMPONENT("auth", AuthComponent);
CONDUIT_REGISTER_STATIC_COMPONENT("greeter", GreeterComponent);

// ─── Requests ────────────────────────────────────────────────────────────────

static void serve(const BehaviorChainEngine &engine, const char *user, const char *lang)
{
    PipelineContext ctx;
    if (user != nullptr)
    {
        ctx.set_property("user", std::string(user));
    }
    ctx.set_property("lang", std::string(lang));

    auto res = engine.run(ctx);
    if (res.is_error())
    {
        std::cout << "[request " << ctx.id() << "] failed: " << res.error().message << "\n";
        return;
    }
    const auto *reply = std::any_cast<std::string>(&res.content());
    std::cout << "[request " << ctx.id() << "] " << (reply ? *reply : "<no reply>") << "\n";
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv)
{
    if (argc > 1)
    {
        RuntimeConfig::set_config_path(argv[1]);
    }

    // Logger first; RuntimeConfig applies the configured log level once loaded.
    LifecycleGuard lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), RuntimeConfig::GetLifecycleModule()));
    const auto &config = RuntimeConfig::get_instance();

    BehaviorChainEngine engine;
    engine.set_terminal([](PipelineContext &) -> std::any { return std::string("no handler"); });
    if (config.pipeline_timeout().count() > 0)
    {
        engine.set_default_timeout(config.pipeline_timeout());
    }

    LifecycleManager manager(LifecycleOptions::from_config(config), StaticFactoryLoader::global(),
                             engine);
    manager.subscribe(
        [](const ComponentEvent &event) { std::cout << "event: " << event.to_string() << "\n"; },
        {ComponentEventType::Started, ComponentEventType::Reloaded, ComponentEventType::Stopped,
         ComponentEventType::Failed});

    auto started = manager.start_all({describe("greeter", {"auth", "store"}),
                                      describe("auth", {"store"}), describe("store")});
    std::cout << started.to_string();
    if (!started.ok())
    {
        return 1;
    }

    serve(engine, "ada", "en");
    serve(engine, "blaise", "fr");
    serve(engine, nullptr, "en");

    auto reloaded = manager.hot_reload("greeter");
    std::cout << reloaded.to_string();
    serve(engine, "carl", "de");

    auto stopped = manager.stop_all();
    std::cout << stopped.to_string();
    std::cout << "Example complete\n";
    return stopped.ok() ? 0 : 1;
}
