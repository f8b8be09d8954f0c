/**
 * @file test_runtime_end_to_end.cpp
 * @brief A shared-library component and compiled-in components serving requests
 *        through one LifecycleManager and BehaviorChainEngine.
 *
 * CONDUIT_TEST_PLUGIN_DIR and CONDUIT_TEST_PLUGIN_NAME come from the build.
 */
#include "cdt_runtime.hpp"
#include "runtime_test_doubles.h"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace conduit::runtime;
using namespace std::chrono_literals;
using conduit::tests::PureApiTest;
using conduit::tests::helper::unique_temp_path;
using ::testing::HasSubstr;

namespace
{

// Routes every loaded module through the dynamic loader except compiled-in ones.
class HybridLoader : public ModuleLoader
{
  public:
    HybridLoader(std::shared_ptr<StaticFactoryLoader> statics,
                 std::shared_ptr<DynamicLibraryLoader> dynamics)
        : m_statics(std::move(statics)), m_dynamics(std::move(dynamics))
    {
    }

    conduit::utils::Result<ComponentFactory, LoadError> load(const std::string &module_name,
                                                             LoadBoundary &boundary) override
    {
        if (m_statics->contains(module_name))
        {
            return m_statics->load(module_name, boundary);
        }
        return m_dynamics->load(module_name, boundary);
    }

    std::string name() const override { return "HybridLoader"; }

  private:
    std::shared_ptr<StaticFactoryLoader> m_statics;
    std::shared_ptr<DynamicLibraryLoader> m_dynamics;
};

// Tags requests so the echo reply can be checked against the pre-processing step.
class StampComponent : public BasicComponent
{
  public:
    StampComponent() : BasicComponent(conduit::tests::helper::make_descriptor("stamp")) {}

    std::vector<BehaviorContribution> contribute_behaviors() override
    {
        return {BehaviorContributionBuilder("stamp.request")
                    .with_behavior(make_behavior(
                        [](PipelineContext &ctx, const Behavior::Next &next) -> std::any
                        {
                            ctx.set_property("stamped", true);
                            return next(ctx);
                        }))
                    .with_priority(10)
                    .in_phase(BehaviorPhase::PreProcessing)
                    .build()};
    }
};

ComponentDescriptor echo_descriptor()
{
    ComponentDescriptor d;
    d.id = "echo";
    d.name = "Echo";
    d.entry_module = CONDUIT_TEST_PLUGIN_NAME;
    d.dependencies = {"stamp"};
    return d;
}

} // namespace

class RuntimeEndToEndTest : public PureApiTest
{
  protected:
    std::shared_ptr<ModuleLoader> MakeLoader(std::vector<fs::path> search_dirs)
    {
        auto statics = std::make_shared<StaticFactoryLoader>();
        statics->register_factory("stamp", []() { return std::make_shared<StampComponent>(); });
        return std::make_shared<HybridLoader>(
            statics, std::make_shared<DynamicLibraryLoader>(std::move(search_dirs)));
    }

    BehaviorChainEngine engine;
};

TEST_F(RuntimeEndToEndTest, PluginServesRequests)
{
    engine.set_terminal([](PipelineContext &) -> std::any { return std::string("unhandled"); });
    LifecycleManager manager({}, MakeLoader({fs::path(CONDUIT_TEST_PLUGIN_DIR)}), engine);

    auto report = manager.start_all({echo_descriptor(), conduit::tests::helper::make_descriptor("stamp")});
    ASSERT_TRUE(report.ok()) << report.to_string();
    EXPECT_EQ(manager.get_state("echo"), ComponentState::Running);
    EXPECT_EQ(manager.registry().get("echo")->descriptor().version, "1.2.0");

    PipelineContext text(std::string("hi"));
    auto reply = engine.run(text);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(std::any_cast<std::string>(reply.content()), "echo: hi");
    EXPECT_EQ(text.get_property<bool>("stamped"), true);
    EXPECT_EQ(text.get_property<bool>("echo.handled"), true);

    // Non-string input falls through to the terminal.
    PipelineContext number(42);
    auto fallthrough = engine.run(number);
    ASSERT_TRUE(fallthrough.is_ok());
    EXPECT_EQ(std::any_cast<std::string>(fallthrough.content()), "unhandled");

    ASSERT_TRUE(manager.hot_reload("echo").ok());
    PipelineContext again(std::string("again"));
    auto reloaded = engine.run(again);
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(std::any_cast<std::string>(reloaded.content()), "echo: again");

    auto stopped = manager.stop_all();
    EXPECT_TRUE(stopped.ok()) << stopped.to_string();
    EXPECT_TRUE(engine.snapshot()->empty());
}

TEST_F(RuntimeEndToEndTest, PluginLoadsFromPrivateDirectory)
{
    const auto module_root = unique_temp_path("conduit_e2e_modules");
    fs::create_directories(module_root / "echo");
    const auto file = conduit::platform::shared_library_filename(CONDUIT_TEST_PLUGIN_NAME);
    fs::copy_file(fs::path(CONDUIT_TEST_PLUGIN_DIR) / file, module_root / "echo" / file);

    {
        LifecycleOptions options;
        options.module_root = module_root;
        LifecycleManager manager(options, MakeLoader({}), engine);
        auto report = manager.start_all({echo_descriptor(), conduit::tests::helper::make_descriptor("stamp")});
        ASSERT_TRUE(report.ok()) << report.to_string();

        PipelineContext ctx(std::string("private"));
        auto reply = engine.run(ctx);
        ASSERT_TRUE(reply.is_ok());
        EXPECT_EQ(std::any_cast<std::string>(reply.content()), "echo: private");
    }

    std::error_code ec;
    fs::remove_all(module_root, ec);
}

TEST_F(RuntimeEndToEndTest, MissingPluginFailsOnlyItself)
{
    LifecycleManager manager({}, MakeLoader({}), engine);
    auto echo = echo_descriptor();
    echo.entry_module = "conduit_missing_component";

    auto report = manager.start_all({echo, conduit::tests::helper::make_descriptor("stamp")});
    EXPECT_EQ(report.state_of("stamp"), ComponentState::Running);
    EXPECT_EQ(report.state_of("echo"), ComponentState::Failed);
    ASSERT_TRUE(report.has_error("echo", RuntimeErrorCode::LoadFailure));

    PipelineContext ctx(std::string("hi"));
    auto reply = engine.run(ctx);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_FALSE(reply.content().has_value());
    EXPECT_EQ(ctx.get_property<bool>("stamped"), true);
}

// A packaged plugin directory is discovered, started by id and served from its own directory.
TEST_F(RuntimeEndToEndTest, DiscoveredPluginServesRequests)
{
    const auto module_root = unique_temp_path("conduit_e2e_discovery");
    fs::create_directories(module_root / "echo");
    const auto file = conduit::platform::shared_library_filename(CONDUIT_TEST_PLUGIN_NAME);
    fs::copy_file(fs::path(CONDUIT_TEST_PLUGIN_DIR) / file, module_root / "echo" / file);
    std::ofstream(module_root / "echo" / COMPONENT_MANIFEST_FILENAME)
        << R"({ "name": "Echo", "entry_module": ")" << CONDUIT_TEST_PLUGIN_NAME
        << R"(", "dependencies": ["stamp"] })";

    {
        auto discovered = ComponentDiscovery({module_root}).discover();
        ASSERT_TRUE(discovered.ok());
        ASSERT_EQ(discovered.components.size(), 1u);
        auto descriptors = discovered.descriptors();
        descriptors.push_back(conduit::tests::helper::make_descriptor("stamp"));

        LifecycleOptions options;
        options.module_root = module_root;
        LifecycleManager manager(options, MakeLoader({}), engine);
        auto report = manager.start_all(descriptors);
        ASSERT_TRUE(report.ok()) << report.to_string();

        PipelineContext ctx(std::string("hi"));
        auto reply = engine.run(ctx);
        ASSERT_TRUE(reply.is_ok());
        EXPECT_EQ(std::any_cast<std::string>(reply.content()), "echo: hi");
        EXPECT_EQ(ctx.get_property<bool>("stamped"), true);
    }

    std::error_code ec;
    fs::remove_all(module_root, ec);
}
