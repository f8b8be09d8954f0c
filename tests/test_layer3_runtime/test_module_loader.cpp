/**
 * @file test_module_loader.cpp
 * @brief StaticFactoryLoader, DynamicLibraryLoader and DynamicLibrary.
 *
 * The dynamic tests load the example echo component module built next to the tests;
 * CONDUIT_TEST_PLUGIN_DIR and CONDUIT_TEST_PLUGIN_NAME come from the build.
 */
#include "cdt_runtime.hpp"
#include "runtime_test_doubles.h"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace conduit::runtime;
using conduit::tests::PureApiTest;
using conduit::tests::helper::unique_temp_path;

namespace
{
class Plain : public BasicComponent
{
  public:
    Plain() : BasicComponent(ComponentDescriptor{}) { m_descriptor.id = "plain"; }
};

IsolationRequirements strict_allowing(std::set<std::string> allowed)
{
    IsolationRequirements r;
    r.level = IsolationLevel::Strict;
    r.allowed_modules = std::move(allowed);
    return r;
}
} // namespace

CONDUIT_REGISTER_STATIC_COMPONENT("test.static.plain", Plain);

// ============================================================================
// StaticFactoryLoader
// ============================================================================

class StaticFactoryLoaderTest : public PureApiTest
{
  protected:
    StaticFactoryLoader loader_;
};

TEST_F(StaticFactoryLoaderTest, RegisterAndLoad)
{
    EXPECT_TRUE(loader_.register_factory("plain", [] { return std::make_shared<Plain>(); }));
    EXPECT_FALSE(loader_.register_factory("plain", [] { return std::make_shared<Plain>(); }));
    EXPECT_TRUE(loader_.contains("plain"));
    EXPECT_EQ(loader_.module_names(), (std::vector<std::string>{"plain"}));

    LoadBoundary boundary("plain", {}, {});
    auto factory = loader_.load("plain", boundary);
    ASSERT_TRUE(factory.is_ok());
    auto instance = factory.content()();
    ASSERT_NE(instance, nullptr);
    EXPECT_EQ(instance->id(), "plain");
    EXPECT_EQ(loader_.name(), "StaticFactoryLoader");
}

TEST_F(StaticFactoryLoaderTest, RejectsEmptyRegistration)
{
    EXPECT_THROW(loader_.register_factory("", [] { return std::make_shared<Plain>(); }),
                 std::invalid_argument);
    EXPECT_THROW(loader_.register_factory("x", ComponentFactory{}), std::invalid_argument);
}

TEST_F(StaticFactoryLoaderTest, UnknownModuleIsLoadFailure)
{
    LoadBoundary boundary("nothing", {}, {});
    auto factory = loader_.load("nothing", boundary);
    ASSERT_TRUE(factory.is_error());
    EXPECT_EQ(factory.error().code, RuntimeErrorCode::LoadFailure);
    EXPECT_EQ(factory.error().module_name, "nothing");
}

// The entry module itself passes through the boundary before any factory runs.
TEST_F(StaticFactoryLoaderTest, BoundaryRejectionWins)
{
    loader_.register_factory("plain", [] { return std::make_shared<Plain>(); });
    LoadBoundary boundary("plain", {}, strict_allowing({"something.else"}));
    auto factory = loader_.load("plain", boundary);
    ASSERT_TRUE(factory.is_error());
    EXPECT_EQ(factory.error().code, RuntimeErrorCode::RestrictedModule);
}

TEST_F(StaticFactoryLoaderTest, UnregisterFactory)
{
    loader_.register_factory("plain", [] { return std::make_shared<Plain>(); });
    EXPECT_TRUE(loader_.unregister_factory("plain"));
    EXPECT_FALSE(loader_.unregister_factory("plain"));
    EXPECT_FALSE(loader_.contains("plain"));
}

TEST_F(StaticFactoryLoaderTest, MacroRegistersWithGlobalLoader)
{
    auto global = StaticFactoryLoader::global();
    ASSERT_TRUE(global->contains("test.static.plain"));
    LoadBoundary boundary("plain", {}, {});
    auto factory = global->load("test.static.plain", boundary);
    ASSERT_TRUE(factory.is_ok());
    EXPECT_EQ(factory.content()()->id(), "plain");
}

// ============================================================================
// DynamicLibrary / DynamicLibraryLoader
// ============================================================================

class DynamicLibraryLoaderTest : public PureApiTest
{
  protected:
    static fs::path PluginDir() { return fs::path(CONDUIT_TEST_PLUGIN_DIR); }
    static std::string PluginName() { return CONDUIT_TEST_PLUGIN_NAME; }
    static fs::path PluginPath()
    {
        return PluginDir() / conduit::platform::shared_library_filename(PluginName());
    }
};

TEST_F(DynamicLibraryLoaderTest, OpenMissingLibraryFails)
{
    auto lib = DynamicLibrary::open(unique_temp_path("conduit_missing", ".so"));
    ASSERT_TRUE(lib.is_error());
    EXPECT_FALSE(lib.error().empty());
}

TEST_F(DynamicLibraryLoaderTest, OpenResolvesEntryPoints)
{
    auto opened = DynamicLibrary::open(PluginPath());
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    DynamicLibrary lib = std::move(opened).content();
    EXPECT_TRUE(lib.is_open());
    EXPECT_NE(lib.symbol(CONDUIT_COMPONENT_ABI_SYMBOL), nullptr);
    EXPECT_NE(lib.symbol(CONDUIT_COMPONENT_CREATE_SYMBOL), nullptr);
    EXPECT_EQ(lib.symbol("no_such_symbol"), nullptr);
    lib.close();
    EXPECT_FALSE(lib.is_open());
    lib.close();
}

TEST_F(DynamicLibraryLoaderTest, LoadsFromSearchDirectory)
{
    DynamicLibraryLoader loader({PluginDir()});
    {
        LoadBoundary boundary("echo", {}, {});
        auto factory = loader.load(PluginName(), boundary);
        ASSERT_TRUE(factory.is_ok()) << factory.error().message;
        EXPECT_EQ(boundary.loaded_library_count(), 1u);

        auto instance = factory.content()();
        ASSERT_NE(instance, nullptr);
        EXPECT_EQ(instance->id(), "echo");
        auto contributions = instance->contribute_behaviors();
        ASSERT_EQ(contributions.size(), 1u);
        EXPECT_EQ(contributions[0].id, "echo.reply");
        // Instances and behaviors go before the boundary closes the library.
        contributions.clear();
        instance.reset();
    }
}

TEST_F(DynamicLibraryLoaderTest, PrefersPrivateCopy)
{
    const auto module_root = unique_temp_path("conduit_modules");
    const auto private_dir = module_root / "echo";
    fs::create_directories(private_dir);
    fs::copy_file(PluginPath(), private_dir / PluginPath().filename());

    DynamicLibraryLoader loader; // no search directories
    {
        LoadBoundary boundary("echo", private_dir, {});
        auto factory = loader.load(PluginName(), boundary);
        ASSERT_TRUE(factory.is_ok()) << factory.error().message;
        const auto history = boundary.resolution_history();
        ASSERT_FALSE(history.empty());
        EXPECT_EQ(history.back().source, ModuleSource::Private);
        EXPECT_EQ(factory.content()()->id(), "echo");
    }
    std::error_code ec;
    fs::remove_all(module_root, ec);
}

TEST_F(DynamicLibraryLoaderTest, MissingModuleIsLoadFailure)
{
    DynamicLibraryLoader loader({PluginDir()});
    LoadBoundary boundary("ghost", {}, {});
    auto factory = loader.load("conduit_no_such_module", boundary);
    ASSERT_TRUE(factory.is_error());
    EXPECT_EQ(factory.error().code, RuntimeErrorCode::LoadFailure);
    EXPECT_NE(factory.error().message.find("cannot open"), std::string::npos);
    EXPECT_EQ(boundary.loaded_library_count(), 0u);
}

TEST_F(DynamicLibraryLoaderTest, BlockedModuleIsNeverOpened)
{
    DynamicLibraryLoader loader({PluginDir()});
    IsolationRequirements req;
    req.blocked_modules = {PluginName()};
    LoadBoundary boundary("echo", {}, req);
    auto factory = loader.load(PluginName(), boundary);
    ASSERT_TRUE(factory.is_error());
    EXPECT_EQ(factory.error().code, RuntimeErrorCode::RestrictedModule);
    EXPECT_EQ(boundary.loaded_library_count(), 0u);
}
