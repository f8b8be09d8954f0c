// tests/test_layer2_service/test_runtime_config.cpp
/**
 * @file test_runtime_config.cpp
 * @brief Tests for RuntimeConfig parsing and the process-wide configuration service.
 */
#include "cdt_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "test_patterns.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using conduit::utils::RuntimeConfig;
using namespace conduit::tests;
using namespace conduit::tests::helper;
using namespace std::chrono_literals;

namespace
{
void write_text(const fs::path &p, const std::string &text)
{
    std::ofstream out(p);
    out << text;
}
} // namespace

class RuntimeConfigTest : public PureApiTest
{
  protected:
    void TearDown() override
    {
        std::error_code ec;
        for (const auto &p : paths_to_clean_)
            fs::remove(p, ec);
    }

    fs::path TempConfig(const std::string &text)
    {
        auto p = unique_temp_path("conduit_config", ".json");
        paths_to_clean_.push_back(p);
        write_text(p, text);
        return p;
    }

    std::vector<fs::path> paths_to_clean_;
};

TEST_F(RuntimeConfigTest, DefaultsWhenEmpty)
{
    const RuntimeConfig cfg = RuntimeConfig::from_json(nlohmann::json::object());
    EXPECT_EQ(cfg.runtime_name(), "conduit");
    EXPECT_EQ(cfg.module_root(), fs::path("components"));
    EXPECT_EQ(cfg.detach_timeout(), 5000ms);
    EXPECT_EQ(cfg.drain_timeout(), 5000ms);
    EXPECT_FALSE(cfg.fail_dependents_on_cycle());
    EXPECT_EQ(cfg.pipeline_timeout(), 0ms);
    EXPECT_EQ(cfg.log_level(), "info");
}

TEST_F(RuntimeConfigTest, OverlaysKnownSections)
{
    const auto j = nlohmann::json::parse(R"({
        "runtime":    { "name": "edge-gateway" },
        "components": { "module_root": "/opt/gateway/components" },
        "lifecycle":  { "detach_timeout_ms": 2000, "drain_timeout_ms": 750, "cycle_policy": "fail_dependents" },
        "pipeline":   { "default_timeout_ms": 250 },
        "logger":     { "level": "debug" }
    })");
    const RuntimeConfig cfg = RuntimeConfig::from_json(j);
    EXPECT_EQ(cfg.runtime_name(), "edge-gateway");
    EXPECT_EQ(cfg.module_root(), fs::path("/opt/gateway/components"));
    EXPECT_EQ(cfg.detach_timeout(), 2000ms);
    EXPECT_EQ(cfg.drain_timeout(), 750ms);
    EXPECT_TRUE(cfg.fail_dependents_on_cycle());
    EXPECT_EQ(cfg.pipeline_timeout(), 250ms);
    EXPECT_EQ(cfg.log_level(), "debug");
}

// Component-specific sections are kept in the merged document.
TEST_F(RuntimeConfigTest, UnknownSectionsSurviveInRaw)
{
    const auto j = nlohmann::json::parse(R"({ "sensor": { "rate_hz": 10 } })");
    const RuntimeConfig cfg = RuntimeConfig::from_json(j);
    ASSERT_TRUE(cfg.raw().contains("sensor"));
    EXPECT_EQ(cfg.raw()["sensor"]["rate_hz"].get<int>(), 10);
}

TEST_F(RuntimeConfigTest, ApplyJsonOverlaysOnlyGivenKeys)
{
    RuntimeConfig cfg =
        RuntimeConfig::from_json(nlohmann::json::parse(R"({ "runtime": { "name": "a" } })"));
    cfg.apply_json(nlohmann::json::parse(R"({ "pipeline": { "default_timeout_ms": 10 } })"));
    EXPECT_EQ(cfg.runtime_name(), "a");
    EXPECT_EQ(cfg.pipeline_timeout(), 10ms);
}

TEST_F(RuntimeConfigTest, RejectsWrongTypes)
{
    EXPECT_THROW(RuntimeConfig::from_json(nlohmann::json::parse(R"({ "runtime": { "name": 3 } })")),
                 std::invalid_argument);
    EXPECT_THROW(RuntimeConfig::from_json(
                     nlohmann::json::parse(R"({ "lifecycle": { "detach_timeout_ms": "soon" } })")),
                 std::invalid_argument);
    EXPECT_THROW(RuntimeConfig::from_json(nlohmann::json::parse("[1, 2]")),
                 std::invalid_argument);
}

TEST_F(RuntimeConfigTest, RejectsNegativeTimeouts)
{
    EXPECT_THROW(RuntimeConfig::from_json(
                     nlohmann::json::parse(R"({ "pipeline": { "default_timeout_ms": -1 } })")),
                 std::invalid_argument);
}

TEST_F(RuntimeConfigTest, RejectsUnknownEnumerations)
{
    EXPECT_THROW(RuntimeConfig::from_json(
                     nlohmann::json::parse(R"({ "lifecycle": { "cycle_policy": "ignore" } })")),
                 std::invalid_argument);
    EXPECT_THROW(
        RuntimeConfig::from_json(nlohmann::json::parse(R"({ "logger": { "level": "loud" } })")),
        std::invalid_argument);
}

TEST_F(RuntimeConfigTest, FromFileReadsJson)
{
    const auto path = TempConfig(R"({ "runtime": { "name": "from-file" } })");
    const RuntimeConfig cfg = RuntimeConfig::from_file(path);
    EXPECT_EQ(cfg.runtime_name(), "from-file");
}

TEST_F(RuntimeConfigTest, FromFileErrors)
{
    EXPECT_THROW(RuntimeConfig::from_file(unique_temp_path("conduit_missing", ".json")),
                 std::runtime_error);
    const auto broken = TempConfig("{ not json");
    EXPECT_THROW(RuntimeConfig::from_file(broken), std::runtime_error);
}

#if CONDUIT_IS_POSIX
TEST_F(RuntimeConfigTest, EnvironmentOverridesFile)
{
    RuntimeConfig cfg = RuntimeConfig::from_json(
        nlohmann::json::parse(R"({ "components": { "module_root": "/from/file" } })"));
    ::setenv("CONDUIT_MODULE_ROOT", "/from/env", 1);
    ::setenv("CONDUIT_LOG_LEVEL", "not-a-level", 1);
    cfg.apply_environment();
    ::unsetenv("CONDUIT_MODULE_ROOT");
    ::unsetenv("CONDUIT_LOG_LEVEL");

    EXPECT_EQ(cfg.module_root(), fs::path("/from/env"));
    // An unknown level is ignored.
    EXPECT_EQ(cfg.log_level(), "info");
}
#endif

// ============================================================================
// Process-wide instance
// ============================================================================

class RuntimeConfigServiceTest : public IsolatedProcessTest
{
};

TEST_F(RuntimeConfigServiceTest, LoadsPinnedConfigFile)
{
    const auto path = unique_temp_path("conduit_service_config", ".json");
    write_text(path, R"({ "runtime": { "name": "pinned" }, "logger": { "level": "warning" } })");
    auto proc = SpawnWorker("runtime_config.test_loads_pinned_file", {path.string()});
    ExpectWorkerOk(*proc);
    std::error_code ec;
    fs::remove(path, ec);
}

TEST_F(RuntimeConfigServiceTest, DefaultsWithoutFile)
{
    auto proc = SpawnWorker("runtime_config.test_defaults_without_file");
    ExpectWorkerOk(*proc);
}
