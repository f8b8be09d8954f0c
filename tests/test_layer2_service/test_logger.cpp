// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the asynchronous Logger service.
 *
 * The Logger is a process-wide service with its own lifecycle, so the test logic lives
 * in worker functions (see workers/logger_workers.cpp) that run in separate processes.
 * This file spawns the workers and checks their results.
 */
#include "cdt_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <system_error>

namespace fs = std::filesystem;
using namespace conduit::tests::helper;
using ::testing::HasSubstr;

/**
 * @class LoggerTest
 * @brief Hands out unique log file paths and removes them afterwards.
 */
class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = unique_temp_path("conduit_logger_" + test_name, ".log");
        paths_to_clean_.push_back(p);
        return p;
    }

    void RunLogWorker(const std::string &scenario, bool allow_logger_errors = false)
    {
        auto log_path = GetUniqueLogPath(scenario);
        WorkerProcess proc(g_self_exe_path, "logger." + scenario, {log_path.string()});
        ASSERT_TRUE(proc.valid());
        proc.wait_for_exit();
        expect_worker_ok(proc, {}, allow_logger_errors);
    }
};

TEST_F(LoggerTest, BasicLogging)
{
    RunLogWorker("test_basic_logging");
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    RunLogWorker("test_log_level_filtering");
}

TEST_F(LoggerTest, BadFormatStringIsReportedNotThrown)
{
    RunLogWorker("test_bad_format_string");
}

TEST_F(LoggerTest, MultithreadStress)
{
    RunLogWorker("test_multithread_stress");
}

TEST_F(LoggerTest, FlushWaitsForQueue)
{
    RunLogWorker("test_flush_waits_for_queue");
}

TEST_F(LoggerTest, QueueOverflowReportsDrops)
{
    RunLogWorker("test_queue_overflow_reports_drops", true);
}

TEST_F(LoggerTest, SinkCreationErrorKeepsOldSink)
{
    RunLogWorker("test_sink_creation_error_keeps_old_sink", true);
}

TEST_F(LoggerTest, WriteSyncBypassesQueue)
{
    RunLogWorker("test_write_sync_bypasses_queue", true);
}

TEST_F(LoggerTest, ShutdownIsIdempotent)
{
    RunLogWorker("test_shutdown_idempotency");
}

// Configuring the Logger before its service is started is a programming error.
TEST_F(LoggerTest, UseBeforeInitAborts)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_use_before_init_aborts", {});
    ASSERT_TRUE(proc.valid());
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(),
                HasSubstr("called before the Logger service was initialized"));
}

// Level names are parsed case-insensitively.
TEST(LoggerLevelTest, LevelFromString)
{
    using conduit::utils::Logger;
    EXPECT_EQ(Logger::level_from_string("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("WARNING"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_FALSE(Logger::level_from_string("loud").has_value());
}

// Logging macros are silent no-ops before the Logger is started.
TEST(LoggerLevelTest, MacrosAreSafeBeforeInit)
{
    EXPECT_FALSE(conduit::utils::Logger::lifecycle_initialized());
    LOGGER_ERROR("nobody is listening: {}", 42);
    EXPECT_FALSE(conduit::utils::Logger::instance().should_log(
        conduit::utils::Logger::Level::L_ERROR));
}
