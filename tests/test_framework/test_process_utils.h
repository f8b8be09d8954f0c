// tests/test_framework/test_process_utils.h
#pragma once

#include "cdt_platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

#if defined(CONDUIT_PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h> // For fork, execv, _exit
#endif

/**
 * @file test_process_utils.h
 * @brief Provides platform-abstracted utilities for spawning and managing child processes in tests.
 *
 * Process-wide services (the logger, the service lifecycle) can only be started once per
 * process; tests that exercise them re-run this executable as a worker.
 */
namespace conduit::tests::helper
{
namespace fs = std::filesystem;
// Platform-specific definition for a process handle.
#if defined(CONDUIT_PLATFORM_WIN64)
using ProcessHandle = HANDLE;
static constexpr HANDLE NULL_PROC_HANDLE = NULL;
#else
using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/**
 * @class WorkerProcess
 * @brief Manages a worker process, including its creation, termination, and output capture.
 *
 * stdout and stderr are captured to temporary files that are removed on destruction.
 */
class WorkerProcess
{
  public:
    /**
     * @brief Spawns the current test executable as a child process in a specific worker mode.
     *
     * @param exe_path The path to this executable (from g_self_exe_path).
     * @param mode The worker mode string (e.g., "logger.test_basic_logging").
     * @param args A vector of additional string arguments for the worker.
     * @param redirect_stderr_to_console Leave the worker's stderr on the console.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args, bool redirect_stderr_to_console = false);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /**
     * @brief Waits for the worker process to complete and captures its results.
     * @return The exit code of the process.
     */
    int wait_for_exit();

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

    /// The exit code, or -1 if not yet waited for.
    int exit_code() const { return exit_code_; }

    /// True if the process was spawned (or has been waited for).
    bool valid() const { return spawned_; }

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    int exit_code_ = -1;
    fs::path stdout_path_;
    fs::path stderr_path_;
    mutable std::string stdout_content_;
    mutable std::string stderr_content_;
    bool spawned_ = false;
    bool waited_ = false;
    bool redirect_stderr_to_console_ = false;
};

/**
 * @brief Asserts that a worker process completed successfully.
 *
 * Checks that the exit code is 0 and that stderr carries no error markers.
 *
 * @param proc The WorkerProcess instance to check (must have been waited for).
 * @param expected_stderr_substrings Strings that must appear in stderr.
 * @param allow_expected_logger_errors Do not check for "ERROR" in stderr.
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings = {},
                      bool allow_expected_logger_errors = false);

} // namespace conduit::tests::helper
