/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the process, thread and clock helpers.
 *
 * Implements the functions declared in the `conduit::platform` namespace. Preprocessor
 * directives select the Windows, macOS, Linux or generic POSIX variant.
 */
#include "cdt_base.hpp"

#include <chrono>
#include <thread>
#include <vector>

#if defined(CONDUIT_IS_POSIX)
#include <limits.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(CONDUIT_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

#ifndef CONDUIT_VERSION_STRING
#define CONDUIT_VERSION_STRING "0.0.0"
#endif

namespace conduit::platform
{

uint64_t get_pid()
{
#if defined(CONDUIT_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most direct OS API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(CONDUIT_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(CONDUIT_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(CONDUIT_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(CONDUIT_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            return "unknown_win";
        }
        full_path.assign(buf.data(), len);
#elif defined(CONDUIT_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(CONDUIT_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? resolved : buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "Warning: get_executable_name failed with unknown exception.\n");
    }
    return "unknown";
}

std::string shared_library_filename(const std::string &module_name)
{
#if defined(CONDUIT_PLATFORM_WIN64)
    return module_name + ".dll";
#elif defined(CONDUIT_PLATFORM_APPLE)
    return "lib" + module_name + ".dylib";
#else
    return "lib" + module_name + ".so";
#endif
}

// CONDUIT_VERSION_STRING is injected by the build from the project version.
const char *get_version_string() noexcept
{
    return CONDUIT_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace conduit::platform
