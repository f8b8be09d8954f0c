#pragma once
/**
 * @file cdt_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs the platform macros (CONDUIT_PLATFORM_LINUX, CONDUIT_IS_POSIX, ...)
 * or the process/thread helpers should include this. It is self-contained.
 *
 * Build-system macros (PLATFORM_LINUX, ...) take precedence; compiler predefined macros
 * are the fallback.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_LINUX) &&           \
                                !defined(PLATFORM_FREEBSD) && defined(_WIN64))
#define CONDUIT_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define CONDUIT_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD) || defined(__FreeBSD__)
#define CONDUIT_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX) || defined(__linux__)
#define CONDUIT_PLATFORM_LINUX 1

#else
#define CONDUIT_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(CONDUIT_PLATFORM_WIN64)
#define CONDUIT_IS_WINDOWS 1
#elif defined(CONDUIT_PLATFORM_APPLE) || defined(CONDUIT_PLATFORM_FREEBSD) ||                      \
    defined(CONDUIT_PLATFORM_LINUX)
#define CONDUIT_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location, std::atomic<std::shared_ptr> and designated initializers are used
// throughout. MSVC only reports __cplusplus correctly with /Zc:__cplusplus, so check _MSVC_LANG.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "conduit_runtime_export.h"

namespace conduit::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
CONDUIT_RUNTIME_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
CONDUIT_RUNTIME_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
CONDUIT_RUNTIME_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Platform file name for a shared library called @p module_name
 *        ("libfoo.so", "libfoo.dylib" or "foo.dll").
 */
CONDUIT_RUNTIME_EXPORT std::string shared_library_filename(const std::string &module_name);

/// Full version string of the runtime, e.g. "0.3.0".
CONDUIT_RUNTIME_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
CONDUIT_RUNTIME_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Nanoseconds elapsed since @p start_ns (a monotonic_time_ns() value).
 * @note Returns 0 if start_ns lies in the future.
 */
CONDUIT_RUNTIME_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace conduit::platform
