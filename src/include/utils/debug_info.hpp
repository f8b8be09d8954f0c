/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messaging.
 *
 * The functions live in `conduit::debug`. Format strings are checked at compile time via
 * `fmt::format_string`; `std::source_location` supplies the call site.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", conduit::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace conduit::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems this uses `backtrace`, `dladdr` and `__cxa_demangle`; on Windows
 * `CaptureStackBackTrace`. Errors during capture are reported to `stderr`.
 */
CONDUIT_RUNTIME_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * Intended for broken internal invariants only. Formats the message, prints it with the
 * call site, prints the stack and calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL UNKNOWN EXCEPTION DURING PANIC: fmt_str['{}']\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}']\n",
                   fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
}

// debug_msg_rt: runtime format string, take args by const& so make_format_args binds
template <typename... Args>
inline void debug_msg_rt(std::string_view fmt_str, const Args &...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  ");
        fmt::vprint(stderr, fmt_str, fmt::make_format_args(args...));
        fmt::print(stderr, "\n");
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG_RT: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt_str, e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL UNKNOWN EXCEPTION DURING DEBUG_MSG_RT: fmt_str['{}']\n",
                   fmt_str);
        std::fflush(stderr);
    }
}

} // namespace conduit::debug

// ---------------- thin macros for convenience --------------

#ifndef CDT_LOC_HERE_STR
#define CDT_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `conduit::debug::panic` with the current source location.
 */
#ifndef CDT_PANIC
#define CDT_PANIC(fmt, ...)                                                                        \
    ::conduit::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message, compiled in only with CONDUIT_ENABLE_DEBUG_MESSAGES.
 */
#ifndef CDT_DEBUG
#if defined(CONDUIT_ENABLE_DEBUG_MESSAGES)
#define CDT_DEBUG(fmt, ...) ::conduit::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define CDT_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

#ifndef CDT_DEBUG_RT
#if defined(CONDUIT_ENABLE_DEBUG_MESSAGES)
#define CDT_DEBUG_RT(fmt, ...) ::conduit::debug::debug_msg_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define CDT_DEBUG_RT(fmt, ...)                                                                     \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
