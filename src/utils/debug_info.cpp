/**
 * @file debug_info.cpp
 * @brief Stack trace printing for conduit::debug::print_stack_trace().
 *
 * POSIX builds symbolise frames with dladdr + __cxa_demangle and fall back to the raw
 * backtrace_symbols() line. Windows builds print raw frame addresses.
 */
#include "cdt_base.hpp"

#if defined(CONDUIT_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

namespace conduit::debug
{

namespace
{
constexpr int kMaxFrames = 64;
// Frame 0 is print_stack_trace itself.
constexpr int kSkipFrames = 1;

template <typename... Args>
void safe_print(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("[STACK] <format failure>\n", stderr);
    }
}
} // namespace

#if defined(CONDUIT_IS_POSIX)

void print_stack_trace() noexcept
{
    void *callstack[kMaxFrames];
    const int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_print("[STACK] backtrace() returned no frames\n");
        return;
    }

    char **symbols = backtrace_symbols(callstack, nframes);
    safe_print("[STACK] Stack trace ({} frames):\n", nframes - kSkipFrames);
    for (int i = kSkipFrames; i < nframes; ++i)
    {
        Dl_info dlinfo{};
        if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
        {
            int status = 0;
            char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
            const char *name = (status == 0 && dem != nullptr) ? dem : dlinfo.dli_sname;
            const auto offset = static_cast<const char *>(callstack[i]) -
                                static_cast<const char *>(dlinfo.dli_saddr);
            safe_print("[STACK]  #{:<3} {} + {:#x} ({})\n", i - kSkipFrames, name, offset,
                       format_tools::filename_only(dlinfo.dli_fname ? dlinfo.dli_fname : "?"));
            std::free(dem);
        }
        else if (symbols != nullptr)
        {
            safe_print("[STACK]  #{:<3} {}\n", i - kSkipFrames, symbols[i]);
        }
        else
        {
            safe_print("[STACK]  #{:<3} {}\n", i - kSkipFrames, callstack[i]);
        }
    }
    std::free(symbols);
    std::fflush(stderr);
}

#elif defined(CONDUIT_PLATFORM_WIN64)

void print_stack_trace() noexcept
{
    void *callstack[kMaxFrames];
    const USHORT nframes = CaptureStackBackTrace(kSkipFrames, kMaxFrames, callstack, nullptr);
    safe_print("[STACK] Stack trace ({} frames):\n", nframes);
    for (USHORT i = 0; i < nframes; ++i)
    {
        safe_print("[STACK]  #{:<3} {}\n", i, callstack[i]);
    }
    std::fflush(stderr);
}

#else

void print_stack_trace() noexcept
{
    safe_print("[STACK] Stack trace not supported on this platform\n");
}

#endif

} // namespace conduit::debug
