#pragma once
/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logger for the conduit runtime.
 *
 * **Design**
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format on the calling thread
 *     into a `fmt::memory_buffer` and push the result onto a command queue. A single
 *     worker thread drains the queue and performs all I/O.
 * 2.  **Commands**: sink switches, flushes and callback changes travel through the same
 *     queue as log messages, so they are ordered with respect to the messages around them.
 *     Callers wait on a promise for the worker to acknowledge.
 * 3.  **Sinks**: `Sink` abstracts the destination. `ConsoleSink` (stderr) is the default;
 *     `FileSink` appends to a file.
 * 4.  **Bounded queue**: beyond `max_queue_size` log messages are dropped and counted;
 *     the worker reports the drop count once the queue drains.
 * 5.  **Lifecycle**: the logger is a service. Register `Logger::GetLifecycleModule()`
 *     with a `LifecycleGuard`. Before initialisation `should_log()` is false, so the
 *     macros are silent no-ops; configuration calls abort with a panic.
 *
 * **Usage**
 * @code
 * conduit::utils::LifecycleGuard guard(conduit::utils::MakeModDefList(
 *     conduit::utils::Logger::GetLifecycleModule()));
 * LOGGER_INFO("component {} started in {} ms", id, ms);
 * @endcode
 ******************************************************************************/

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{

class CONDUIT_RUNTIME_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5
    };

    static Logger &instance();

    /// Service definition for the LifecycleGuard. Shutdown is bounded at 5 s.
    static ModuleDef GetLifecycleModule();

    /// True once the logger service has been started (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    /// Parses "trace", "debug", "info", "warning"/"warn", "error", "system" (any case).
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    ~Logger();
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    // --- Sinks (block until the worker has switched) ---
    bool set_console();
    bool set_logfile(const std::string &utf8_path);

    void flush();
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /// Receives sink creation and write errors, on a dedicated dispatcher thread.
    void set_write_error_callback(std::function<void(const std::string &)> cb);
    /// Enables the "Switching log sink to ..." system messages (default on).
    void set_log_sink_messages_enabled(bool enabled);

    bool should_log(Level lvl) const noexcept;
    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body_str) noexcept;
    /// Writes straight to the current sink, bypassing the queue.
    bool write_sync(Level lvl, fmt::memory_buffer &&body) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <Level lvl, typename... Args>
    void log_fmt_sync(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    struct Impl;

  private:
    Logger();

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    std::unique_ptr<Impl> pImpl;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
        catch (...)
        {
            enqueue_log(lvl, std::string("[UNKNOWN FORMAT ERROR]"));
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
    catch (...)
    {
        enqueue_log(lvl, std::string("[UNKNOWN FORMAT ERROR]"));
    }
}

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt_sync(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        fmt::memory_buffer mb;
        fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        write_sync(lvl, std::move(mb));
    }
    catch (...)
    {
        // Nothing sensible to report to: the sink itself is the failing path.
    }
}

} // namespace conduit::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_TRACE>(        \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_DEBUG>(        \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_INFO>(         \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_WARNING>(      \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_ERROR>(        \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::conduit::utils::Logger::instance().log_fmt<::conduit::utils::Logger::Level::L_SYSTEM>(       \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_ERROR_SYNC(fmt, ...)                                                                \
    ::conduit::utils::Logger::instance().log_fmt_sync<::conduit::utils::Logger::Level::L_ERROR>(   \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE_RT(fmt, ...)                                                                  \
    ::conduit::utils::Logger::instance().log_fmt_runtime(                                          \
        ::conduit::utils::Logger::Level::L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::conduit::utils::Logger::instance().log_fmt_runtime(                                          \
        ::conduit::utils::Logger::Level::L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::conduit::utils::Logger::instance().log_fmt_runtime(                                          \
        ::conduit::utils::Logger::Level::L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::conduit::utils::Logger::instance().log_fmt_runtime(                                          \
        ::conduit::utils::Logger::Level::L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::conduit::utils::Logger::instance().log_fmt_runtime(                                          \
        ::conduit::utils::Logger::Level::L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
