#pragma once
/**
 * @file pipeline_context.hpp
 * @brief Request-scoped state carried through one behavior chain execution.
 *
 * A PipelineContext is created per inbound message and is never shared between
 * requests. Behaviors of the same request may run on different threads (a behavior may
 * hand off to a worker before calling `next`), so the property bag, the cancellation
 * flag and the deadline are safe to touch concurrently. The input and result slots are
 * owned by whichever behavior is currently executing.
 */
#include "conduit_runtime_export.h"
#include "utils/format_tools.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

/// Property written by an error handler with the text of the fault it converted.
inline constexpr std::string_view kLastErrorProperty = "LastError";

class CONDUIT_RUNTIME_EXPORT PipelineContext
{
  public:
    using Clock = std::chrono::steady_clock;

    PipelineContext();
    explicit PipelineContext(std::any input);
    ~PipelineContext();

    PipelineContext(const PipelineContext &) = delete;
    PipelineContext &operator=(const PipelineContext &) = delete;

    const std::string &id() const noexcept { return m_id; }
    std::chrono::system_clock::time_point created_at() const noexcept { return m_created_at; }

    // ====================================================================
    // Message and result
    // ====================================================================

    const std::any &input() const noexcept { return m_input; }
    void set_input(std::any input) { m_input = std::move(input); }

    std::any &result() noexcept { return m_result; }
    const std::any &result() const noexcept { return m_result; }
    void set_result(std::any result) { m_result = std::move(result); }

    /// Typed view of the input; nullptr when the input holds another type.
    template <typename T> const T *input_as() const noexcept { return std::any_cast<T>(&m_input); }

    // ====================================================================
    // Properties (case-insensitive keys)
    // ====================================================================

    void set_property(std::string_view key, std::any value);
    bool has_property(std::string_view key) const;
    bool remove_property(std::string_view key);
    std::optional<std::any> property(std::string_view key) const;
    std::vector<std::string> property_keys() const;
    size_t property_count() const;

    /// The property as T, or nullopt when absent or of another type.
    template <typename T> std::optional<T> get_property(std::string_view key) const
    {
        std::lock_guard<std::mutex> lock(m_properties_mutex);
        auto it = m_properties.find(key);
        if (it == m_properties.end())
        {
            return std::nullopt;
        }
        if (const T *value = std::any_cast<T>(&it->second))
        {
            return *value;
        }
        return std::nullopt;
    }

    /**
     * @brief Copies @p other's properties into this context.
     * @param overwrite When false, keys already present here are kept.
     */
    void merge_properties(const PipelineContext &other, bool overwrite = true);

    // ====================================================================
    // Cancellation and deadline
    // ====================================================================

    void cancel() noexcept;
    bool is_cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    void set_deadline(Clock::time_point deadline);
    /// Deadline = now + @p timeout.
    void set_timeout(Clock::duration timeout);
    void clear_deadline();
    std::optional<Clock::time_point> deadline() const;
    bool deadline_exceeded() const;

    /// Time left before the deadline; nullopt when there is none. Never negative.
    std::optional<Clock::duration> remaining() const;

    /// Cancelled or past the deadline.
    bool should_stop() const { return is_cancelled() || deadline_exceeded(); }

    /**
     * @brief Cooperative sleep for behaviors doing slow work.
     * @details Returns early when the context is cancelled or its deadline passes.
     * @return should_stop() on return.
     */
    bool wait_for_stop(Clock::duration max_wait) const;

    // ====================================================================
    // Timing
    // ====================================================================

    /// Records the start time; only the first call has an effect.
    void mark_start();
    void mark_end();
    /// end - start, or now - start while running, or zero before start.
    Clock::duration elapsed() const;

    /**
     * @brief A new context with a fresh id, the same input and result, and a copy of the
     *        properties. Cancellation state and deadline are not copied.
     */
    std::unique_ptr<PipelineContext> copy() const;

    std::string to_string() const;

  private:
    void notify_stop_waiters() const;

    std::string m_id;
    std::chrono::system_clock::time_point m_created_at;

    std::any m_input;
    std::any m_result;

    mutable std::mutex m_properties_mutex;
    std::map<std::string, std::any, format_tools::CaseInsensitiveLess> m_properties;

    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_stop_mutex; // guards m_deadline and pairs with m_stop_cv
    mutable std::condition_variable m_stop_cv;
    std::optional<Clock::time_point> m_deadline;

    mutable std::mutex m_timing_mutex;
    std::optional<Clock::time_point> m_started;
    std::optional<Clock::time_point> m_ended;
};

/**
 * @brief Installs a nested deadline for the lifetime of the scope.
 *
 * The effective deadline is the earlier of @p nested and the context's current deadline.
 * The previous deadline is restored on destruction.
 */
class CONDUIT_RUNTIME_EXPORT DeadlineScope
{
  public:
    DeadlineScope(PipelineContext &ctx, std::optional<PipelineContext::Clock::time_point> nested);
    ~DeadlineScope();

    DeadlineScope(const DeadlineScope &) = delete;
    DeadlineScope &operator=(const DeadlineScope &) = delete;

    std::optional<PipelineContext::Clock::time_point> effective() const noexcept
    {
        return m_effective;
    }

  private:
    PipelineContext &m_ctx;
    std::optional<PipelineContext::Clock::time_point> m_previous;
    std::optional<PipelineContext::Clock::time_point> m_effective;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
