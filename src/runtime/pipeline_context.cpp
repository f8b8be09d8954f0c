/**
 * @file pipeline_context.cpp
 * @brief Per-request property bag, cancellation and deadline tracking.
 */
#include "cdt_base.hpp"
#include "runtime/pipeline_context.hpp"

namespace conduit::runtime
{

namespace
{
std::atomic<uint64_t> g_context_counter{0};

std::string make_context_id()
{
    return fmt::format("ctx-{:x}-{:06x}", platform::monotonic_time_ns(),
                       g_context_counter.fetch_add(1, std::memory_order_relaxed));
}
} // namespace

PipelineContext::PipelineContext()
    : m_id(make_context_id()), m_created_at(std::chrono::system_clock::now())
{
}

PipelineContext::PipelineContext(std::any input) : PipelineContext()
{
    m_input = std::move(input);
}

PipelineContext::~PipelineContext() = default;

// ============================================================================
// Properties
// ============================================================================

void PipelineContext::set_property(std::string_view key, std::any value)
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    auto it = m_properties.find(key);
    if (it != m_properties.end())
    {
        it->second = std::move(value);
        return;
    }
    m_properties.emplace(std::string(key), std::move(value));
}

bool PipelineContext::has_property(std::string_view key) const
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    return m_properties.find(key) != m_properties.end();
}

bool PipelineContext::remove_property(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    auto it = m_properties.find(key);
    if (it == m_properties.end())
    {
        return false;
    }
    m_properties.erase(it);
    return true;
}

std::optional<std::any> PipelineContext::property(std::string_view key) const
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    auto it = m_properties.find(key);
    if (it == m_properties.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PipelineContext::property_keys() const
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    std::vector<std::string> keys;
    keys.reserve(m_properties.size());
    for (const auto &[key, value] : m_properties)
    {
        keys.push_back(key);
    }
    return keys;
}

size_t PipelineContext::property_count() const
{
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    return m_properties.size();
}

void PipelineContext::merge_properties(const PipelineContext &other, bool overwrite)
{
    if (&other == this)
    {
        return;
    }
    std::map<std::string, std::any, format_tools::CaseInsensitiveLess> incoming;
    {
        std::lock_guard<std::mutex> lock(other.m_properties_mutex);
        incoming = other.m_properties;
    }
    std::lock_guard<std::mutex> lock(m_properties_mutex);
    for (auto &[key, value] : incoming)
    {
        auto it = m_properties.find(key);
        if (it == m_properties.end())
        {
            m_properties.emplace(key, std::move(value));
        }
        else if (overwrite)
        {
            it->second = std::move(value);
        }
    }
}

// ============================================================================
// Cancellation and deadline
// ============================================================================

void PipelineContext::notify_stop_waiters() const
{
    {
        // Taking the lock orders the notification after a waiter's predicate check.
        std::lock_guard<std::mutex> lock(m_stop_mutex);
    }
    m_stop_cv.notify_all();
}

void PipelineContext::cancel() noexcept
{
    m_cancelled.store(true, std::memory_order_release);
    try
    {
        notify_stop_waiters();
    }
    catch (const std::system_error &)
    {
        // Waiters still observe the flag at their next wake-up.
    }
}

void PipelineContext::set_deadline(Clock::time_point deadline)
{
    {
        std::lock_guard<std::mutex> lock(m_stop_mutex);
        m_deadline = deadline;
    }
    m_stop_cv.notify_all();
}

void PipelineContext::set_timeout(Clock::duration timeout)
{
    set_deadline(Clock::now() + timeout);
}

void PipelineContext::clear_deadline()
{
    std::lock_guard<std::mutex> lock(m_stop_mutex);
    m_deadline.reset();
}

std::optional<PipelineContext::Clock::time_point> PipelineContext::deadline() const
{
    std::lock_guard<std::mutex> lock(m_stop_mutex);
    return m_deadline;
}

bool PipelineContext::deadline_exceeded() const
{
    const auto dl = deadline();
    return dl.has_value() && Clock::now() >= *dl;
}

std::optional<PipelineContext::Clock::duration> PipelineContext::remaining() const
{
    const auto dl = deadline();
    if (!dl)
    {
        return std::nullopt;
    }
    const auto now = Clock::now();
    return now >= *dl ? Clock::duration::zero() : *dl - now;
}

bool PipelineContext::wait_for_stop(Clock::duration max_wait) const
{
    std::unique_lock<std::mutex> lock(m_stop_mutex);
    const auto until = Clock::now() + max_wait;
    const auto stop_now = [this]()
    {
        return m_cancelled.load(std::memory_order_acquire) ||
               (m_deadline.has_value() && Clock::now() >= *m_deadline);
    };
    while (!stop_now())
    {
        auto wake = until;
        if (m_deadline.has_value() && *m_deadline < wake)
        {
            wake = *m_deadline;
        }
        if (Clock::now() >= until)
        {
            break;
        }
        m_stop_cv.wait_until(lock, wake);
    }
    return stop_now();
}

// ============================================================================
// Timing
// ============================================================================

void PipelineContext::mark_start()
{
    std::lock_guard<std::mutex> lock(m_timing_mutex);
    if (!m_started)
    {
        m_started = Clock::now();
    }
}

void PipelineContext::mark_end()
{
    std::lock_guard<std::mutex> lock(m_timing_mutex);
    m_ended = Clock::now();
}

PipelineContext::Clock::duration PipelineContext::elapsed() const
{
    std::lock_guard<std::mutex> lock(m_timing_mutex);
    if (!m_started)
    {
        return Clock::duration::zero();
    }
    return (m_ended ? *m_ended : Clock::now()) - *m_started;
}

std::unique_ptr<PipelineContext> PipelineContext::copy() const
{
    auto clone = std::make_unique<PipelineContext>(m_input);
    clone->m_result = m_result;
    clone->merge_properties(*this);
    return clone;
}

std::string PipelineContext::to_string() const
{
    const auto elapsed_us =
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();
    return fmt::format("PipelineContext[{}] properties={} cancelled={} deadline={} elapsed={}us",
                       m_id, property_count(), is_cancelled(), deadline().has_value() ? "set" : "none",
                       elapsed_us);
}

// ============================================================================
// DeadlineScope
// ============================================================================

DeadlineScope::DeadlineScope(PipelineContext &ctx,
                             std::optional<PipelineContext::Clock::time_point> nested)
    : m_ctx(ctx), m_previous(ctx.deadline())
{
    m_effective = m_previous;
    if (nested && (!m_effective || *nested < *m_effective))
    {
        m_effective = nested;
    }
    if (m_effective)
    {
        m_ctx.set_deadline(*m_effective);
    }
}

DeadlineScope::~DeadlineScope()
{
    if (m_previous)
    {
        m_ctx.set_deadline(*m_previous);
    }
    else
    {
        m_ctx.clear_deadline();
    }
}

} // namespace conduit::runtime
