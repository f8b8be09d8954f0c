/**
 * @file behavior_chain.cpp
 * @brief Index-based chain dispatch with constraint, error-handler and retry wrapping.
 */
#include "cdt_service.hpp"
#include "runtime/behavior_chain.hpp"
#include "runtime/runtime_errors.hpp"

#include <thread>

namespace conduit::runtime
{

const char *to_string(ChainFailureKind kind) noexcept
{
    switch (kind)
    {
    case ChainFailureKind::Cancelled:
        return "Cancelled";
    case ChainFailureKind::Timeout:
        return "Timeout";
    default:
        return "Unknown";
    }
}

BehaviorChain BehaviorChain::build(const std::vector<BehaviorContribution> &contributions,
                                   Terminal terminal, uint64_t generation)
{
    BehaviorChain chain;
    chain.m_entries = sort_by_priority(enabled_only(contributions));
    for (const auto &entry : chain.m_entries)
    {
        validate_contribution(entry);
    }
    chain.m_terminal = std::move(terminal);
    chain.m_generation = generation;
    return chain;
}

BehaviorChain BehaviorChain::with_timeout(PipelineContext::Clock::duration timeout) const
{
    BehaviorChain copy = *this;
    copy.m_timeout = timeout;
    return copy;
}

std::vector<std::string> BehaviorChain::behavior_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto &entry : m_entries)
    {
        ids.push_back(entry.id);
    }
    return ids;
}

bool BehaviorChain::contains_owner(const std::string &component_id) const
{
    for (const auto &entry : m_entries)
    {
        if (entry.owner_component_id == component_id)
        {
            return true;
        }
    }
    return false;
}

std::any BehaviorChain::dispatch(size_t index, PipelineContext &ctx) const
{
    if (ctx.should_stop())
    {
        return {};
    }
    if (index >= m_entries.size())
    {
        return m_terminal ? m_terminal(ctx) : default_terminal(ctx);
    }

    const Behavior::Next next = [this, index](PipelineContext &c) { return dispatch(index + 1, c); };
    const auto &entry = m_entries[index];
    if (!entry.applies_to(ctx))
    {
        LOGGER_TRACE("BehaviorChain[{}]: '{}' skipped by its constraint.", ctx.id(), entry.id);
        return next(ctx);
    }
    return execute_entry(entry, next, ctx);
}

std::any BehaviorChain::execute_entry(const BehaviorContribution &entry, const Behavior::Next &next,
                                      PipelineContext &ctx) const
{
    if (!entry.error_handler && entry.retry.max_attempts <= 1)
    {
        return entry.behavior->execute(ctx, next);
    }

    // Faults raised by the rest of the chain are not this entry's to handle or retry.
    bool next_invoked = false;
    bool fault_from_next = false;
    const Behavior::Next guarded_next = [&next, &next_invoked, &fault_from_next](PipelineContext &c)
    {
        next_invoked = true;
        try
        {
            return next(c);
        }
        catch (...)
        {
            fault_from_next = true;
            throw;
        }
    };

    for (int attempt = 1;; ++attempt)
    {
        next_invoked = false;
        fault_from_next = false;
        try
        {
            return entry.behavior->execute(ctx, guarded_next);
        }
        catch (...)
        {
            if (fault_from_next)
            {
                throw;
            }
            const auto fault = std::current_exception();
            if (!next_invoked && attempt < entry.retry.max_attempts && !ctx.should_stop())
            {
                LOGGER_DEBUG("BehaviorChain[{}]: '{}' attempt {}/{} failed: {}", ctx.id(), entry.id,
                             attempt, entry.retry.max_attempts, describe_exception(fault));
                if (entry.retry.delay.count() > 0)
                {
                    ctx.wait_for_stop(entry.retry.delay);
                }
                continue;
            }
            if (!entry.error_handler)
            {
                throw;
            }
            const auto text = describe_exception(fault);
            LOGGER_WARN("BehaviorChain[{}]: '{}' fault handled: {}", ctx.id(), entry.id, text);
            ctx.set_property(kLastErrorProperty, text);
            return entry.error_handler(fault, ctx);
        }
    }
}

BehaviorChain::ChainResult BehaviorChain::run(PipelineContext &ctx) const
{
    ctx.mark_start();

    std::any result;
    bool deadline_passed = false;
    {
        std::optional<PipelineContext::Clock::time_point> nested;
        if (m_timeout)
        {
            nested = PipelineContext::Clock::now() + *m_timeout;
        }
        DeadlineScope scope(ctx, nested);
        result = dispatch(0, ctx);
        const auto completed_at = PipelineContext::Clock::now();
        deadline_passed = scope.effective().has_value() && completed_at >= *scope.effective();
    }
    ctx.mark_end();

    if (ctx.is_cancelled())
    {
        LOGGER_DEBUG("BehaviorChain[{}]: cancelled.", ctx.id());
        return ChainResult::error(
            ChainFailure{ChainFailureKind::Cancelled, "request was cancelled", ctx.elapsed()});
    }
    if (deadline_passed)
    {
        const auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(ctx.elapsed()).count();
        LOGGER_WARN("BehaviorChain[{}]: deadline exceeded after {} ms.", ctx.id(), elapsed_ms);
        return ChainResult::error(
            ChainFailure{ChainFailureKind::Timeout,
                         fmt::format("deadline exceeded after {} ms", elapsed_ms), ctx.elapsed()});
    }
    return ChainResult::ok(std::move(result));
}

BehaviorChain BuildChain(const std::vector<BehaviorContribution> &contributions,
                         BehaviorChain::Terminal terminal)
{
    return BehaviorChain::build(contributions, std::move(terminal));
}

} // namespace conduit::runtime
