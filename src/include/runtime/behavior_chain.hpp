#pragma once
/**
 * @file behavior_chain.hpp
 * @brief An immutable, ordered chain of behavior contributions and its dispatcher.
 *
 * The chain stores its contributions as a flat array sorted by (priority, id). A single
 * index-based dispatcher runs entry i with a continuation that dispatches i + 1; the
 * continuation past the last entry is the terminal, which by default returns the
 * context's current result.
 *
 * Before each entry the dispatcher checks the context: once it is cancelled or past its
 * deadline no further behavior is invoked. run() is the only watchdog. It installs the
 * chain's timeout as a deadline on the context and, after the dispatch unwinds, turns
 * cancellation and an exceeded deadline into a ChainFailure. A behavior that throws
 * without an error handler propagates the exception out of run() unchanged.
 */
#include "conduit_runtime_export.h"
#include "runtime/behavior.hpp"
#include "runtime/pipeline_context.hpp"
#include "utils/result.hpp"

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

enum class ChainFailureKind : int
{
    Cancelled = 0,
    Timeout
};

CONDUIT_RUNTIME_EXPORT const char *to_string(ChainFailureKind kind) noexcept;

struct ChainFailure
{
    ChainFailureKind kind{ChainFailureKind::Cancelled};
    std::string message;
    PipelineContext::Clock::duration elapsed{};
};

class CONDUIT_RUNTIME_EXPORT BehaviorChain
{
  public:
    using Terminal = Behavior::Next;
    using ChainResult = utils::Result<std::any, ChainFailure>;

    /// Empty chain; run() returns the context's result.
    BehaviorChain() = default;

    /**
     * @brief Builds a chain from the enabled entries of @p contributions.
     * @param terminal Continuation after the last behavior. Empty means "return ctx.result()".
     * @throws std::invalid_argument if an enabled contribution has no id or no behavior.
     */
    static BehaviorChain build(const std::vector<BehaviorContribution> &contributions,
                               Terminal terminal = {}, uint64_t generation = 0);

    /// Runs under the chain's timeout, if any, and reports Cancelled/Timeout as failures.
    ChainResult run(PipelineContext &ctx) const;

    /**
     * @brief Runs the chain without the watchdog: returns whatever the dispatch returns.
     * @details Returns an empty value if the context stops before the chain completes.
     */
    std::any invoke(PipelineContext &ctx) const { return dispatch(0, ctx); }

    /// A copy of this chain that run() bounds with @p timeout.
    BehaviorChain with_timeout(PipelineContext::Clock::duration timeout) const;

    std::optional<PipelineContext::Clock::duration> timeout() const noexcept { return m_timeout; }

    size_t size() const noexcept { return m_entries.size(); }
    bool empty() const noexcept { return m_entries.empty(); }
    uint64_t generation() const noexcept { return m_generation; }

    /// Ids in execution order.
    std::vector<std::string> behavior_ids() const;
    const std::vector<BehaviorContribution> &contributions() const noexcept { return m_entries; }

    /// True if any entry is owned by @p component_id.
    bool contains_owner(const std::string &component_id) const;

    static std::any default_terminal(PipelineContext &ctx) { return ctx.result(); }

  private:
    std::any dispatch(size_t index, PipelineContext &ctx) const;
    std::any execute_entry(const BehaviorContribution &entry, const Behavior::Next &next,
                           PipelineContext &ctx) const;

    std::vector<BehaviorContribution> m_entries;
    Terminal m_terminal;
    std::optional<PipelineContext::Clock::duration> m_timeout;
    uint64_t m_generation{0};
};

/// Same as `BehaviorChain::build(contributions, terminal)`.
CONDUIT_RUNTIME_EXPORT BehaviorChain BuildChain(const std::vector<BehaviorContribution> &contributions,
                                                BehaviorChain::Terminal terminal = {});

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
