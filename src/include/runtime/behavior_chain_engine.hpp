#pragma once
/**
 * @file behavior_chain_engine.hpp
 * @brief Owner of the active behavior chain.
 *
 * The engine keeps the contributions of each running component and publishes the chain
 * built from them as an immutable snapshot. Every change (a component's contributions
 * added or removed, a contribution enabled or disabled, a new terminal or timeout)
 * builds a new snapshot under the rebuild mutex and swaps it in atomically. A request
 * takes one snapshot at its start and runs against it to completion, so it observes a
 * component's contributions either entirely or not at all.
 *
 * A replaced snapshot stays alive for as long as a request (or any other holder) keeps
 * it. The engine remembers every replaced snapshot that still had holders when it was
 * swapped out, so wait_for_release() can tell when no request can reach a component's
 * behaviors any more.
 */
#include "conduit_runtime_export.h"
#include "runtime/behavior_chain.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

class CONDUIT_RUNTIME_EXPORT BehaviorChainEngine
{
  public:
    BehaviorChainEngine();
    ~BehaviorChainEngine();

    BehaviorChainEngine(const BehaviorChainEngine &) = delete;
    BehaviorChainEngine &operator=(const BehaviorChainEngine &) = delete;

    /**
     * @brief Installs @p contributions as the full set owned by @p component_id.
     * @details Replaces any set the component already had. Contributions without an
     *          owner are stamped with @p component_id.
     * @throws std::invalid_argument if a contribution is invalid or its id is already
     *         used by another component. The active chain is unchanged in that case.
     */
    void add_contributions(const std::string &component_id,
                           std::vector<BehaviorContribution> contributions);

    /// @return false if the component had no contributions.
    bool remove_contributions(const std::string &component_id);

    /// @return false if no contribution has @p contribution_id.
    bool set_enabled(const std::string &contribution_id, bool enabled);

    void set_terminal(BehaviorChain::Terminal terminal);

    /// Timeout applied by run(); nullopt runs without a deadline.
    void set_default_timeout(std::optional<PipelineContext::Clock::duration> timeout);

    /// The current chain. Never null.
    std::shared_ptr<const BehaviorChain> snapshot() const;

    /// Runs @p ctx against the current snapshot.
    BehaviorChain::ChainResult run(PipelineContext &ctx) const;

    bool has_contributions(const std::string &component_id) const;
    std::vector<std::string> contributing_components() const;
    std::vector<BehaviorContribution> contributions_of(const std::string &component_id) const;

    /// Incremented by every rebuild.
    uint64_t generation() const;

    /// True while the active snapshot or a replaced one that is still held contains a
    /// behavior owned by @p component_id.
    bool is_referenced(const std::string &component_id) const;

    /**
     * @brief Waits until is_referenced(@p component_id) is false.
     * @details Polls every 10 ms. A zero timeout checks once.
     * @return false if the component was still referenced when @p timeout elapsed.
     */
    bool wait_for_release(const std::string &component_id,
                          std::chrono::milliseconds timeout) const;

  private:
    // Caller holds m_mutex.
    void rebuild_locked();
    void prune_retired_locked() const;

    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<BehaviorContribution>> m_by_component;
    BehaviorChain::Terminal m_terminal;
    std::optional<PipelineContext::Clock::duration> m_default_timeout;
    uint64_t m_generation{0};

    std::atomic<std::shared_ptr<const BehaviorChain>> m_active;

    // Replaced snapshots that still had holders when they were swapped out.
    mutable std::vector<std::weak_ptr<const BehaviorChain>> m_retired;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
