/**
 * @file behavior_chain_engine.cpp
 * @brief Per-component contribution sets, snapshot publication and release tracking.
 */
#include "cdt_service.hpp"
#include "runtime/behavior_chain_engine.hpp"
#include "runtime/component_descriptor.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <thread>

namespace conduit::runtime
{

namespace
{
constexpr std::chrono::milliseconds kReleasePollInterval{10};
}

BehaviorChainEngine::BehaviorChainEngine()
    : m_active(std::make_shared<const BehaviorChain>())
{
}

BehaviorChainEngine::~BehaviorChainEngine() = default;

void BehaviorChainEngine::rebuild_locked()
{
    std::vector<BehaviorContribution> all;
    for (const auto &[component_id, contributions] : m_by_component)
    {
        all.insert(all.end(), contributions.begin(), contributions.end());
    }
    auto chain = BehaviorChain::build(all, m_terminal, ++m_generation);
    if (m_default_timeout)
    {
        chain = chain.with_timeout(*m_default_timeout);
    }
    const auto size = chain.size();
    auto previous = m_active.exchange(std::make_shared<const BehaviorChain>(std::move(chain)),
                                      std::memory_order_acq_rel);
    prune_retired_locked();
    // A snapshot held only here can no longer be reached by any request.
    if (previous && previous.use_count() > 1)
    {
        m_retired.push_back(previous);
    }
    LOGGER_DEBUG("BehaviorChainEngine: published chain generation {} with {} behavior(s).",
                 m_generation, size);
}

void BehaviorChainEngine::add_contributions(const std::string &component_id,
                                            std::vector<BehaviorContribution> contributions)
{
    validate_component_id(component_id);
    std::set<std::string> incoming_ids;
    for (auto &c : contributions)
    {
        validate_contribution(c);
        if (!incoming_ids.insert(c.id).second)
        {
            throw std::invalid_argument(fmt::format(
                "BehaviorChainEngine: component '{}' contributes '{}' twice.", component_id, c.id));
        }
        if (c.owner_component_id.empty())
        {
            c.owner_component_id = component_id;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &[owner, existing] : m_by_component)
    {
        if (owner == component_id)
        {
            continue;
        }
        for (const auto &c : existing)
        {
            if (incoming_ids.count(c.id) != 0)
            {
                throw std::invalid_argument(fmt::format(
                    "BehaviorChainEngine: contribution id '{}' of component '{}' is already "
                    "contributed by '{}'.",
                    c.id, component_id, owner));
            }
        }
    }
    m_by_component[component_id] = std::move(contributions);
    rebuild_locked();
}

bool BehaviorChainEngine::remove_contributions(const std::string &component_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_by_component.erase(component_id) == 0)
    {
        return false;
    }
    rebuild_locked();
    return true;
}

bool BehaviorChainEngine::set_enabled(const std::string &contribution_id, bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &[owner, contributions] : m_by_component)
    {
        for (auto &c : contributions)
        {
            if (c.id == contribution_id)
            {
                if (c.enabled != enabled)
                {
                    c.enabled = enabled;
                    rebuild_locked();
                }
                return true;
            }
        }
    }
    return false;
}

void BehaviorChainEngine::set_terminal(BehaviorChain::Terminal terminal)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_terminal = std::move(terminal);
    rebuild_locked();
}

void BehaviorChainEngine::set_default_timeout(std::optional<PipelineContext::Clock::duration> timeout)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_default_timeout = timeout;
    rebuild_locked();
}

std::shared_ptr<const BehaviorChain> BehaviorChainEngine::snapshot() const
{
    return m_active.load(std::memory_order_acquire);
}

BehaviorChain::ChainResult BehaviorChainEngine::run(PipelineContext &ctx) const
{
    const auto chain = snapshot();
    return chain->run(ctx);
}

bool BehaviorChainEngine::has_contributions(const std::string &component_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_by_component.find(component_id) != m_by_component.end();
}

std::vector<std::string> BehaviorChainEngine::contributing_components() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto &[owner, contributions] : m_by_component)
    {
        ids.push_back(owner);
    }
    return ids;
}

std::vector<BehaviorContribution>
BehaviorChainEngine::contributions_of(const std::string &component_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_by_component.find(component_id);
    return it == m_by_component.end() ? std::vector<BehaviorContribution>{} : it->second;
}

uint64_t BehaviorChainEngine::generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

void BehaviorChainEngine::prune_retired_locked() const
{
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(),
                                   [](const std::weak_ptr<const BehaviorChain> &w)
                                   { return w.expired(); }),
                    m_retired.end());
}

bool BehaviorChainEngine::is_referenced(const std::string &component_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (snapshot()->contains_owner(component_id))
    {
        return true;
    }
    prune_retired_locked();
    for (const auto &weak : m_retired)
    {
        const auto chain = weak.lock();
        if (chain && chain->contains_owner(component_id))
        {
            return true;
        }
    }
    return false;
}

bool BehaviorChainEngine::wait_for_release(const std::string &component_id,
                                           std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (!is_referenced(component_id))
        {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(kReleasePollInterval);
    }
}

} // namespace conduit::runtime
