#include "cdt_base.hpp"
#include "runtime/behavior.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/ranges.h>

namespace conduit::runtime
{

const char *to_string(BehaviorPhase phase) noexcept
{
    switch (phase)
    {
    case BehaviorPhase::PreProcessing:
        return "PreProcessing";
    case BehaviorPhase::Processing:
        return "Processing";
    case BehaviorPhase::PostProcessing:
        return "PostProcessing";
    default:
        return "Unknown";
    }
}

std::string BehaviorContribution::to_string() const
{
    return fmt::format("{} (priority={}, phase={}, enabled={}, owner='{}', tags=[{}])", id,
                       priority, runtime::to_string(phase), enabled, owner_component_id,
                       fmt::join(tags, ","));
}

void validate_contribution(const BehaviorContribution &contribution)
{
    if (contribution.id.empty())
    {
        throw std::invalid_argument("Behavior: contribution id must not be empty.");
    }
    if (!contribution.behavior)
    {
        throw std::invalid_argument(
            fmt::format("Behavior: contribution '{}' has no behavior.", contribution.id));
    }
    if (contribution.retry.max_attempts < 1)
    {
        throw std::invalid_argument(fmt::format(
            "Behavior: contribution '{}' retry max_attempts must be at least 1.", contribution.id));
    }
}

// ============================================================================
// BehaviorContributionBuilder
// ============================================================================

BehaviorContributionBuilder::BehaviorContributionBuilder(std::string id)
{
    m_contribution.id = std::move(id);
    m_contribution.name = m_contribution.id;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::with_name(std::string name)
{
    m_contribution.name = std::move(name);
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::with_description(std::string description)
{
    m_contribution.description = std::move(description);
    return *this;
}

BehaviorContributionBuilder &
BehaviorContributionBuilder::with_behavior(std::shared_ptr<Behavior> behavior)
{
    m_contribution.behavior = std::move(behavior);
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::with_priority(int priority)
{
    m_contribution.priority = priority;
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::in_phase(BehaviorPhase phase)
{
    m_contribution.phase = phase;
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::when(Constraint constraint)
{
    m_contribution.constraint = std::move(constraint);
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::with_tag(std::string tag)
{
    m_contribution.tags.insert(std::move(tag));
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::enabled(bool enabled)
{
    m_contribution.enabled = enabled;
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::owned_by(std::string component_id)
{
    m_contribution.owner_component_id = std::move(component_id);
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::on_error(ErrorHandler handler)
{
    m_contribution.error_handler = std::move(handler);
    return *this;
}

BehaviorContributionBuilder &BehaviorContributionBuilder::with_retry(int max_attempts,
                                                                     std::chrono::milliseconds delay)
{
    m_contribution.retry = RetryPolicy{max_attempts, delay};
    return *this;
}

BehaviorContribution BehaviorContributionBuilder::build() const
{
    validate_contribution(m_contribution);
    return m_contribution;
}

// ============================================================================
// Collection helpers
// ============================================================================

std::vector<BehaviorContribution> with_tags(const std::vector<BehaviorContribution> &contributions,
                                            const std::set<std::string> &tags)
{
    std::vector<BehaviorContribution> out;
    std::copy_if(contributions.begin(), contributions.end(), std::back_inserter(out),
                 [&tags](const BehaviorContribution &c)
                 {
                     return std::any_of(tags.begin(), tags.end(),
                                        [&c](const std::string &t) { return c.has_tag(t); });
                 });
    return out;
}

std::vector<BehaviorContribution> enabled_only(const std::vector<BehaviorContribution> &contributions)
{
    std::vector<BehaviorContribution> out;
    std::copy_if(contributions.begin(), contributions.end(), std::back_inserter(out),
                 [](const BehaviorContribution &c) { return c.enabled; });
    return out;
}

std::map<BehaviorPhase, std::vector<BehaviorContribution>>
group_by_phase(const std::vector<BehaviorContribution> &contributions)
{
    std::map<BehaviorPhase, std::vector<BehaviorContribution>> groups;
    for (const auto &c : contributions)
    {
        groups[c.phase].push_back(c);
    }
    return groups;
}

std::vector<BehaviorContribution> sort_by_priority(std::vector<BehaviorContribution> contributions)
{
    std::stable_sort(contributions.begin(), contributions.end(),
                     [](const BehaviorContribution &a, const BehaviorContribution &b)
                     {
                         if (a.priority != b.priority)
                         {
                             return a.priority < b.priority;
                         }
                         return a.id < b.id;
                     });
    return contributions;
}

// ============================================================================
// Constraints
// ============================================================================

Constraint always()
{
    return [](const PipelineContext &) { return true; };
}

Constraint never()
{
    return [](const PipelineContext &) { return false; };
}

Constraint all_of(std::vector<Constraint> constraints)
{
    return [constraints = std::move(constraints)](const PipelineContext &ctx)
    {
        return std::all_of(constraints.begin(), constraints.end(),
                           [&ctx](const Constraint &c) { return !c || c(ctx); });
    };
}

Constraint any_of(std::vector<Constraint> constraints)
{
    return [constraints = std::move(constraints)](const PipelineContext &ctx)
    {
        return std::any_of(constraints.begin(), constraints.end(),
                           [&ctx](const Constraint &c) { return !c || c(ctx); });
    };
}

Constraint negate(Constraint constraint)
{
    return [constraint = std::move(constraint)](const PipelineContext &ctx)
    { return constraint && !constraint(ctx); };
}

Constraint when_property_exists(std::string key)
{
    return [key = std::move(key)](const PipelineContext &ctx) { return ctx.has_property(key); };
}

} // namespace conduit::runtime
