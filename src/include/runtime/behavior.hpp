#pragma once
/**
 * @file behavior.hpp
 * @brief The Behavior capability and the contributions components publish to the chain.
 *
 * A behavior is one step of request processing:
 * @code
 *   std::any execute(PipelineContext &ctx, const Next &next);
 * @endcode
 * `next` runs the rest of the chain. A behavior that does not call it short-circuits
 * the request and its return value becomes the chain's result.
 */
#include "conduit_runtime_export.h"
#include "runtime/pipeline_context.hpp"

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

class CONDUIT_RUNTIME_EXPORT Behavior
{
  public:
    using Next = std::function<std::any(PipelineContext &)>;

    virtual ~Behavior() = default;
    virtual std::any execute(PipelineContext &ctx, const Next &next) = 0;
};

/// Adapts a callable `std::any(PipelineContext&, const Behavior::Next&)` to Behavior.
class CONDUIT_RUNTIME_EXPORT FunctionBehavior : public Behavior
{
  public:
    using Function = std::function<std::any(PipelineContext &, const Next &)>;

    explicit FunctionBehavior(Function fn) : m_fn(std::move(fn)) {}

    std::any execute(PipelineContext &ctx, const Next &next) override { return m_fn(ctx, next); }

  private:
    Function m_fn;
};

template <typename F> std::shared_ptr<Behavior> make_behavior(F &&fn)
{
    return std::make_shared<FunctionBehavior>(FunctionBehavior::Function(std::forward<F>(fn)));
}

/// Descriptive only; ordering is by priority.
enum class BehaviorPhase : int
{
    PreProcessing = 0,
    Processing,
    PostProcessing
};

CONDUIT_RUNTIME_EXPORT const char *to_string(BehaviorPhase phase) noexcept;

using Constraint = std::function<bool(const PipelineContext &)>;

/// Converts a fault raised by the behavior itself into a result.
using ErrorHandler = std::function<std::any(std::exception_ptr, PipelineContext &)>;

struct RetryPolicy
{
    int max_attempts{1}; ///< Total attempts, including the first.
    std::chrono::milliseconds delay{0};
};

inline constexpr int kDefaultBehaviorPriority = 1000;

struct CONDUIT_RUNTIME_EXPORT BehaviorContribution
{
    std::string id;
    std::string name;
    std::string description;
    std::shared_ptr<Behavior> behavior;
    int priority{kDefaultBehaviorPriority}; ///< Lower runs earlier.
    BehaviorPhase phase{BehaviorPhase::Processing};
    Constraint constraint; ///< Empty means always.
    std::set<std::string> tags;
    bool enabled{true};
    std::string owner_component_id;
    ErrorHandler error_handler; ///< Empty means faults propagate.
    RetryPolicy retry;

    bool applies_to(const PipelineContext &ctx) const { return !constraint || constraint(ctx); }
    bool has_tag(std::string_view tag) const { return tags.find(std::string(tag)) != tags.end(); }

    std::string to_string() const;
};

/**
 * @brief Fluent builder.
 *
 * @code
 * auto auth = BehaviorContributionBuilder("auth.check")
 *                 .with_behavior(make_behavior(check_token))
 *                 .with_priority(10)
 *                 .in_phase(BehaviorPhase::PreProcessing)
 *                 .when(when_property_exists("Authorization"))
 *                 .build();
 * @endcode
 */
class CONDUIT_RUNTIME_EXPORT BehaviorContributionBuilder
{
  public:
    explicit BehaviorContributionBuilder(std::string id);

    BehaviorContributionBuilder &with_name(std::string name);
    BehaviorContributionBuilder &with_description(std::string description);
    BehaviorContributionBuilder &with_behavior(std::shared_ptr<Behavior> behavior);
    BehaviorContributionBuilder &with_priority(int priority);
    BehaviorContributionBuilder &in_phase(BehaviorPhase phase);
    BehaviorContributionBuilder &when(Constraint constraint);
    BehaviorContributionBuilder &with_tag(std::string tag);
    BehaviorContributionBuilder &enabled(bool enabled);
    BehaviorContributionBuilder &owned_by(std::string component_id);
    BehaviorContributionBuilder &on_error(ErrorHandler handler);
    BehaviorContributionBuilder &with_retry(int max_attempts, std::chrono::milliseconds delay);

    /**
     * @throws std::invalid_argument if the id is empty, no behavior was set, or the
     *                               retry attempt count is below one.
     */
    BehaviorContribution build() const;

  private:
    BehaviorContribution m_contribution;
};

/// Throws std::invalid_argument when @p contribution cannot be placed in a chain.
CONDUIT_RUNTIME_EXPORT void validate_contribution(const BehaviorContribution &contribution);

// ====================================================================
// Collection helpers
// ====================================================================

CONDUIT_RUNTIME_EXPORT std::vector<BehaviorContribution>
with_tags(const std::vector<BehaviorContribution> &contributions, const std::set<std::string> &tags);

CONDUIT_RUNTIME_EXPORT std::vector<BehaviorContribution>
enabled_only(const std::vector<BehaviorContribution> &contributions);

CONDUIT_RUNTIME_EXPORT std::map<BehaviorPhase, std::vector<BehaviorContribution>>
group_by_phase(const std::vector<BehaviorContribution> &contributions);

/// Stable order: ascending priority, ties by id.
CONDUIT_RUNTIME_EXPORT std::vector<BehaviorContribution>
sort_by_priority(std::vector<BehaviorContribution> contributions);

// ====================================================================
// Constraint combinators
// ====================================================================

CONDUIT_RUNTIME_EXPORT Constraint always();
CONDUIT_RUNTIME_EXPORT Constraint never();
CONDUIT_RUNTIME_EXPORT Constraint all_of(std::vector<Constraint> constraints);
CONDUIT_RUNTIME_EXPORT Constraint any_of(std::vector<Constraint> constraints);
CONDUIT_RUNTIME_EXPORT Constraint negate(Constraint constraint);
CONDUIT_RUNTIME_EXPORT Constraint when_property_exists(std::string key);

/// True when the property holds a T equal to @p expected.
template <typename T> Constraint when_property_equals(std::string key, T expected)
{
    return [key = std::move(key), expected = std::move(expected)](const PipelineContext &ctx)
    {
        const auto value = ctx.get_property<T>(key);
        return value.has_value() && *value == expected;
    };
}

inline Constraint And(Constraint a, Constraint b)
{
    return all_of({std::move(a), std::move(b)});
}

inline Constraint Or(Constraint a, Constraint b)
{
    return any_of({std::move(a), std::move(b)});
}

inline Constraint Not(Constraint a)
{
    return negate(std::move(a));
}

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
