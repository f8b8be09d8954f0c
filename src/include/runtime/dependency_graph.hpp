#pragma once
/**
 * @file dependency_graph.hpp
 * @brief Directed "depends-on" graph over component ids and the start-order resolver.
 *
 * Nodes are component ids; an edge A -> B means A depends on B and B must start first.
 * Resolution uses Kahn's algorithm with ties broken by lexicographic id, so the same
 * input always yields the same start order. The graph is built fresh from the current
 * descriptor set each time resolution runs.
 *
 * Optional dependencies order like required ones when the target is present, and are
 * ignored when it is absent.
 */
#include "conduit_runtime_export.h"
#include "runtime/component_descriptor.hpp"
#include "runtime/runtime_errors.hpp"
#include "utils/result.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

/// Outcome of a successful resolution.
struct ResolutionPlan
{
    std::vector<std::string> start_order;

    /// The exact reverse of start_order.
    std::vector<std::string> stop_order() const
    {
        return {start_order.rbegin(), start_order.rend()};
    }
};

/// Why resolution failed.
struct ResolveError
{
    RuntimeErrorCode code{RuntimeErrorCode::None};
    std::string component_id;  ///< Offending component (UnknownDependency, DuplicateComponentId).
    std::string dependency_id; ///< The unknown dependency id (UnknownDependency).
    std::vector<std::string> cycle; ///< Members of one concrete cycle, in edge order.
    std::string message;
};

struct GraphStatistics
{
    size_t node_count{0};
    size_t edge_count{0};      ///< required_edges + optional_edges
    size_t required_edges{0};  ///< Required edges whose target is present.
    size_t optional_edges{0};  ///< Optional edges whose target is present.
    size_t missing_edges{0};   ///< Required edges whose target is absent.
    size_t max_depth{0};       ///< Longest dependency chain among resolvable nodes (roots are 0).
    size_t root_count{0};
    size_t leaf_count{0};
};

class CONDUIT_RUNTIME_EXPORT DependencyGraph
{
  public:
    DependencyGraph() = default;

    /// Builds a graph from descriptors; duplicate ids are recorded, not inserted twice.
    static DependencyGraph from_descriptors(const std::vector<ComponentDescriptor> &descriptors);

    /**
     * @brief Adds a node.
     * @return false if @p id is already present. The duplicate is remembered and makes
     *         resolve() fail with DuplicateComponentId.
     */
    bool add_node(const std::string &id, std::set<std::string> dependencies = {},
                  std::set<std::string> optional_dependencies = {});

    /// Removes a node. Edges pointing at it from other nodes are kept and become missing.
    bool remove_node(std::string_view id);

    bool contains(std::string_view id) const;
    size_t size() const noexcept { return m_nodes.size(); }
    bool empty() const noexcept { return m_nodes.empty(); }
    const std::vector<std::string> &duplicate_ids() const noexcept { return m_duplicates; }

    /**
     * @brief Computes the start order.
     * @details Fails, in this order of precedence, with DuplicateComponentId,
     *          UnknownDependency or CyclicDependency. Never returns a partial order.
     */
    utils::Result<ResolutionPlan, ResolveError> resolve() const;

    /// Every (component, dependency) pair whose required dependency is absent, sorted.
    std::vector<std::pair<std::string, std::string>> missing_dependencies() const;

    std::set<std::string> dependencies_of(std::string_view id) const;
    std::set<std::string> optional_dependencies_of(std::string_view id) const;

    /// Present nodes that depend on @p id, through a required or optional edge.
    std::set<std::string> dependents_of(std::string_view id) const;

    std::set<std::string> transitive_dependencies(std::string_view id) const;
    std::set<std::string> transitive_dependents(std::string_view id) const;

    /// Nodes with no present dependencies.
    std::vector<std::string> roots() const;
    /// Nodes nothing depends on.
    std::vector<std::string> leaves() const;

    /**
     * @brief Finds one concrete cycle.
     * @details Starts at the smallest id that cannot be ordered and follows its smallest
     *          unorderable dependency until an id repeats. Empty when acyclic.
     */
    std::vector<std::string> find_cycle() const;
    bool has_cycle() const { return !find_cycle().empty(); }

    GraphStatistics statistics() const;

  private:
    struct Node
    {
        std::set<std::string> dependencies;
        std::set<std::string> optional_dependencies;
    };

    // Required and optional dependencies that exist in the graph.
    std::set<std::string> present_edges(const Node &node) const;

    // Kahn elimination. Fills @p order and returns the ids that could not be ordered.
    std::set<std::string> eliminate(std::vector<std::string> &order) const;

    std::vector<std::string> walk_cycle(const std::set<std::string> &unresolved) const;

    std::map<std::string, Node, std::less<>> m_nodes;
    std::vector<std::string> m_duplicates;
};

/// Builds a graph from @p descriptors and resolves it.
CONDUIT_RUNTIME_EXPORT utils::Result<ResolutionPlan, ResolveError>
Resolve(const std::vector<ComponentDescriptor> &descriptors);

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
