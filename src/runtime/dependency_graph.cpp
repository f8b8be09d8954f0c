/**
 * @file dependency_graph.cpp
 * @brief Kahn's-algorithm resolver and graph queries.
 */
#include "cdt_base.hpp"
#include "runtime/dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <functional>

namespace conduit::runtime
{

DependencyGraph DependencyGraph::from_descriptors(const std::vector<ComponentDescriptor> &descriptors)
{
    DependencyGraph graph;
    for (const auto &desc : descriptors)
    {
        graph.add_node(desc.id, desc.dependencies, desc.optional_dependencies);
    }
    return graph;
}

bool DependencyGraph::add_node(const std::string &id, std::set<std::string> dependencies,
                               std::set<std::string> optional_dependencies)
{
    if (m_nodes.find(id) != m_nodes.end())
    {
        m_duplicates.push_back(id);
        return false;
    }
    // A dependency listed both ways is required.
    for (const auto &dep : dependencies)
    {
        optional_dependencies.erase(dep);
    }
    m_nodes.emplace(id, Node{std::move(dependencies), std::move(optional_dependencies)});
    return true;
}

bool DependencyGraph::remove_node(std::string_view id)
{
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
    {
        return false;
    }
    m_nodes.erase(it);
    return true;
}

bool DependencyGraph::contains(std::string_view id) const
{
    return m_nodes.find(id) != m_nodes.end();
}

std::set<std::string> DependencyGraph::present_edges(const Node &node) const
{
    std::set<std::string> edges;
    for (const auto &dep : node.dependencies)
    {
        if (contains(dep))
        {
            edges.insert(dep);
        }
    }
    for (const auto &dep : node.optional_dependencies)
    {
        if (contains(dep))
        {
            edges.insert(dep);
        }
    }
    return edges;
}

std::set<std::string> DependencyGraph::eliminate(std::vector<std::string> &order) const
{
    std::map<std::string, size_t, std::less<>> in_degree;
    std::map<std::string, std::vector<std::string>, std::less<>> dependents;
    for (const auto &[id, node] : m_nodes)
    {
        const auto edges = present_edges(node);
        in_degree[id] = edges.size();
        for (const auto &dep : edges)
        {
            dependents[dep].push_back(id);
        }
    }

    std::set<std::string> ready;
    for (const auto &[id, degree] : in_degree)
    {
        if (degree == 0)
        {
            ready.insert(id);
        }
    }

    order.clear();
    order.reserve(m_nodes.size());
    while (!ready.empty())
    {
        std::string next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        auto it = dependents.find(next);
        if (it == dependents.end())
        {
            continue;
        }
        for (const auto &dependent : it->second)
        {
            if (--in_degree[dependent] == 0)
            {
                ready.insert(dependent);
            }
        }
    }

    std::set<std::string> unresolved;
    for (const auto &[id, degree] : in_degree)
    {
        if (degree != 0)
        {
            unresolved.insert(id);
        }
    }
    return unresolved;
}

std::vector<std::string> DependencyGraph::walk_cycle(const std::set<std::string> &unresolved) const
{
    if (unresolved.empty())
    {
        return {};
    }
    std::vector<std::string> path;
    std::map<std::string, size_t> position;
    std::string current = *unresolved.begin();
    while (position.find(current) == position.end())
    {
        position[current] = path.size();
        path.push_back(current);

        // Every unresolved node has at least one unresolved dependency.
        const auto edges = present_edges(m_nodes.find(current)->second);
        auto next = std::find_if(edges.begin(), edges.end(),
                                 [&](const std::string &dep) { return unresolved.count(dep) != 0; });
        if (next == edges.end())
        {
            CDT_PANIC("DependencyGraph: unresolved node '{}' has no unresolved dependency.",
                      current);
        }
        current = *next;
    }
    return {path.begin() + static_cast<std::ptrdiff_t>(position[current]), path.end()};
}

utils::Result<ResolutionPlan, ResolveError> DependencyGraph::resolve() const
{
    using R = utils::Result<ResolutionPlan, ResolveError>;

    if (!m_duplicates.empty())
    {
        ResolveError err;
        err.code = RuntimeErrorCode::DuplicateComponentId;
        err.component_id = m_duplicates.front();
        err.message = fmt::format("duplicate component id '{}'", err.component_id);
        return R::error(std::move(err));
    }

    const auto missing = missing_dependencies();
    if (!missing.empty())
    {
        ResolveError err;
        err.code = RuntimeErrorCode::UnknownDependency;
        err.component_id = missing.front().first;
        err.dependency_id = missing.front().second;
        err.message = fmt::format("component '{}' depends on unknown component '{}'",
                                  err.component_id, err.dependency_id);
        return R::error(std::move(err));
    }

    ResolutionPlan plan;
    const auto unresolved = eliminate(plan.start_order);
    if (!unresolved.empty())
    {
        ResolveError err;
        err.code = RuntimeErrorCode::CyclicDependency;
        err.cycle = walk_cycle(unresolved);
        err.component_id = err.cycle.empty() ? std::string{} : err.cycle.front();
        err.message =
            fmt::format("cyclic dependency: {}", format_tools::format_cycle(err.cycle));
        return R::error(std::move(err));
    }
    return R::ok(std::move(plan));
}

std::vector<std::pair<std::string, std::string>> DependencyGraph::missing_dependencies() const
{
    std::vector<std::pair<std::string, std::string>> missing;
    for (const auto &[id, node] : m_nodes)
    {
        for (const auto &dep : node.dependencies)
        {
            if (!contains(dep))
            {
                missing.emplace_back(id, dep);
            }
        }
    }
    return missing;
}

std::set<std::string> DependencyGraph::dependencies_of(std::string_view id) const
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? std::set<std::string>{} : it->second.dependencies;
}

std::set<std::string> DependencyGraph::optional_dependencies_of(std::string_view id) const
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? std::set<std::string>{} : it->second.optional_dependencies;
}

std::set<std::string> DependencyGraph::dependents_of(std::string_view id) const
{
    std::set<std::string> result;
    for (const auto &[other, node] : m_nodes)
    {
        if (node.dependencies.count(std::string(id)) != 0 ||
            node.optional_dependencies.count(std::string(id)) != 0)
        {
            result.insert(other);
        }
    }
    return result;
}

namespace
{
std::set<std::string> closure(std::string_view start,
                              const std::function<std::set<std::string>(std::string_view)> &step)
{
    std::set<std::string> seen;
    std::deque<std::string> pending;
    for (auto &s : step(start))
    {
        pending.push_back(s);
    }
    while (!pending.empty())
    {
        std::string cur = std::move(pending.front());
        pending.pop_front();
        if (!seen.insert(cur).second)
        {
            continue;
        }
        for (auto &s : step(cur))
        {
            pending.push_back(s);
        }
    }
    seen.erase(std::string(start));
    return seen;
}
} // namespace

std::set<std::string> DependencyGraph::transitive_dependencies(std::string_view id) const
{
    return closure(id,
                   [this](std::string_view cur)
                   {
                       auto it = m_nodes.find(cur);
                       return it == m_nodes.end() ? std::set<std::string>{}
                                                  : present_edges(it->second);
                   });
}

std::set<std::string> DependencyGraph::transitive_dependents(std::string_view id) const
{
    return closure(id, [this](std::string_view cur) { return dependents_of(cur); });
}

std::vector<std::string> DependencyGraph::roots() const
{
    std::vector<std::string> result;
    for (const auto &[id, node] : m_nodes)
    {
        if (present_edges(node).empty())
        {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> DependencyGraph::leaves() const
{
    std::vector<std::string> result;
    for (const auto &[id, node] : m_nodes)
    {
        if (dependents_of(id).empty())
        {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> DependencyGraph::find_cycle() const
{
    std::vector<std::string> order;
    return walk_cycle(eliminate(order));
}

GraphStatistics DependencyGraph::statistics() const
{
    GraphStatistics stats;
    stats.node_count = m_nodes.size();
    for (const auto &[id, node] : m_nodes)
    {
        for (const auto &dep : node.dependencies)
        {
            if (contains(dep))
            {
                ++stats.required_edges;
            }
            else
            {
                ++stats.missing_edges;
            }
        }
        for (const auto &dep : node.optional_dependencies)
        {
            if (contains(dep))
            {
                ++stats.optional_edges;
            }
        }
    }
    stats.edge_count = stats.required_edges + stats.optional_edges;
    stats.root_count = roots().size();
    stats.leaf_count = leaves().size();

    std::vector<std::string> order;
    eliminate(order);
    std::map<std::string, size_t> depth;
    for (const auto &id : order)
    {
        size_t d = 0;
        for (const auto &dep : present_edges(m_nodes.find(id)->second))
        {
            d = std::max(d, depth[dep] + 1);
        }
        depth[id] = d;
        stats.max_depth = std::max(stats.max_depth, d);
    }
    return stats;
}

utils::Result<ResolutionPlan, ResolveError> Resolve(const std::vector<ComponentDescriptor> &descriptors)
{
    return DependencyGraph::from_descriptors(descriptors).resolve();
}

} // namespace conduit::runtime
