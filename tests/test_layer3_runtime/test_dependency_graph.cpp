/**
 * @file test_dependency_graph.cpp
 * @brief Start-order resolution, cycle detection and graph queries.
 */
#include "cdt_runtime.hpp"
#include "runtime_test_doubles.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace conduit::runtime;
using conduit::tests::PureApiTest;
using conduit::tests::helper::make_descriptor;

class DependencyGraphTest : public PureApiTest
{
};

TEST_F(DependencyGraphTest, EmptyGraphResolvesToEmptyOrder)
{
    DependencyGraph g;
    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_TRUE(plan.content().start_order.empty());
    EXPECT_FALSE(g.has_cycle());
}

TEST_F(DependencyGraphTest, DependenciesStartFirst)
{
    DependencyGraph g;
    g.add_node("web", {"db", "cache"});
    g.add_node("db");
    g.add_node("cache", {"db"});

    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.content().start_order, (std::vector<std::string>{"db", "cache", "web"}));
    EXPECT_EQ(plan.content().stop_order(), (std::vector<std::string>{"web", "cache", "db"}));
}

// Independent components are ordered by id so the same input always gives one order.
TEST_F(DependencyGraphTest, TiesBreakLexicographically)
{
    DependencyGraph g;
    g.add_node("zeta");
    g.add_node("alpha");
    g.add_node("mid", {"zeta"});
    g.add_node("beta");

    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.content().start_order,
              (std::vector<std::string>{"alpha", "beta", "zeta", "mid"}));
}

TEST_F(DependencyGraphTest, OrderIsIndependentOfInsertionOrder)
{
    const std::vector<ComponentDescriptor> forward = {
        make_descriptor("a"), make_descriptor("b", {"a"}), make_descriptor("c", {"a"}),
        make_descriptor("d", {"b", "c"})};
    std::vector<ComponentDescriptor> backward(forward.rbegin(), forward.rend());

    auto p1 = Resolve(forward);
    auto p2 = Resolve(backward);
    ASSERT_TRUE(p1.is_ok());
    ASSERT_TRUE(p2.is_ok());
    EXPECT_EQ(p1.content().start_order, p2.content().start_order);
    EXPECT_EQ(p1.content().start_order, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(DependencyGraphTest, UnknownDependencyFails)
{
    DependencyGraph g;
    g.add_node("a", {"ghost"});
    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, RuntimeErrorCode::UnknownDependency);
    EXPECT_EQ(plan.error().component_id, "a");
    EXPECT_EQ(plan.error().dependency_id, "ghost");

    const auto missing = g.missing_dependencies();
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], (std::pair<std::string, std::string>{"a", "ghost"}));
}

TEST_F(DependencyGraphTest, DuplicateIdFailsFirst)
{
    DependencyGraph g;
    EXPECT_TRUE(g.add_node("a", {"ghost"}));
    EXPECT_FALSE(g.add_node("a"));
    EXPECT_EQ(g.size(), 1u);
    ASSERT_EQ(g.duplicate_ids().size(), 1u);

    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, RuntimeErrorCode::DuplicateComponentId);
}

TEST_F(DependencyGraphTest, TwoNodeCycleIsReportedInEdgeOrder)
{
    DependencyGraph g;
    g.add_node("D", {"E"});
    g.add_node("E", {"D"});
    g.add_node("F");

    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, RuntimeErrorCode::CyclicDependency);
    EXPECT_EQ(plan.error().cycle, (std::vector<std::string>{"D", "E"}));
    EXPECT_NE(plan.error().message.find("D -> E -> D"), std::string::npos);
    EXPECT_TRUE(g.has_cycle());
}

TEST_F(DependencyGraphTest, SelfDependencyIsACycle)
{
    DependencyGraph g;
    g.add_node("loop", {"loop"});
    EXPECT_EQ(g.find_cycle(), (std::vector<std::string>{"loop"}));
}

// A node that merely depends on a cycle is unresolvable but is not part of the cycle.
TEST_F(DependencyGraphTest, CycleExcludesDownstreamNodes)
{
    DependencyGraph g;
    g.add_node("a", {"b"});
    g.add_node("b", {"c"});
    g.add_node("c", {"b"});
    EXPECT_EQ(g.find_cycle(), (std::vector<std::string>{"b", "c"}));
}

TEST_F(DependencyGraphTest, OptionalDependencyOrdersWhenPresent)
{
    DependencyGraph g;
    g.add_node("a", {}, {"metrics"});
    g.add_node("metrics");
    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.content().start_order, (std::vector<std::string>{"metrics", "a"}));
}

TEST_F(DependencyGraphTest, OptionalDependencyIgnoredWhenAbsent)
{
    DependencyGraph g;
    g.add_node("a", {}, {"metrics"});
    auto plan = g.resolve();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.content().start_order, (std::vector<std::string>{"a"}));
    EXPECT_TRUE(g.missing_dependencies().empty());
}

TEST_F(DependencyGraphTest, RequiredWinsOverOptionalForTheSameTarget)
{
    DependencyGraph g;
    g.add_node("a", {"b"}, {"b"});
    EXPECT_EQ(g.dependencies_of("a"), (std::set<std::string>{"b"}));
    EXPECT_TRUE(g.optional_dependencies_of("a").empty());
}

TEST_F(DependencyGraphTest, RemovedNodeBecomesMissing)
{
    DependencyGraph g;
    g.add_node("a", {"b"});
    g.add_node("b");
    EXPECT_TRUE(g.remove_node("b"));
    EXPECT_FALSE(g.remove_node("b"));
    EXPECT_FALSE(g.contains("b"));
    ASSERT_EQ(g.missing_dependencies().size(), 1u);
}

TEST_F(DependencyGraphTest, TransitiveQueries)
{
    DependencyGraph g;
    g.add_node("app", {"svc"});
    g.add_node("svc", {"db"});
    g.add_node("db");
    g.add_node("tool");

    EXPECT_EQ(g.transitive_dependencies("app"), (std::set<std::string>{"svc", "db"}));
    EXPECT_EQ(g.transitive_dependents("db"), (std::set<std::string>{"svc", "app"}));
    EXPECT_EQ(g.dependents_of("svc"), (std::set<std::string>{"app"}));
    EXPECT_EQ(g.roots(), (std::vector<std::string>{"db", "tool"}));
    EXPECT_EQ(g.leaves(), (std::vector<std::string>{"app", "tool"}));
}

TEST_F(DependencyGraphTest, Statistics)
{
    DependencyGraph g;
    g.add_node("app", {"svc", "ghost"}, {"metrics"});
    g.add_node("svc", {"db"});
    g.add_node("db");
    g.add_node("metrics");

    const auto stats = g.statistics();
    EXPECT_EQ(stats.node_count, 4u);
    EXPECT_EQ(stats.required_edges, 2u);
    EXPECT_EQ(stats.optional_edges, 1u);
    EXPECT_EQ(stats.edge_count, 3u);
    EXPECT_EQ(stats.missing_edges, 1u);
    EXPECT_EQ(stats.max_depth, 2u);
    EXPECT_EQ(stats.root_count, 2u);
    EXPECT_EQ(stats.leaf_count, 1u);
}

TEST_F(DependencyGraphTest, FromDescriptorsRecordsDuplicates)
{
    auto g = DependencyGraph::from_descriptors({make_descriptor("a"), make_descriptor("a")});
    EXPECT_EQ(g.size(), 1u);
    EXPECT_EQ(g.duplicate_ids(), (std::vector<std::string>{"a"}));
}
