/**
 * @file test_dependency_graph.cpp
 * @brief Unit tests for the in-memory DependencyGraph.
 */

#include "core/concepts.hpp"
#include "graph/dependency_graph.hpp"

#include <gtest/gtest.h>

using namespace wires;

static_assert(PrerequisiteSource<DependencyGraph>);

// ─── Helper ──────────────────────────────────

static Wire make_wire(const std::string& id, Status status = Status::Todo, Priority priority = 0) {
    Wire wire;
    wire.id = id;
    wire.title = "Wire " + id;
    wire.status = status;
    wire.priority = priority;
    return wire;
}

static std::vector<WireId> prereqs(const DependencyGraph& graph, const WireId& id) {
    auto result = graph.prerequisites_of(id);
    EXPECT_TRUE(result.has_value());
    return result ? *result : std::vector<WireId>{};
}

// ─── Construction ────────────────────────────

TEST(DependencyGraphTest, AddNodes) {
    DependencyGraph graph;
    graph.add_node(make_wire("a"));
    graph.add_node(make_wire("b"));
    EXPECT_EQ(graph.nodes().size(), 2u);
    ASSERT_NE(graph.find("a"), nullptr);
    EXPECT_EQ(graph.find("a")->title, "Wire a");
    EXPECT_EQ(graph.find("zzz"), nullptr);
}

TEST(DependencyGraphTest, AddNodeReplacesRecord) {
    DependencyGraph graph;
    graph.add_node(make_wire("a"));
    graph.add_node(make_wire("a", Status::Done));
    EXPECT_EQ(graph.nodes().size(), 1u);
    EXPECT_EQ(graph.find("a")->status, Status::Done);
}

TEST(DependencyGraphTest, AddEdgeIsIdempotent) {
    DependencyGraph graph;
    graph.add_node(make_wire("a"));
    graph.add_node(make_wire("b"));

    EXPECT_TRUE(graph.add_edge("a", "b"));
    EXPECT_FALSE(graph.add_edge("a", "b"));
    EXPECT_EQ(prereqs(graph, "a"), (std::vector<WireId>{"b"}));
    EXPECT_TRUE(prereqs(graph, "b").empty());
}

TEST(DependencyGraphTest, PrerequisitesSorted) {
    DependencyGraph graph;
    for (auto id : {"a", "b", "c", "d"}) graph.add_node(make_wire(id));
    graph.add_edge("a", "d");
    graph.add_edge("a", "b");
    graph.add_edge("a", "c");
    EXPECT_EQ(prereqs(graph, "a"), (std::vector<WireId>{"b", "c", "d"}));
}

TEST(DependencyGraphTest, UnknownIdHasNoPrerequisites) {
    DependencyGraph graph;
    EXPECT_TRUE(prereqs(graph, "nope").empty());
}

TEST(DependencyGraphTest, FromSnapshot) {
    std::vector<Wire> wires{make_wire("a"), make_wire("b"), make_wire("c")};
    std::vector<Edge> edges{{"a", "b"}, {"b", "c"}, {"a", "c"}};
    auto graph = DependencyGraph::from(wires, edges);

    EXPECT_EQ(graph.nodes().size(), 3u);
    EXPECT_EQ(prereqs(graph, "a"), (std::vector<WireId>{"b", "c"}));
    EXPECT_EQ(prereqs(graph, "b"), (std::vector<WireId>{"c"}));
}

TEST(DependencyGraphTest, BareEndpointKeepsEdge) {
    auto graph = DependencyGraph::from({make_wire("a")}, {{"a", "ghost"}});
    EXPECT_EQ(graph.nodes().size(), 1u);
    EXPECT_EQ(graph.find("ghost"), nullptr);
    EXPECT_EQ(prereqs(graph, "a"), (std::vector<WireId>{"ghost"}));
}
