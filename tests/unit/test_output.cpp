/**
 * @file test_output.cpp
 * @brief Unit tests for JSON, table and DOT rendering.
 */

#include "cli/output.hpp"

#include <gtest/gtest.h>

using namespace wires;
using namespace wires::cli;

// ─── Helper ──────────────────────────────────

static Wire make_wire(const std::string& id, const std::string& title,
                      Status status = Status::Todo) {
    Wire wire;
    wire.id = id;
    wire.title = title;
    wire.status = status;
    wire.created_at = 1700000000;
    wire.updated_at = 1700000100;
    return wire;
}

// ─── JSON ────────────────────────────────────

TEST(OutputJsonTest, WireFieldsInOrder) {
    auto wire = make_wire("a1b2c3d", "Test wire");
    wire.priority = 2;
    EXPECT_EQ(wire_json(wire),
              R"({"id":"a1b2c3d","title":"Test wire","status":"TODO",)"
              R"("created_at":1700000000,"updated_at":1700000100,"priority":2})");
}

TEST(OutputJsonTest, DescriptionOnlyWhenPresent) {
    auto wire = make_wire("a1b2c3d", "Test wire");
    EXPECT_EQ(wire_json(wire).find("description"), std::string::npos);

    wire.description = "line one\nline \"two\"";
    EXPECT_NE(wire_json(wire).find(R"("description":"line one\nline \"two\"")"),
              std::string::npos);
}

TEST(OutputJsonTest, DetailIncludesNeighbours) {
    WireWithDeps detail{make_wire("a1b2c3d", "Main"),
                        {{"b2c3d4e", "Prereq", Status::Done}},
                        {{"c3d4e5f", "Dependent", Status::Todo}}};
    auto json = wire_detail_json(detail);
    EXPECT_NE(json.find(R"("depends_on":[{"id":"b2c3d4e","title":"Prereq","status":"DONE"}])"),
              std::string::npos);
    EXPECT_NE(json.find(R"("blocks":[{"id":"c3d4e5f","title":"Dependent","status":"TODO"}])"),
              std::string::npos);
}

TEST(OutputJsonTest, EmptyLists) {
    EXPECT_EQ(wires_json({}), "[]");
    EXPECT_EQ(wire_details_json({}), "[]");
}

TEST(OutputJsonTest, TransitionWithWarnings) {
    TransitionOutcome outcome{make_wire("a1b2c3d", "Ship", Status::Done),
                              {{"b2c3d4e", Status::Todo}}};
    EXPECT_EQ(transition_json(outcome, false),
              R"({"id":"a1b2c3d","status":"DONE","updated_at":1700000100,)"
              R"("warnings":[{"type":"incomplete_dependency","wire_id":"b2c3d4e","status":"TODO"}]})");
}

TEST(OutputJsonTest, TransitionWithoutWarnings) {
    TransitionOutcome outcome{make_wire("a1b2c3d", "Ship", Status::InProgress), {}};
    auto json = transition_json(outcome, true);
    EXPECT_EQ(json, R"({"id":"a1b2c3d","status":"IN_PROGRESS","priority":0,"updated_at":1700000100})");
}

TEST(OutputJsonTest, Created) {
    EXPECT_EQ(created_json(make_wire("a1b2c3d", "New")),
              R"({"id":"a1b2c3d","title":"New","status":"TODO","priority":0,"created_at":1700000000})");
}

TEST(OutputJsonTest, EdgeAction) {
    EXPECT_EQ(edge_action_json("a1b2c3d", "b2c3d4e", "added"),
              R"({"wire_id":"a1b2c3d","depends_on":"b2c3d4e","action":"added"})");
}

TEST(OutputJsonTest, Graph) {
    auto node = make_wire("a1b2c3d", "A");
    node.priority = 1;
    GraphSnapshot graph{{node, make_wire("b2c3d4e", "B")}, {{"a1b2c3d", "b2c3d4e"}}};
    EXPECT_EQ(graph_json(graph),
              R"({"nodes":[{"id":"a1b2c3d","title":"A","status":"TODO","priority":1},)"
              R"({"id":"b2c3d4e","title":"B","status":"TODO","priority":0}],)"
              R"("edges":[{"from":"a1b2c3d","to":"b2c3d4e"}]})");
}

// ─── Tables ──────────────────────────────────

TEST(OutputTableTest, EmptyList) {
    EXPECT_EQ(wire_table({}), "No wires found.\n");
}

TEST(OutputTableTest, RowWithBlockers) {
    WireWithDeps entry{make_wire("a1b2c3d", "Multi-blocked"),
                       {{"b2c3d4e", "Blocker 1", Status::Todo},
                        {"c3d4e5f", "Blocker 2", Status::InProgress},
                        {"d4e5f6a", "Finished", Status::Done}},
                       {}};
    EXPECT_EQ(wire_table({entry}),
              "○ a1b2c3d  Multi-blocked  ← blocked by b2c3d4e, c3d4e5f\n");
}

TEST(OutputTableTest, CancelledDependencyDoesNotBlock) {
    WireWithDeps entry{make_wire("a1b2c3d", "Free"),
                       {{"b2c3d4e", "Dropped", Status::Cancelled}},
                       {}};
    EXPECT_EQ(wire_table({entry}).find("blocked by"), std::string::npos);
}

TEST(OutputTableTest, Detail) {
    auto wire = make_wire("a1b2c3d", "Test wire", Status::InProgress);
    wire.priority = 2;
    wire.description = "Test description";
    WireWithDeps detail{wire,
                        {{"b2c3d4e", "Dependency", Status::Done}},
                        {{"c3d4e5f", "Blocked task", Status::Todo}}};

    EXPECT_EQ(wire_detail_table(detail),
              "◐ a1b2c3d  Test wire  [pri:2]\n"
              "\n"
              "Test description\n"
              "\n"
              "Depends on:\n"
              "  ● b2c3d4e  Dependency\n"
              "\n"
              "Blocks:\n"
              "  ○ c3d4e5f  Blocked task\n");
}

TEST(OutputTableTest, Ready) {
    EXPECT_EQ(ready_table({}), "No wires ready.\n");
    auto wire = make_wire("a1b2c3d", "Go", Status::InProgress);
    wire.priority = 4;
    EXPECT_EQ(ready_table({wire}), "◐ a1b2c3d  Go  [pri:4]\n");
}

TEST(OutputDotTest, Digraph) {
    GraphSnapshot graph{{make_wire("a1b2c3d", "Say \"hi\""), make_wire("b2c3d4e", "B", Status::Done)},
                        {{"a1b2c3d", "b2c3d4e"}}};
    auto dot = graph_dot(graph);
    EXPECT_EQ(dot.rfind("digraph wires {", 0), 0u);
    EXPECT_NE(dot.find(R"("a1b2c3d" [label="a1b2c3d\nSay \"hi\"")"), std::string::npos);
    EXPECT_NE(dot.find("style=dashed"), std::string::npos);
    EXPECT_NE(dot.find(R"("a1b2c3d" -> "b2c3d4e";)"), std::string::npos);
    EXPECT_EQ(dot.back(), '\n');
}

// ─── Errors & format ─────────────────────────

TEST(OutputErrorTest, JsonWithCycle) {
    Error error{ErrorCode::CircularDependency, "Circular dependency detected: a -> b -> a",
                {"a", "b", "a"}};
    EXPECT_EQ(error_json(error),
              R"({"error":"Circular dependency detected: a -> b -> a","cycle":["a","b","a"]})");
    EXPECT_EQ(error_text(error), "error: Circular dependency detected: a -> b -> a");
}

TEST(OutputErrorTest, JsonPlain) {
    EXPECT_EQ(error_json(Error{ErrorCode::TaskNotFound, "Wire not found: zzzzzzz"}),
              R"({"error":"Wire not found: zzzzzzz"})");
}

TEST(OutputFormatTest, Resolution) {
    EXPECT_EQ(resolve_format(OutputFormat::Json, "table", true), OutputFormat::Json);
    EXPECT_EQ(resolve_format(std::nullopt, "table", false), OutputFormat::Table);
    EXPECT_EQ(resolve_format(std::nullopt, "auto", true), OutputFormat::Table);
    EXPECT_EQ(resolve_format(std::nullopt, "auto", false), OutputFormat::Json);
}
