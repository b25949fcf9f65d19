/**
 * @file test_status_policy.cpp
 * @brief Unit tests for status parsing, transition warnings and blockers.
 */

#include "policy/status_policy.hpp"

#include <gtest/gtest.h>

using namespace wires;

TEST(ParseStatusTest, AcceptsPersistedLabels) {
    EXPECT_EQ(*parse_status_label("TODO"), Status::Todo);
    EXPECT_EQ(*parse_status_label("IN_PROGRESS"), Status::InProgress);
    EXPECT_EQ(*parse_status_label("DONE"), Status::Done);
    EXPECT_EQ(*parse_status_label("CANCELLED"), Status::Cancelled);
}

TEST(ParseStatusTest, CaseInsensitiveAndDashes) {
    EXPECT_EQ(*parse_status_label("in-progress"), Status::InProgress);
    EXPECT_EQ(*parse_status_label("In_Progress"), Status::InProgress);
    EXPECT_EQ(*parse_status_label("done"), Status::Done);
}

TEST(ParseStatusTest, RejectsUnknown) {
    auto parsed = parse_status_label("blocked");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidStatusValue);
    EXPECT_EQ(parsed.error().message, "Invalid status: blocked");

    EXPECT_FALSE(parse_status_label("").has_value());
    EXPECT_FALSE(parse_status_label("IN PROGRESS").has_value());
}

TEST(WarningsTest, DoneWithOpenDependencies) {
    std::vector<DependencyInfo> deps{
        {"aaaaaaa", "first", Status::Todo},
        {"bbbbbbb", "second", Status::Done},
        {"ccccccc", "third", Status::Cancelled},
        {"ddddddd", "fourth", Status::InProgress},
    };

    auto warnings = warnings_for(Status::Done, deps);
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings[0], (TransitionWarning{"aaaaaaa", Status::Todo}));
    EXPECT_EQ(warnings[1], (TransitionWarning{"ccccccc", Status::Cancelled}));
    EXPECT_EQ(warnings[2], (TransitionWarning{"ddddddd", Status::InProgress}));
    EXPECT_EQ(TransitionWarning::type(), "incomplete_dependency");
}

TEST(WarningsTest, OtherTargetsNeverWarn) {
    std::vector<DependencyInfo> deps{{"aaaaaaa", "first", Status::Todo}};
    EXPECT_TRUE(warnings_for(Status::InProgress, deps).empty());
    EXPECT_TRUE(warnings_for(Status::Cancelled, deps).empty());
    EXPECT_TRUE(warnings_for(Status::Todo, deps).empty());
}

TEST(BlockersTest, OnlyOpenDependenciesBlock) {
    std::vector<DependencyInfo> deps{
        {"aaaaaaa", "first", Status::Todo},
        {"bbbbbbb", "second", Status::Done},
        {"ccccccc", "third", Status::Cancelled},
        {"ddddddd", "fourth", Status::InProgress},
    };
    EXPECT_EQ(blockers(deps), (std::vector<WireId>{"aaaaaaa", "ddddddd"}));
    EXPECT_EQ(blockers(deps).size(), 2u);

    deps.erase(deps.begin());
    deps.pop_back();
    EXPECT_TRUE(blockers(deps).empty());
}

TEST(TransitionTest, EveryTransitionIsAllowedButSomeAreUnusual) {
    EXPECT_TRUE(is_conventional_transition(Status::Todo, Status::InProgress));
    EXPECT_TRUE(is_conventional_transition(Status::InProgress, Status::Done));
    EXPECT_TRUE(is_conventional_transition(Status::Done, Status::Cancelled));
    EXPECT_FALSE(is_conventional_transition(Status::Done, Status::Todo));
    EXPECT_FALSE(is_conventional_transition(Status::Cancelled, Status::InProgress));
}
