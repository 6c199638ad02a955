#include <gtest/gtest.h>
#include "path_resolver.h"
#include "test_support.h"

using namespace netoverlay;
using netoverlay_test::add_node;
using netoverlay_test::add_segment;

// Checks that steps form a walk from `from` to `to`
static void expect_walk(const NetGraph& g, const std::vector<PathStep>& steps,
                        const std::string& from, const std::string& to) {
    ASSERT_FALSE(steps.empty());
    std::string at = from;
    for (auto& step : steps) {
        const GraphSegment* seg = g.find_segment(step.segment);
        ASSERT_NE(seg, nullptr);
        EXPECT_EQ(entry_node(*seg, step.direction), at);
        at = exit_node(*seg, step.direction);
    }
    EXPECT_EQ(at, to);
}

TEST(PathResolverTest, SingleSegmentForward) {
    NetGraph g;
    add_node(g, "A.out1", 1.0, 1.0);
    add_node(g, "B.in1", 2.0, 1.0);
    add_segment(g, "W1", "A.out1", "B.in1");

    PathResolver resolver(g);
    ResolveResult r = resolver.resolve("A.out1", "B.in1");

    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.steps.size(), 1u);
    EXPECT_EQ(r.steps[0].segment, "W1");
    EXPECT_EQ(r.steps[0].direction, Direction::A_TO_B);
}

TEST(PathResolverTest, TraversesSegmentBackwards) {
    NetGraph g;
    add_node(g, "A.out1", 1.0, 1.0);
    add_node(g, "B.in1", 2.0, 1.0);
    add_segment(g, "W1", "A.out1", "B.in1");

    ResolveResult r = PathResolver(g).resolve("B.in1", "A.out1");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.steps.size(), 1u);
    EXPECT_EQ(r.steps[0].direction, Direction::B_TO_A);
    EXPECT_EQ(direction_str(r.steps[0].direction), "b_to_a");
}

TEST(PathResolverTest, PrefersTwoHopsOverFourHops) {
    NetGraph g;
    for (auto id : {"S.1", "T.1", "j0", "j1", "j2", "j3"}) add_node(g, id, 0.0, 0.0);
    // Long route uses uuids that sort first, so only hop count can pick the short one
    add_segment(g, "a1", "S.1", "j1");
    add_segment(g, "a2", "j1", "j2");
    add_segment(g, "a3", "j2", "j3");
    add_segment(g, "a4", "j3", "T.1");
    add_segment(g, "z1", "S.1", "j0");
    add_segment(g, "z2", "j0", "T.1");

    ResolveResult r = PathResolver(g).resolve("S.1", "T.1");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.steps.size(), 2u);
    EXPECT_EQ(r.steps[0].segment, "z1");
    EXPECT_EQ(r.steps[1].segment, "z2");
    expect_walk(g, r.steps, "S.1", "T.1");
}

TEST(PathResolverTest, EqualLengthRoutesBreakTiesBySegmentUuid) {
    NetGraph g;
    for (auto id : {"S.1", "T.1", "up", "down"}) add_node(g, id, 0.0, 0.0);
    add_segment(g, "m-down-1", "S.1", "down");
    add_segment(g, "m-down-2", "down", "T.1");
    add_segment(g, "k-up-1", "S.1", "up");
    add_segment(g, "k-up-2", "up", "T.1");

    ResolveResult r = PathResolver(g).resolve("S.1", "T.1");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.steps.size(), 2u);
    EXPECT_EQ(r.steps[0].segment, "k-up-1");
    EXPECT_EQ(r.steps[1].segment, "k-up-2");
}

TEST(PathResolverTest, DisconnectedPairIsNoPath) {
    NetGraph g;
    add_node(g, "A.1", 0.0, 0.0);
    add_node(g, "A.2", 1.0, 0.0);
    add_node(g, "B.1", 5.0, 0.0);
    add_node(g, "B.2", 6.0, 0.0);
    add_segment(g, "W1", "A.1", "A.2");
    add_segment(g, "W2", "B.1", "B.2");

    ResolveResult r = PathResolver(g).resolve("A.1", "B.2");
    EXPECT_EQ(r.status, ResolveStatus::NO_PATH);
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.steps.empty());
}

TEST(PathResolverTest, UnknownEndpointIsReported) {
    NetGraph g;
    add_node(g, "A.1", 0.0, 0.0);

    PathResolver resolver(g);
    ResolveResult r = resolver.resolve("A.1", "Z.9");
    EXPECT_EQ(r.status, ResolveStatus::MISSING_ENDPOINT);
    EXPECT_EQ(r.missing_node, "Z.9");

    r = resolver.resolve("Q.1", "A.1");
    EXPECT_EQ(r.status, ResolveStatus::MISSING_ENDPOINT);
    EXPECT_EQ(r.missing_node, "Q.1");
}

TEST(PathResolverTest, SameStartAndEndIsEmptyPath) {
    NetGraph g;
    add_node(g, "A.1", 0.0, 0.0);

    ResolveResult r = PathResolver(g).resolve("A.1", "A.1");
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.steps.empty());
}

TEST(PathResolverTest, WalksThroughJunctionsWithMixedDirections) {
    NetGraph g;
    add_node(g, "MIC1.out1", 1.0, 1.0);
    add_node(g, "wirejunction-0", 1.5, 1.0);
    add_node(g, "wirejunction-1", 1.5, 2.0);
    add_node(g, "AMP1.in1", 2.0, 2.0);
    add_segment(g, "s1", "MIC1.out1", "wirejunction-0");
    add_segment(g, "s2", "wirejunction-1", "wirejunction-0");   // drawn upward
    add_segment(g, "s3", "wirejunction-1", "AMP1.in1");

    ResolveResult r = PathResolver(g).resolve("MIC1.out1", "AMP1.in1");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.steps.size(), 3u);
    EXPECT_EQ(r.steps[1].direction, Direction::B_TO_A);
    expect_walk(g, r.steps, "MIC1.out1", "AMP1.in1");
}
