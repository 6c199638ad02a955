#include <gtest/gtest.h>
#include "bundle_geometry.h"
#include "test_support.h"

#include <cmath>

using namespace netoverlay;
using netoverlay_test::add_node;
using netoverlay_test::add_segment;

namespace {

// N --W--> F along +x, one inch long
NetGraph straight_graph() {
    NetGraph g;
    add_node(g, "N.1", 1.0, 1.0);
    add_node(g, "F.1", 2.0, 1.0);
    add_segment(g, "W", "N.1", "F.1");
    return g;
}

ResolvedPath along_w(const std::string& name, const std::string& group = "") {
    return {name, group.empty() ? name : group, {{"W", Direction::A_TO_B}}};
}

} // namespace

TEST(BundleGeometryTest, RadiusGrowsWithComponentCount) {
    EXPECT_DOUBLE_EQ(bundle_radius(0, SEGMENT_SPACING_MM), 0.0);
    EXPECT_DOUBLE_EQ(bundle_radius(1, SEGMENT_SPACING_MM), 1.27);
    EXPECT_NEAR(bundle_radius(3, SEGMENT_SPACING_MM), std::pow(3.0, 0.7) * 1.27, 1e-12);
}

TEST(BundleGeometryTest, ThreeConnectionsFanOutSymmetrically) {
    NetGraph g = straight_graph();
    std::vector<ResolvedPath> paths = {along_w("c1"), along_w("c2"), along_w("c3")};

    BundleLayout layout = BundleGeometry().compute(g, paths);

    double radius = std::pow(3.0, 0.7) * SEGMENT_SPACING_MM;
    ASSERT_EQ(layout.nodes.count("N.1"), 1u);
    EXPECT_NEAR(layout.nodes.at("N.1").radius, radius, 1e-12);
    EXPECT_EQ(layout.nodes.at("N.1").components, 3);
    EXPECT_EQ(layout.point_count, 6);

    const Point* p1 = layout.find("N.1", "W", "c1");
    const Point* p2 = layout.find("N.1", "W", "c2");
    const Point* p3 = layout.find("N.1", "W", "c3");
    ASSERT_TRUE(p1 && p2 && p3);

    // Middle connection sits on the segment direction; y is stored negated
    double cx = 25.4, cy = -25.4;
    EXPECT_NEAR(p2->x, cx + radius, 1e-9);
    EXPECT_NEAR(p2->y, cy, 1e-9);

    // Outer ones are mirror images about the segment angle
    EXPECT_NEAR(p1->x, p3->x, 1e-9);
    EXPECT_NEAR(p1->y - cy, -(p3->y - cy), 1e-9);
    EXPECT_GT(std::abs(p1->y - p3->y), 1.0);

    // All three on the node's circle
    for (auto* p : {p1, p2, p3}) {
        EXPECT_NEAR(std::hypot(p->x - cx, p->y - cy), radius, 1e-9);
    }

    double expected_offset = rad_to_deg(std::asin(SEGMENT_SPACING_MM / radius));
    double a1 = rad_to_deg(std::atan2(-(p1->y - cy), p1->x - cx));
    EXPECT_NEAR(std::abs(a1), expected_offset, 1e-9);
}

TEST(BundleGeometryTest, ConnectionsKeepTheirSideAtBothEnds) {
    NetGraph g = straight_graph();
    std::vector<ResolvedPath> paths = {along_w("c1"), along_w("c2")};
    BundleLayout layout = BundleGeometry().compute(g, paths);

    // Order is reversed at the B end, so each line stays on one side of W
    const Point* near1 = layout.find("N.1", "W", "c1");
    const Point* far1 = layout.find("F.1", "W", "c1");
    const Point* near2 = layout.find("N.1", "W", "c2");
    const Point* far2 = layout.find("F.1", "W", "c2");
    ASSERT_TRUE(near1 && far1 && near2 && far2);

    EXPECT_NEAR(near1->y, far1->y, 1e-9);
    EXPECT_NEAR(near2->y, far2->y, 1e-9);
    EXPECT_NE(near1->y > -25.4, near2->y > -25.4);
}

TEST(BundleGeometryTest, SharedGroupCountsOnce) {
    NetGraph g = straight_graph();
    std::vector<ResolvedPath> paths = {along_w("ch-1", "cable-1"), along_w("ch-2", "cable-1")};
    BundleLayout layout = BundleGeometry().compute(g, paths);

    EXPECT_EQ(layout.nodes.at("N.1").components, 1);
    EXPECT_DOUBLE_EQ(layout.nodes.at("N.1").radius, SEGMENT_SPACING_MM);
    // Both channels still get their own point
    EXPECT_NE(layout.find("N.1", "W", "ch-1"), nullptr);
    EXPECT_NE(layout.find("N.1", "W", "ch-2"), nullptr);
}

TEST(BundleGeometryTest, OffsetBeyondRadiusCollapsesToSegmentAngle) {
    NetGraph g = straight_graph();
    std::vector<ResolvedPath> paths;
    for (auto name : {"a", "b", "c", "d"}) paths.push_back(along_w(name, "one-cable"));

    BundleLayout layout = BundleGeometry().compute(g, paths);

    // Outer offsets exceed the single-component radius
    const Point* a = layout.find("N.1", "W", "a");
    ASSERT_NE(a, nullptr);
    EXPECT_FALSE(std::isnan(a->x));
    EXPECT_NEAR(a->x, 25.4 + SEGMENT_SPACING_MM, 1e-9);
    EXPECT_NEAR(a->y, -25.4, 1e-9);
}

TEST(BundleGeometryTest, NodesWithoutTrafficAreSkipped) {
    NetGraph g = straight_graph();
    add_node(g, "X.1", 5.0, 5.0);
    add_node(g, "Y.1", 6.0, 5.0);
    add_segment(g, "unused", "X.1", "Y.1");

    BundleLayout layout = BundleGeometry().compute(g, {along_w("c1")});
    EXPECT_EQ(layout.nodes.count("X.1"), 0u);
    EXPECT_EQ(layout.nodes.count("Y.1"), 0u);
    EXPECT_EQ(layout.skipped_nodes, 2);
    EXPECT_EQ(layout.point_count, 2);
}

TEST(BundleGeometryTest, SkippedNodesAreLoggedWhenVerbose) {
    NetGraph g = straight_graph();
    add_node(g, "X.1", 5.0, 5.0);

    BundleOptions opts;
    opts.verbose = true;
    testing::internal::CaptureStderr();
    BundleGeometry(opts).compute(g, {along_w("c1")});
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[bundle] Node X.1 has no passing connections"), std::string::npos);
    EXPECT_NE(err.find("1 without traffic skipped"), std::string::npos);
}

TEST(BundleGeometryTest, LayoutIsIdempotent) {
    NetGraph g = straight_graph();
    add_node(g, "T.1", 1.0, 2.0);
    add_segment(g, "V", "T.1", "N.1");
    std::vector<ResolvedPath> paths = {
        along_w("c1"),
        {"c2", "c2", {{"V", Direction::A_TO_B}, {"W", Direction::A_TO_B}}},
        {"c3", "c3", {{"W", Direction::B_TO_A}, {"V", Direction::B_TO_A}}},
    };

    BundleLayout first = BundleGeometry().compute(g, paths);
    BundleLayout second = BundleGeometry().compute(g, paths);

    ASSERT_EQ(first.points.size(), second.points.size());
    EXPECT_EQ(first.point_count, second.point_count);
    auto it = second.points.begin();
    for (auto& [key, pt] : first.points) {
        EXPECT_EQ(key.node, it->first.node);
        EXPECT_EQ(key.segment, it->first.segment);
        EXPECT_EQ(key.connection, it->first.connection);
        EXPECT_EQ(pt.x, it->second.x);
        EXPECT_EQ(pt.y, it->second.y);
        ++it;
    }
}
