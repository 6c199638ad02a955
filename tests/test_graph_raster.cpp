#include <gtest/gtest.h>
#include "graph_raster.h"
#include "test_support.h"

using namespace netoverlay;
using netoverlay_test::add_node;
using netoverlay_test::add_segment;
using netoverlay_test::TempFile;

namespace {

// Small sheet keeps the image cheap to encode
RasterOptions small_sheet() {
    RasterOptions opts;
    opts.dpi = 40;
    return opts;
}

NetGraph two_node_graph() {
    NetGraph g;
    add_node(g, "A.out1", 1.0, 1.0);
    add_node(g, "B.in1", 3.0, 2.0);
    add_segment(g, "W1", "A.out1", "B.in1");
    return g;
}

} // namespace

TEST(GraphRasterTest, EmptyGraphIsOnlyADiagnostic) {
    TempFile png(".png");
    GraphRaster raster(small_sheet());
    EXPECT_FALSE(raster.write_png(png.path(), NetGraph()));
    ASSERT_EQ(raster.warnings().size(), 1u);
    EXPECT_NE(raster.warnings()[0].find("No nodes"), std::string::npos);
    EXPECT_FALSE(png.exists());
}

TEST(GraphRasterTest, WritesPng) {
    TempFile png(".png");
    GraphRaster raster(small_sheet());
    ASSERT_TRUE(raster.write_png(png.path(), two_node_graph()));

    std::string data = png.read();
    ASSERT_GT(data.size(), 8u);
    EXPECT_EQ(data.substr(0, 4), "\x89PNG");
}

TEST(GraphRasterTest, MissingFontDrawsWithoutLabels) {
    TempFile png(".png");
    RasterOptions opts = small_sheet();
    opts.font_file = "/nonexistent/font.ttf";
    GraphRaster raster(opts);
    ASSERT_TRUE(raster.write_png(png.path(), two_node_graph()));
    EXPECT_FALSE(png.read().empty());

    // Either a system fallback was found or the labels were dropped with a warning
    for (auto& w : raster.warnings()) {
        EXPECT_NE(w.find("labels omitted"), std::string::npos);
    }
}

TEST(GraphRasterTest, UnwritablePathFails) {
    GraphRaster raster(small_sheet());
    EXPECT_FALSE(raster.write_png("/nonexistent/dir/graph.png", two_node_graph()));
    ASSERT_FALSE(raster.warnings().empty());
    EXPECT_NE(raster.warnings().back().find("/nonexistent/dir/graph.png"), std::string::npos);
}
