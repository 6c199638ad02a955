#include <gtest/gtest.h>
#include "kicad_sch_parser.h"
#include "test_support.h"

using namespace netoverlay;
using netoverlay_test::SIMPLE_SCHEMATIC;
using netoverlay_test::TempFile;

TEST(KicadSchParserTest, ReadsPinsInstancesAndWires) {
    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(SIMPLE_SCHEMATIC, sch));

    ASSERT_EQ(sch.symbol_defs.size(), 2u);
    auto& mic = sch.symbol_defs.at("harness:MIC");
    ASSERT_EQ(mic.pins.count("out1"), 1u);
    EXPECT_DOUBLE_EQ(mic.pins.at("out1").position.x, 5.08);
    EXPECT_DOUBLE_EQ(mic.pins.at("out1").position.y, 0.0);

    ASSERT_EQ(sch.instances.size(), 2u);
    auto& amp = sch.instances.at("AMP1");
    EXPECT_EQ(amp.lib_id, "harness:AMP");
    EXPECT_DOUBLE_EQ(amp.position.x, 55.88);
    EXPECT_DOUBLE_EQ(amp.position.y, 25.4);
    EXPECT_DOUBLE_EQ(amp.rotation, 0.0);

    ASSERT_EQ(sch.wires.size(), 1u);
    EXPECT_EQ(sch.wires[0].uuid, "W1");
    EXPECT_DOUBLE_EQ(sch.wires[0].a.x, 30.48);
    EXPECT_DOUBLE_EQ(sch.wires[0].b.x, 50.8);

    EXPECT_TRUE(parser.warnings().empty());
}

TEST(KicadSchParserTest, ParenthesesInsideStringsAreIgnored) {
    // The MIC1 "Value" property holds "mic (left)"
    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(SIMPLE_SCHEMATIC, sch));
    EXPECT_EQ(sch.instances.count("MIC1"), 1u);
    EXPECT_EQ(sch.instances.count("AMP1"), 1u);
}

TEST(KicadSchParserTest, BoundaryConstructsAreReportedNotFollowed) {
    const char* text = R"SCH((kicad_sch (version 20211123)
  (wire (pts (xy 0 0) (xy 10.16 0)) (uuid 7d1e2f00-aaaa-4bbb-8ccc-000000000001))
  (bus (pts (xy 0 20.32) (xy 20.32 20.32)) (uuid "b1"))
  (bus (pts (xy 20.32 20.32) (xy 20.32 40.64)) (uuid "b2"))
  (bus_entry (at 5.08 20.32) (size 2.54 2.54) (uuid "be1"))
  (sheet (at 50.8 50.8) (size 20.32 10.16) (uuid "s1")
    (property "Sheet name" "power" (id 0) (at 50.8 50 0)))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));

    ASSERT_EQ(sch.wires.size(), 1u);
    EXPECT_EQ(sch.wires[0].uuid, "7d1e2f00-aaaa-4bbb-8ccc-000000000001");

    EXPECT_EQ(sch.boundaries.buses, 2);
    EXPECT_EQ(sch.boundaries.bus_entries, 1);
    EXPECT_EQ(sch.boundaries.sheets, 1);
    EXPECT_EQ(parser.warnings().size(), 3u);
}

TEST(KicadSchParserTest, WireWithoutUuidGetsIndexId) {
    const char* text = R"SCH((kicad_sch
  (wire (pts (xy 0 0) (xy 2.54 0)) (uuid "first"))
  (wire (pts (xy 2.54 0) (xy 2.54 2.54)))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));
    ASSERT_EQ(sch.wires.size(), 2u);
    EXPECT_EQ(sch.wires[1].uuid, "wire-1");
    ASSERT_EQ(parser.warnings().size(), 1u);
    EXPECT_NE(parser.warnings()[0].find("wire-1"), std::string::npos);
}

TEST(KicadSchParserTest, MultiPointWireIsSkipped) {
    const char* text = R"SCH((kicad_sch
  (wire (pts (xy 0 0) (xy 2.54 0) (xy 5.08 0)) (uuid "poly"))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));
    EXPECT_TRUE(sch.wires.empty());
    EXPECT_EQ(parser.warnings().size(), 1u);
}

TEST(KicadSchParserTest, UnnamedPinFallsBackToNumber) {
    const char* text = R"SCH((kicad_sch
  (lib_symbols
    (symbol "harness:J"
      (symbol "J_1_1"
        (pin passive line (at 0 2.54 270) (length 2.54)
          (name "~" (effects (font (size 1.27 1.27))))
          (number "3" (effects (font (size 1.27 1.27))))))))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));
    auto& pins = sch.symbol_defs.at("harness:J").pins;
    ASSERT_EQ(pins.size(), 1u);
    EXPECT_EQ(pins.count("3"), 1u);
    EXPECT_DOUBLE_EQ(pins.at("3").position.y, 2.54);
}

TEST(KicadSchParserTest, DuplicateReferenceKeepsLastPlacement) {
    const char* text = R"SCH((kicad_sch
  (symbol (lib_id "harness:J") (at 10.16 10.16 0)
    (property "Reference" "J1" (id 0) (at 0 0 0)))
  (symbol (lib_id "harness:J") (at 20.32 10.16 90)
    (property "Reference" "J1" (id 0) (at 0 0 0)))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));
    ASSERT_EQ(sch.instances.size(), 1u);
    EXPECT_DOUBLE_EQ(sch.instances.at("J1").position.x, 20.32);
    EXPECT_DOUBLE_EQ(sch.instances.at("J1").rotation, 90.0);
    EXPECT_EQ(parser.warnings().size(), 1u);
}

TEST(KicadSchParserTest, InstanceWithoutReferenceIsIgnored) {
    const char* text = R"SCH((kicad_sch
  (symbol (lib_id "power:GND") (at 10.16 10.16 0)
    (property "Value" "GND" (id 1) (at 0 0 0)))
))SCH";

    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text(text, sch));
    EXPECT_TRUE(sch.instances.empty());
}

TEST(KicadSchParserTest, EmptySchematicIsValid) {
    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse_text("(kicad_sch (version 20211123) (generator eeschema))", sch));
    EXPECT_TRUE(sch.symbol_defs.empty());
    EXPECT_TRUE(sch.instances.empty());
    EXPECT_TRUE(sch.wires.empty());
}

TEST(KicadSchParserTest, RejectsNonSchematicText) {
    KicadSchParser parser;
    ParsedSchematic sch;
    EXPECT_FALSE(parser.parse_text("(kicad_pcb (version 20211014))", sch));
    EXPECT_FALSE(parser.parse_text("not an s-expression", sch));
}

TEST(KicadSchParserTest, MissingFileIsFatal) {
    KicadSchParser parser;
    ParsedSchematic sch;
    EXPECT_FALSE(parser.parse("/nonexistent/dir/missing.kicad_sch", sch));
    ASSERT_FALSE(parser.warnings().empty());
    EXPECT_NE(parser.warnings().back().find("missing.kicad_sch"), std::string::npos);
}

TEST(KicadSchParserTest, ParsesFromFile) {
    TempFile file(".kicad_sch", SIMPLE_SCHEMATIC);
    KicadSchParser parser;
    ParsedSchematic sch;
    ASSERT_TRUE(parser.parse(file.path(), sch));
    EXPECT_EQ(sch.instances.size(), 2u);
}
