#include <gtest/gtest.h>

#include "nbt_builder.hpp"
#include "schem/schematic_parser.hpp"

using namespace schem;
using schem::nbt::TagKind;
using schem::testing::NbtBuilder;
using schem::testing::SchematicFixture;
using schem::util::StatusCode;

namespace {

util::StatusOr<Schematic> Parse(const util::byte_vec& bytes, SchematicParser::State* final_state = nullptr) {
    nbt::TagReader reader(bytes);
    SchematicParser parser(reader);
    auto result = parser.ParseDocument();
    if (final_state) *final_state = parser.state();
    return result;
}

void ExpectViolation(const util::byte_vec& bytes, const std::string& fragment) {
    auto result = Parse(bytes);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), StatusCode::kSchemaViolation) << result.status().ToString();
    EXPECT_NE(result.status().message().find(fragment), std::string::npos) << result.status().message();
}

}  // namespace

TEST(SchematicParserTest, ParsesAllRecognizedFields) {
    SchematicFixture fixture;
    fixture.with_data = true;
    fixture.data = util::byte_vec(fixture.blocks.size(), 1);
    fixture.blocks[fixture.Index(1, 2, 0)] = 42;
    fixture.with_entities = true;
    fixture.empty_entities = 2;

    SchematicParser::State state;
    auto result = Parse(fixture.Build(), &state);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(state, SchematicParser::State::kDone);

    const Schematic& s = result.value();
    EXPECT_EQ(s.DimensionX(), 2);
    EXPECT_EQ(s.DimensionY(), 4);
    EXPECT_EQ(s.DimensionZ(), 3);
    EXPECT_EQ(s.OffsetX(), -5);
    EXPECT_EQ(s.OffsetY(), 0);
    EXPECT_EQ(s.OffsetZ(), 70000);
    EXPECT_EQ(s.materials(), "Alpha");
    EXPECT_TRUE(s.HasExtension());
    EXPECT_EQ(s.entities().size(), 2u);
    EXPECT_EQ(s.MaterialAt(1, 2, 0), 0x0100 | 42);
}

TEST(SchematicParserTest, FieldOrderDoesNotMatter) {
    NbtBuilder b;
    b.Compound("Schematic")
        .ByteArray("Blocks", util::byte_vec(6, 3))
        .String("Materials", "Alpha")
        .Short("Height", 1)
        .Short("Length", 2)
        .Short("Width", 3)
        .End();
    auto result = Parse(b.bytes());
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(result.value().DimensionX(), 3);
    EXPECT_FALSE(result.value().HasExtension());
    EXPECT_TRUE(result.value().entities().empty());
}

TEST(SchematicParserTest, RootMustBeCompound) {
    NbtBuilder b;
    b.Short("Schematic", 1);
    ExpectViolation(b.bytes(), "Top level tag must be Compound");
}

TEST(SchematicParserTest, RootNameMustBeSchematic) {
    SchematicFixture fixture;
    fixture.root_name = "Structure";
    ExpectViolation(fixture.Build(), "'Structure'");
}

TEST(SchematicParserTest, MaterialsMustBeAlpha) {
    SchematicFixture fixture;
    fixture.materials = "Classic";
    SchematicParser::State state;
    auto result = Parse(fixture.Build(), &state);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), StatusCode::kSchemaViolation);
    EXPECT_NE(result.status().message().find("'Classic'"), std::string::npos);
    EXPECT_EQ(state, SchematicParser::State::kFailed);
}

TEST(SchematicParserTest, UnknownFieldIsRejected) {
    NbtBuilder b;
    b.Compound("Schematic").Short("Width", 1).Int("Rotation", 90).End();
    ExpectViolation(b.bytes(), "Unknown field 'Rotation'");
}

TEST(SchematicParserTest, WrongKindForKnownFieldIsRejected) {
    NbtBuilder b;
    b.Compound("Schematic").Int("Width", 1).End();
    ExpectViolation(b.bytes(), "must be Short, got Int");
}

TEST(SchematicParserTest, DuplicateFieldIsRejected) {
    NbtBuilder b;
    b.Compound("Schematic").Short("Width", 1).Short("Width", 2).End();
    ExpectViolation(b.bytes(), "Duplicate field 'Width'");
}

TEST(SchematicParserTest, MissingRequiredFieldIsRejected) {
    NbtBuilder b;
    b.Compound("Schematic").Short("Width", 1).Short("Length", 1).Short("Height", 1)
        .String("Materials", "Alpha").End();
    ExpectViolation(b.bytes(), "Missing required field 'Blocks'");
}

TEST(SchematicParserTest, BlocksLengthMustMatchDimensions) {
    SchematicFixture fixture;
    fixture.blocks.pop_back();
    ExpectViolation(fixture.Build(), "dimensions require 24");
}

TEST(SchematicParserTest, DataLengthMustMatchDimensions) {
    SchematicFixture fixture;
    fixture.with_data = true;
    fixture.data = util::byte_vec(5, 0);
    ExpectViolation(fixture.Build(), "Data holds 5 bytes");
}

TEST(SchematicParserTest, NegativeDimensionIsRejected) {
    SchematicFixture fixture;
    fixture.width = -2;
    fixture.blocks.clear();
    ExpectViolation(fixture.Build(), "Negative dimensions");
}

TEST(SchematicParserTest, EntityWithMemberIsRejected) {
    NbtBuilder b;
    b.Compound("Schematic").Short("Width", 1).Short("Length", 1).Short("Height", 1)
        .String("Materials", "Alpha").ByteArray("Blocks", {0});
    b.Header(TagKind::kList, "Entities");
    b.Kind(TagKind::kCompound).String("id", "Pig").End();
    b.End();
    b.End();
    ExpectViolation(b.bytes(), "Unknown entity field 'id'");
}

TEST(SchematicParserTest, EntityElementMustBeCompound) {
    NbtBuilder b;
    b.Compound("Schematic").Header(TagKind::kList, "Entities").Kind(TagKind::kString).Str("Pig").End().End();
    ExpectViolation(b.bytes(), "must be Compound, got String");
}

TEST(SchematicParserTest, EmptyEntityListDecodes) {
    SchematicFixture fixture;
    fixture.with_entities = true;
    auto result = Parse(fixture.Build());
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_TRUE(result.value().entities().empty());
}

TEST(SchematicParserTest, ParserIsSingleUse) {
    util::byte_vec bytes = SchematicFixture().Build();
    nbt::TagReader reader(bytes);
    SchematicParser parser(reader);
    ASSERT_TRUE(parser.ParseDocument().ok());
    auto again = parser.ParseDocument();
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.status().code(), StatusCode::kSchemaViolation);
}

TEST(SchematicParserTest, TruncationAtEveryOffsetIsTruncatedInput) {
    SchematicFixture fixture;
    fixture.with_data = true;
    fixture.data = util::byte_vec(fixture.blocks.size(), 2);
    fixture.with_entities = true;
    fixture.empty_entities = 1;
    util::byte_vec full = fixture.Build();
    ASSERT_TRUE(Parse(full).ok());

    for (size_t cut = 0; cut < full.size(); ++cut) {
        util::byte_vec partial(full.begin(), full.begin() + cut);
        auto result = Parse(partial);
        ASSERT_FALSE(result.ok()) << "cut at " << cut;
        EXPECT_EQ(result.status().code(), StatusCode::kTruncatedInput) << "cut at " << cut << ": "
                                                                       << result.status().ToString();
    }
}
