// =============================================================================
// piece-kit - Plan Manifest Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include <fmt/format.h>

#include "io_test_utils.h"
#include "pk/car/car_header.h"
#include "pk/car/cid.h"
#include "pk/car/varint.h"
#include "pk/common/error.h"
#include "pk/io/local_source.h"
#include "pk/io/plan_manifest.h"
#include "pk/piece/piece_reader.h"

namespace pk::io::test {

namespace {

car::Cid rawCid(std::uint8_t fill) {
    Bytes bytes = {0x01, car::kCodecRaw, car::kMultihashSha256, 0x20};
    bytes.insert(bytes.end(), 32, fill);
    return *car::Cid::fromBytes(bytes);
}

/// @brief Expect parsePlanManifest(json) to throw FormatError.
void expectFormatError(const std::string& json) {
    try {
        (void)parsePlanManifest(json);
        FAIL() << "expected FormatError for: " << json;
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFormatError);
    }
}

}  // namespace

TEST(PlanManifestTest, ParsesInlineAndItemBlocks) {
    auto cidA = rawCid(0xA1);
    auto cidB = rawCid(0xB2);
    const std::uint64_t inlineEnd = 4 + 1 + 36 + 2;
    const std::uint64_t itemEnd = inlineEnd + 1 + 36 + 10;

    auto json = fmt::format(R"({{
        "header": "0a0a0a0a",
        "pieceSize": {},
        "sources": {{ "data": "/srv/items" }},
        "blocks": [
            {{ "offset": 4, "cid": "{}", "data": "ccdd" }},
            {{ "offset": {}, "cid": "{}",
               "item": {{ "id": 7, "path": "a.bin", "size": 100 }},
               "source": "data", "itemOffset": 20, "itemLength": 10 }}
        ]
    }})",
                            itemEnd, cidA.toString(), inlineEnd, cidB.toString());

    auto manifest = parsePlanManifest(json);
    EXPECT_EQ(manifest.piece.header, (Bytes{0x0a, 0x0a, 0x0a, 0x0a}));
    EXPECT_EQ(manifest.piece.pieceSize, itemEnd);
    ASSERT_EQ(manifest.sources.size(), 1u);
    EXPECT_EQ(manifest.sources.at("data"), std::filesystem::path("/srv/items"));
    ASSERT_EQ(manifest.candidates.size(), 2u);

    auto expectedInline =
        piece::BlockCandidate::makeInline(4, car::encodeUvarint(36 + 2), cidA.bytes(), {0xcc, 0xdd});
    const auto& first = manifest.candidates[0];
    EXPECT_EQ(first.pieceOffset, expectedInline.pieceOffset);
    EXPECT_EQ(first.blockLength, expectedInline.blockLength);
    EXPECT_EQ(first.varint, expectedInline.varint);
    EXPECT_EQ(first.cid, expectedInline.cid);
    EXPECT_TRUE(first.isInline());

    const auto& second = manifest.candidates[1];
    EXPECT_EQ(second.pieceOffset, inlineEnd);
    EXPECT_EQ(second.varint, car::encodeUvarint(36 + 10));
    const auto& slice = std::get<piece::ItemSlice>(second.payload);
    ASSERT_TRUE(slice.item.has_value());
    EXPECT_EQ(*slice.item, (ItemInfo{7, "a.bin", 100}));
    ASSERT_TRUE(slice.source.has_value());
    EXPECT_EQ(slice.source->name, "data");
    EXPECT_EQ(slice.itemOffset, 20u);
    EXPECT_EQ(slice.itemLength, 10u);
}

TEST(PlanManifestTest, RootsProduceCarHeader) {
    auto root = rawCid(0x55);
    auto json = fmt::format(R"({{
        "roots": ["{}"],
        "pieceSize": 1,
        "blocks": []
    }})",
                            root.toString());

    auto manifest = parsePlanManifest(json);
    std::vector<car::Cid> roots = {root};
    EXPECT_EQ(manifest.piece.header, car::encodeCarHeader(roots));
    ASSERT_EQ(manifest.roots.size(), 1u);
    EXPECT_EQ(manifest.roots[0], root);
}

TEST(PlanManifestTest, ExplicitVarintAndLengthAreKept) {
    auto cid = rawCid(0x01);
    auto json = fmt::format(R"({{
        "header": "",
        "pieceSize": 100,
        "blocks": [ {{ "offset": 0, "cid": "{}", "varint": "05", "length": 99, "data": "00" }} ]
    }})",
                            cid.toString());

    auto manifest = parsePlanManifest(json);
    ASSERT_EQ(manifest.candidates.size(), 1u);
    EXPECT_EQ(manifest.candidates[0].varint, (Bytes{0x05}));
    EXPECT_EQ(manifest.candidates[0].blockLength, 99u);

    // The disagreement is left for plan validation to report
    piece::PlanBuilder builder;
    auto result = builder.validate(manifest.piece, manifest.candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFooterMisalignment);
}

TEST(PlanManifestTest, IncompleteItemReferenceIsKeptForValidation) {
    auto cid = rawCid(0x02);
    auto json = fmt::format(R"({{
        "pieceSize": 47,
        "sources": {{ "data": "items" }},
        "blocks": [ {{ "offset": 0, "cid": "{}", "source": "data", "itemLength": 10 }} ]
    }})",
                            cid.toString());

    auto manifest = parsePlanManifest(json);
    ASSERT_EQ(manifest.candidates.size(), 1u);

    piece::PlanBuilder builder(std::make_shared<LocalSourceResolver>(manifest.sources));
    auto result = builder.validate(manifest.piece, manifest.candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUnresolvableReference);
}

TEST(PlanManifestTest, RejectsMalformedManifests) {
    auto cid = rawCid(0x03).toString();

    expectFormatError("not json");
    expectFormatError("[]");
    expectFormatError(R"({"blocks": []})");
    expectFormatError(R"({"pieceSize": -1, "blocks": []})");
    expectFormatError(R"({"pieceSize": 10})");
    expectFormatError(R"({"pieceSize": 10, "header": "abc", "blocks": []})");
    expectFormatError(R"({"pieceSize": 10, "header": "", "roots": [], "blocks": []})");
    expectFormatError(R"({"pieceSize": 10, "blocks": [ {"offset": 0, "cid": "bogus", "data": ""} ]})");
    expectFormatError(fmt::format(R"({{"pieceSize": 10, "blocks": [ {{"cid": "{}", "data": ""}} ]}})",
                                  cid));
    expectFormatError(fmt::format(
        R"({{"pieceSize": 10, "blocks": [ {{"offset": 0, "cid": "{}", "item": 5, "itemLength": 1}} ]}})",
        cid));
    expectFormatError(fmt::format(
        R"({{"pieceSize": 10, "blocks": [ {{"offset": 0, "cid": "{}", "source": "x"}} ]}})", cid));
    expectFormatError(R"({"pieceSize": 10, "sources": {"a": 1}, "blocks": []})");
}

TEST(PlanManifestTest, LoadResolvesRelativeSourcesAndStreams) {
    TempDirGuard dir;
    Bytes item = {'h', 'e', 'l', 'l', 'o', ' ', 'p', 'i', 'e', 'c', 'e'};
    dir.write("items/hello.txt", item);

    auto cid = rawCid(0x04);
    const std::uint64_t pieceSize = 2 + 1 + 36 + 5;
    auto json = fmt::format(R"({{
        "header": "beef",
        "pieceSize": {},
        "sources": {{ "local": "items" }},
        "blocks": [ {{ "offset": 2, "cid": "{}",
                       "item": {{ "id": 1, "path": "hello.txt", "size": 11 }},
                       "source": "local", "itemOffset": 6, "itemLength": 5 }} ]
    }})",
                            pieceSize, cid.toString());
    auto manifestPath = dir.write("plan.json", json);

    auto manifest = loadPlanManifest(manifestPath);
    EXPECT_EQ(manifest.sources.at("local"), dir.path() / "items");

    auto resolver = std::make_shared<LocalSourceResolver>(manifest.sources);
    auto reader = piece::PieceReader::create(manifest.piece, manifest.candidates, resolver);
    auto bytes = piece::readFully(reader);

    ASSERT_EQ(bytes.size(), pieceSize);
    EXPECT_EQ(bytes[0], 0xbe);
    EXPECT_EQ(bytes[1], 0xef);
    EXPECT_EQ(bytes[2], 36 + 5);
    EXPECT_EQ(std::string(bytes.end() - 5, bytes.end()), "piece");
}

TEST(PlanManifestTest, LoadMissingFileRaisesIOError) {
    TempDirGuard dir;
    EXPECT_THROW((void)loadPlanManifest(dir.path() / "missing.json"), IOError);
}

TEST(PlanManifestTest, LoadReportsFileInFormatError) {
    TempDirGuard dir;
    auto path = dir.write("broken.json", std::string("{ nope"));
    try {
        (void)loadPlanManifest(path);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, path.string());
    }
}

}  // namespace pk::io::test
