// =============================================================================
// piece-kit - Local Source Tests
// =============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "io_test_utils.h"
#include "pk/common/error.h"
#include "pk/io/local_source.h"
#include "pk/piece/piece_reader.h"

namespace pk::io::test {

namespace {

Bytes pattern(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7);
    }
    return data;
}

Bytes drain(piece::SourceStream& stream, std::size_t chunk) {
    Bytes out;
    Bytes buffer(chunk);
    while (std::size_t n = stream.read(buffer)) {
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return out;
}

}  // namespace

TEST(LocalSourceTest, ReadsExactRange) {
    TempDirGuard dir;
    auto data = pattern(200);
    dir.write("sub/item.bin", data);

    LocalSourceHandler handler(dir.path());
    auto stream = handler.open(ItemInfo{1, "sub/item.bin", 200}, 50, 30);
    auto got = drain(*stream, 7);

    EXPECT_EQ(got, Bytes(data.begin() + 50, data.begin() + 80));
}

TEST(LocalSourceTest, StopsAtEndOfFile) {
    TempDirGuard dir;
    auto data = pattern(40);
    dir.write("item.bin", data);

    LocalSourceHandler handler(dir.path());
    auto stream = handler.open(ItemInfo{1, "item.bin", 40}, 30, 100);
    EXPECT_EQ(drain(*stream, 64), Bytes(data.begin() + 30, data.end()));
}

TEST(LocalSourceTest, CloseIsIdempotent) {
    TempDirGuard dir;
    dir.write("item.bin", pattern(10));

    LocalSourceHandler handler(dir.path());
    auto stream = handler.open(ItemInfo{1, "item.bin", 10}, 0, 10);
    stream->close();
    stream->close();

    Bytes buffer(4);
    EXPECT_EQ(stream->read(buffer), 0u);
}

TEST(LocalSourceTest, MissingFileRaisesIOError) {
    TempDirGuard dir;
    LocalSourceHandler handler(dir.path());
    try {
        (void)handler.open(ItemInfo{1, "absent.bin", 10}, 0, 10);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kIOError);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_NE(e.context()->filePath.find("absent.bin"), std::string::npos);
    }
}

TEST(LocalSourceTest, ResolverMapsNamesToRoots) {
    TempDirGuard first;
    TempDirGuard second;
    first.write("a.bin", std::string("first"));
    second.write("a.bin", std::string("second"));

    LocalSourceResolver resolver;
    resolver.addSource("one", first.path());
    resolver.addSource("two", second.path());
    EXPECT_EQ(resolver.sourceCount(), 2u);

    auto handler = resolver.resolve(SourceRef{"two"});
    auto stream = handler->open(ItemInfo{1, "a.bin", 6}, 0, 6);
    Bytes expected = {'s', 'e', 'c', 'o', 'n', 'd'};
    EXPECT_EQ(drain(*stream, 16), expected);

    EXPECT_THROW((void)resolver.resolve(SourceRef{"three"}), IOError);
}

TEST(LocalSourceTest, PieceReaderStreamsFromFiles) {
    TempDirGuard dir;
    auto data = pattern(64);
    dir.write("item.bin", data);

    auto resolver = std::make_shared<LocalSourceResolver>();
    resolver->addSource("local", dir.path());

    ItemInfo item{5, "item.bin", 64};
    std::vector<piece::BlockCandidate> candidates = {
        piece::BlockCandidate::makeItem(2, {0x11}, {0xA0}, item, SourceRef{"local"}, 0, 16),
        piece::BlockCandidate::makeItem(20, {0x11}, {0xA1}, item, SourceRef{"local"}, 16, 16)};
    auto reader = piece::PieceReader::create(piece::PieceDescriptor{{0xFE, 0xFF}, 38},
                                             candidates, resolver);

    Bytes expected = {0xFE, 0xFF, 0x11, 0xA0};
    expected.insert(expected.end(), data.begin(), data.begin() + 16);
    expected.push_back(0x11);
    expected.push_back(0xA1);
    expected.insert(expected.end(), data.begin() + 16, data.begin() + 32);

    EXPECT_EQ(piece::readFully(reader, UINT64_MAX, 5), expected);
}

TEST(LocalSourceTest, MissingItemFailsPieceRead) {
    TempDirGuard dir;
    auto resolver = std::make_shared<LocalSourceResolver>();
    resolver->addSource("local", dir.path());

    std::vector<piece::BlockCandidate> candidates = {piece::BlockCandidate::makeItem(
        0, {0x05}, {0xA0}, ItemInfo{1, "gone.bin", 4}, SourceRef{"local"}, 0, 4)};
    auto reader = piece::PieceReader::create(piece::PieceDescriptor{{}, 6}, candidates, resolver);

    try {
        (void)piece::readFully(reader);
        FAIL() << "expected SourceReadError";
    } catch (const SourceReadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kSourceReadFailure);
        EXPECT_NE(std::string(e.what()).find("gone.bin"), std::string::npos);
    }
}

}  // namespace pk::io::test
