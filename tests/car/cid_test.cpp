// =============================================================================
// piece-kit - CID and Multibase Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "pk/car/cid.h"
#include "pk/car/multibase.h"
#include "pk/common/error.h"
#include "pk/common/types.h"

namespace pk::car::test {

namespace {

Bytes sha256Multihash(std::uint8_t fill) {
    Bytes mh = {kMultihashSha256, 0x20};
    mh.insert(mh.end(), 32, fill);
    return mh;
}

Bytes cidV1Bytes(std::uint64_t codec, std::uint8_t fill) {
    Bytes bytes = {0x01, static_cast<std::uint8_t>(codec)};
    auto mh = sha256Multihash(fill);
    bytes.insert(bytes.end(), mh.begin(), mh.end());
    return bytes;
}

std::string asString(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Bytes asBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

// =============================================================================
// Multibase
// =============================================================================

TEST(MultibaseTest, EncodesReferenceVectors) {
    auto data = asBytes("yes mani !");
    EXPECT_EQ(encodeMultibase(Multibase::kBase58Btc, data), "z7paNL19xttacUY");
    EXPECT_EQ(encodeMultibase(Multibase::kBase32Lower, data), "bpfsxgidnmfxgsibb");
    EXPECT_EQ(encodeMultibase(Multibase::kBase16Lower, data), "f796573206d616e692021");
}

TEST(MultibaseTest, DecodesEveryPrefix) {
    for (const char* text : {"z7paNL19xttacUY", "bpfsxgidnmfxgsibb", "BPFSXGIDNMFXGSIBB",
                             "f796573206d616e692021", "F796573206D616E692021"}) {
        auto decoded = decodeMultibase(text);
        ASSERT_TRUE(decoded.has_value()) << text << ": " << decoded.error().message();
        EXPECT_EQ(asString(*decoded), "yes mani !") << text;
    }
}

TEST(MultibaseTest, Base32MatchesRfc4648) {
    EXPECT_EQ(encodeBase32(asBytes("")), "");
    EXPECT_EQ(encodeBase32(asBytes("f")), "my");
    EXPECT_EQ(encodeBase32(asBytes("fo")), "mzxq");
    EXPECT_EQ(encodeBase32(asBytes("foo")), "mzxw6");
    EXPECT_EQ(encodeBase32(asBytes("foob")), "mzxw6yq");
    EXPECT_EQ(encodeBase32(asBytes("fooba")), "mzxw6ytb");
    EXPECT_EQ(encodeBase32(asBytes("foobar")), "mzxw6ytboi");
}

TEST(MultibaseTest, Base58KeepsLeadingZeros) {
    Bytes data = {0x00, 0x00, 0x01};
    auto text = encodeBase58Btc(data);
    EXPECT_EQ(text, "112");
    auto decoded = decodeBase58Btc(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST(MultibaseTest, RejectsInvalidInput) {
    EXPECT_FALSE(decodeMultibase("").has_value());
    EXPECT_FALSE(decodeMultibase("x1234").has_value());
    EXPECT_FALSE(decodeBase58Btc("0OIl").has_value());
    EXPECT_FALSE(decodeBase32("m1").has_value());
    EXPECT_FALSE(decodeMultibase("f123").has_value());
}

// =============================================================================
// CID
// =============================================================================

TEST(CidTest, ParsesV0FromBase58) {
    auto mh = sha256Multihash(0xAB);
    auto text = encodeBase58Btc(mh);
    ASSERT_EQ(text.size(), 46u);
    ASSERT_EQ(text.substr(0, 2), "Qm");

    auto cid = Cid::parse(text);
    ASSERT_TRUE(cid.has_value()) << cid.error().message();
    EXPECT_EQ(cid->version(), 0u);
    EXPECT_EQ(cid->codec(), kCodecDagPb);
    EXPECT_EQ(cid->hashCode(), kMultihashSha256);
    EXPECT_EQ(cid->bytes(), mh);
    EXPECT_EQ(cid->toString(), text);
}

TEST(CidTest, ParsesV1FromBase32) {
    auto bytes = cidV1Bytes(kCodecDagPb, 0x11);
    auto text = encodeMultibase(Multibase::kBase32Lower, bytes);

    // dag-pb + sha2-256 CIDv1 strings share this prefix
    EXPECT_EQ(text.substr(0, 7), "bafybei");

    auto cid = Cid::parse(text);
    ASSERT_TRUE(cid.has_value()) << cid.error().message();
    EXPECT_EQ(cid->version(), 1u);
    EXPECT_EQ(cid->codec(), kCodecDagPb);
    EXPECT_EQ(cid->bytes(), bytes);
    EXPECT_EQ(cid->toString(), text);
}

TEST(CidTest, RawCodecCidsUseBafkreiPrefix) {
    auto bytes = cidV1Bytes(kCodecRaw, 0x22);
    auto cid = Cid::fromBytes(bytes);
    ASSERT_TRUE(cid.has_value());
    EXPECT_EQ(cid->codec(), kCodecRaw);
    EXPECT_EQ(cid->toString().substr(0, 7), "bafkrei");
}

TEST(CidTest, OtherMultibasesParseToSameCid) {
    auto bytes = cidV1Bytes(kCodecRaw, 0x33);
    auto viaBase16 = Cid::parse(encodeMultibase(Multibase::kBase16Lower, bytes));
    auto viaBase58 = Cid::parse(encodeMultibase(Multibase::kBase58Btc, bytes));
    ASSERT_TRUE(viaBase16.has_value());
    ASSERT_TRUE(viaBase58.has_value());
    EXPECT_EQ(*viaBase16, *viaBase58);
    EXPECT_EQ(viaBase16->bytes(), bytes);
}

TEST(CidTest, AcceptsIdentityMultihash) {
    Bytes bytes = {0x01, kCodecRaw, kMultihashIdentity, 0x03, 'a', 'b', 'c'};
    auto cid = Cid::fromBytes(bytes);
    ASSERT_TRUE(cid.has_value()) << cid.error().message();
    EXPECT_EQ(cid->hashCode(), kMultihashIdentity);
}

TEST(CidTest, RejectsMalformedCids) {
    EXPECT_FALSE(Cid::parse("").has_value());
    EXPECT_FALSE(Cid::parse("bnotbase32!").has_value());

    // Unsupported version
    Bytes v2 = cidV1Bytes(kCodecRaw, 0x01);
    v2[0] = 0x02;
    EXPECT_FALSE(Cid::fromBytes(v2).has_value());

    // Digest shorter than declared
    Bytes truncated = cidV1Bytes(kCodecRaw, 0x01);
    truncated.pop_back();
    auto result = Cid::fromBytes(truncated);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);

    // A v0 multihash must not carry a multibase prefix
    EXPECT_FALSE(Cid::parse(encodeMultibase(Multibase::kBase32Lower, sha256Multihash(0x01)))
                     .has_value());
}

// =============================================================================
// Hex Helpers
// =============================================================================

TEST(HexTest, EncodesLowercaseAndDecodesEitherCase) {
    Bytes data = {0x00, 0xAB, 0xcd, 0xEF};
    EXPECT_EQ(toHex(data), "00abcdef");
    auto decoded = fromHex("00ABcdEF");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST(HexTest, RejectsOddLengthAndBadDigits) {
    EXPECT_FALSE(fromHex("abc").has_value());
    EXPECT_FALSE(fromHex("zz").has_value());
    EXPECT_TRUE(fromHex("").has_value());
}

}  // namespace pk::car::test
