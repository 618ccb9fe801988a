// =============================================================================
// piece-kit - Content Identifier (CID) Implementation
// =============================================================================

#include "pk/car/cid.h"

#include <fmt/format.h>

#include "pk/car/multibase.h"
#include "pk/car/varint.h"

namespace pk::car {

namespace {

/// @brief Check that data holds exactly one multihash and return its code.
Result<std::uint64_t> validateMultihash(std::span<const std::uint8_t> data) {
    auto code = decodeUvarint(data);
    if (!code) {
        return makeError<std::uint64_t>(ErrorCode::kFormatError,
                                        "invalid multihash code: " + code.error().message());
    }
    data = data.subspan(code->length);

    auto digestLength = decodeUvarint(data);
    if (!digestLength) {
        return makeError<std::uint64_t>(ErrorCode::kFormatError,
                                        "invalid multihash length: " +
                                            digestLength.error().message());
    }
    data = data.subspan(digestLength->length);

    if (data.size() != digestLength->value) {
        return makeError<std::uint64_t>(
            ErrorCode::kFormatError,
            fmt::format("multihash digest length mismatch: declared {}, have {}",
                        digestLength->value, data.size()));
    }
    return code->value;
}

}  // namespace

Result<Cid> Cid::fromBytes(std::span<const std::uint8_t> bytes) {
    Cid cid;
    cid.bytes_.assign(bytes.begin(), bytes.end());

    // CIDv0 is a bare sha2-256 multihash
    if (bytes.size() == kCidV0Length && bytes[0] == kMultihashSha256 && bytes[1] == 0x20) {
        cid.version_ = 0;
        cid.codec_ = kCodecDagPb;
        cid.hashCode_ = kMultihashSha256;
        return cid;
    }

    auto version = decodeUvarint(bytes);
    if (!version) {
        return makeError<Cid>(ErrorCode::kFormatError,
                              "invalid CID version: " + version.error().message());
    }
    if (version->value != 1) {
        return makeError<Cid>(ErrorCode::kFormatError,
                              "unsupported CID version: " + std::to_string(version->value));
    }
    auto rest = bytes.subspan(version->length);

    auto codec = decodeUvarint(rest);
    if (!codec) {
        return makeError<Cid>(ErrorCode::kFormatError,
                              "invalid CID codec: " + codec.error().message());
    }
    rest = rest.subspan(codec->length);

    auto hashCode = validateMultihash(rest);
    if (!hashCode) {
        return makeError<Cid>(hashCode.error());
    }

    cid.version_ = 1;
    cid.codec_ = codec->value;
    cid.hashCode_ = *hashCode;
    return cid;
}

Result<Cid> Cid::parse(std::string_view text) {
    if (text.empty()) {
        return makeError<Cid>(ErrorCode::kFormatError, "empty CID string");
    }

    // CIDv0: 46 characters of base58btc starting with "Qm"
    if (text.size() == 46 && text.starts_with("Qm")) {
        auto decoded = decodeBase58Btc(text);
        if (!decoded) {
            return makeError<Cid>(decoded.error());
        }
        auto cid = fromBytes(*decoded);
        if (cid && cid->version() != 0) {
            return makeError<Cid>(ErrorCode::kFormatError, "malformed CIDv0: " + std::string(text));
        }
        return cid;
    }

    auto decoded = decodeMultibase(text);
    if (!decoded) {
        return makeError<Cid>(ErrorCode::kFormatError,
                              "invalid CID '" + std::string(text) + "': " +
                                  decoded.error().message());
    }
    auto cid = fromBytes(*decoded);
    if (cid && cid->version() != 1) {
        return makeError<Cid>(ErrorCode::kFormatError,
                              "CIDv0 must not carry a multibase prefix: " + std::string(text));
    }
    return cid;
}

std::string Cid::toString() const {
    if (version_ == 0) {
        return encodeBase58Btc(bytes_);
    }
    return encodeMultibase(Multibase::kBase32Lower, bytes_);
}

}  // namespace pk::car
