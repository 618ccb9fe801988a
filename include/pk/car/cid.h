// =============================================================================
// piece-kit - Content Identifier (CID)
// =============================================================================
// Binary and text forms of the content identifiers that name CAR blocks.
//
// Binary layout:
// - CIDv0: <multihash>                       (sha2-256 only, 34 bytes)
// - CIDv1: <varint 1><varint codec><multihash>
// - multihash: <varint hash code><varint digest length><digest>
//
// Text forms:
// - CIDv0: base58btc without multibase prefix ("Qm...")
// - CIDv1: any supported multibase, printed as lowercase base32 ("b...")
// =============================================================================

#ifndef PK_CAR_CID_H
#define PK_CAR_CID_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "pk/common/error.h"
#include "pk/common/types.h"

namespace pk::car {

// =============================================================================
// Multicodec Constants
// =============================================================================

/// @brief dag-pb codec (the implicit codec of CIDv0).
inline constexpr std::uint64_t kCodecDagPb = 0x70;

/// @brief raw codec.
inline constexpr std::uint64_t kCodecRaw = 0x55;

/// @brief dag-cbor codec.
inline constexpr std::uint64_t kCodecDagCbor = 0x71;

/// @brief sha2-256 multihash code.
inline constexpr std::uint64_t kMultihashSha256 = 0x12;

/// @brief identity multihash code.
inline constexpr std::uint64_t kMultihashIdentity = 0x00;

/// @brief Binary length of a CIDv0.
inline constexpr std::size_t kCidV0Length = 34;

// =============================================================================
// Cid Class
// =============================================================================

/// @brief A validated content identifier.
class Cid {
public:
    /// @brief Parse the text form of a CID (v0 or multibase v1).
    [[nodiscard]] static Result<Cid> parse(std::string_view text);

    /// @brief Validate and wrap a binary CID.
    [[nodiscard]] static Result<Cid> fromBytes(std::span<const std::uint8_t> bytes);

    /// @brief Binary form written into the piece.
    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    /// @brief CID version (0 or 1).
    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

    /// @brief Content codec (kCodecDagPb for v0).
    [[nodiscard]] std::uint64_t codec() const noexcept { return codec_; }

    /// @brief Multihash function code.
    [[nodiscard]] std::uint64_t hashCode() const noexcept { return hashCode_; }

    /// @brief Canonical text form.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Cid& other) const noexcept { return bytes_ == other.bytes_; }

private:
    Cid() = default;

    Bytes bytes_;
    std::uint64_t version_ = 0;
    std::uint64_t codec_ = 0;
    std::uint64_t hashCode_ = 0;
};

}  // namespace pk::car

#endif  // PK_CAR_CID_H
