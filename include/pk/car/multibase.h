// =============================================================================
// piece-kit - Multibase Codecs
// =============================================================================
// Text encodings used to print and parse content identifiers.
//
// Supported multibase prefixes:
// - 'z': base58btc (Bitcoin alphabet)
// - 'b' / 'B': base32 (RFC 4648, no padding, lower / upper case)
// - 'f' / 'F': base16 (lower / upper case)
// =============================================================================

#ifndef PK_CAR_MULTIBASE_H
#define PK_CAR_MULTIBASE_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "pk/common/error.h"
#include "pk/common/types.h"

namespace pk::car {

/// @brief Multibase encodings understood by piece-kit.
enum class Multibase : char {
    kBase58Btc = 'z',
    kBase32Lower = 'b',
    kBase32Upper = 'B',
    kBase16Lower = 'f',
    kBase16Upper = 'F'
};

/// @brief Encode bytes as base58btc (no multibase prefix).
[[nodiscard]] std::string encodeBase58Btc(std::span<const std::uint8_t> data);

/// @brief Decode base58btc text (no multibase prefix).
[[nodiscard]] Result<Bytes> decodeBase58Btc(std::string_view text);

/// @brief Encode bytes as unpadded lowercase base32 (no multibase prefix).
[[nodiscard]] std::string encodeBase32(std::span<const std::uint8_t> data);

/// @brief Decode unpadded base32 text in either case (no multibase prefix).
[[nodiscard]] Result<Bytes> decodeBase32(std::string_view text);

/// @brief Encode bytes with the given multibase, prefix included.
[[nodiscard]] std::string encodeMultibase(Multibase base, std::span<const std::uint8_t> data);

/// @brief Decode multibase text, dispatching on its prefix character.
[[nodiscard]] Result<Bytes> decodeMultibase(std::string_view text);

}  // namespace pk::car

#endif  // PK_CAR_MULTIBASE_H
