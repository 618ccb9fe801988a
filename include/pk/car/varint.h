// =============================================================================
// piece-kit - Unsigned Varint Codec
// =============================================================================
// Multiformats unsigned varint (LEB128, little-endian base-128 groups).
//
// Used for:
// - Block length prefixes (<varint><cid><payload>)
// - CID version / codec / multihash fields
// - CAR header length prefix
//
// Encodings are limited to 9 bytes (63-bit values) and must be minimal.
// =============================================================================

#ifndef PK_CAR_VARINT_H
#define PK_CAR_VARINT_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "pk/common/error.h"
#include "pk/common/types.h"

namespace pk::car {

/// @brief Maximum encoded length of a multiformats varint.
inline constexpr std::size_t kMaxUvarintLength = 9;

/// @brief Largest value representable in kMaxUvarintLength bytes.
inline constexpr std::uint64_t kMaxUvarintValue = (std::uint64_t{1} << 63) - 1;

/// @brief A decoded varint and the number of bytes it occupied.
struct UvarintValue {
    std::uint64_t value = 0;
    std::size_t length = 0;
};

/// @brief Number of bytes needed to encode value.
[[nodiscard]] constexpr std::size_t uvarintSize(std::uint64_t value) noexcept {
    std::size_t size = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++size;
    }
    return size;
}

/// @brief Encode value as an unsigned varint.
/// @throws UsageError (kInvalidArgument) if value exceeds kMaxUvarintValue.
[[nodiscard]] Bytes encodeUvarint(std::uint64_t value);

/// @brief Append the varint encoding of value to out.
void appendUvarint(Bytes& out, std::uint64_t value);

/// @brief Decode a varint from the front of data.
/// @return Decoded value and length, or kFormatError on truncated, overlong or
///         non-minimal input.
[[nodiscard]] Result<UvarintValue> decodeUvarint(std::span<const std::uint8_t> data);

}  // namespace pk::car

#endif  // PK_CAR_VARINT_H
