// =============================================================================
// piece-kit - Unsigned Varint Codec Implementation
// =============================================================================

#include "pk/car/varint.h"

#include <string>

namespace pk::car {

Bytes encodeUvarint(std::uint64_t value) {
    Bytes out;
    out.reserve(uvarintSize(value));
    appendUvarint(out, value);
    return out;
}

void appendUvarint(Bytes& out, std::uint64_t value) {
    if (value > kMaxUvarintValue) {
        throw UsageError(ErrorCode::kInvalidArgument,
                         "varint value out of range: " + std::to_string(value));
    }
    while (value >= 0x80) {
        out.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

Result<UvarintValue> decodeUvarint(std::span<const std::uint8_t> data) {
    std::uint64_t value = 0;
    unsigned shift = 0;

    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i >= kMaxUvarintLength) {
            return makeError<UvarintValue>(ErrorCode::kFormatError, "varint too long");
        }

        std::uint8_t byte = data[i];
        value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;

        if ((byte & 0x80) == 0) {
            // A trailing zero group means a shorter encoding existed
            if (byte == 0 && i > 0) {
                return makeError<UvarintValue>(ErrorCode::kFormatError,
                                               "varint not minimally encoded");
            }
            return UvarintValue{value, i + 1};
        }
        shift += 7;
    }

    return makeError<UvarintValue>(ErrorCode::kFormatError, "varint truncated");
}

}  // namespace pk::car
