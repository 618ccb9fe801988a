// =============================================================================
// piece-kit - CARv1 Header Encoding Implementation
// =============================================================================

#include "pk/car/car_header.h"

#include <string_view>

#include "pk/car/varint.h"

namespace pk::car {

namespace {

// CBOR major types (high three bits of the initial byte)
constexpr std::uint8_t kMajorUnsigned = 0;
constexpr std::uint8_t kMajorByteString = 2;
constexpr std::uint8_t kMajorTextString = 3;
constexpr std::uint8_t kMajorArray = 4;
constexpr std::uint8_t kMajorMap = 5;
constexpr std::uint8_t kMajorTag = 6;

constexpr std::uint64_t kCidTag = 42;

void appendCborHead(Bytes& out, std::uint8_t major, std::uint64_t value) {
    const auto prefix = static_cast<std::uint8_t>(major << 5);
    if (value < 24) {
        out.push_back(static_cast<std::uint8_t>(prefix | value));
        return;
    }

    int width = 8;
    std::uint8_t info = 27;
    if (value <= 0xFF) {
        width = 1;
        info = 24;
    } else if (value <= 0xFFFF) {
        width = 2;
        info = 25;
    } else if (value <= 0xFFFFFFFF) {
        width = 4;
        info = 26;
    }

    out.push_back(static_cast<std::uint8_t>(prefix | info));
    for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void appendCborText(Bytes& out, std::string_view text) {
    appendCborHead(out, kMajorTextString, text.size());
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

Bytes encodeCarHeader(std::span<const Cid> roots) {
    Bytes cbor;
    appendCborHead(cbor, kMajorMap, 2);

    appendCborText(cbor, "roots");
    appendCborHead(cbor, kMajorArray, roots.size());
    for (const auto& root : roots) {
        appendCborHead(cbor, kMajorTag, kCidTag);
        appendCborHead(cbor, kMajorByteString, root.bytes().size() + 1);
        cbor.push_back(0x00);  // multibase identity prefix
        cbor.insert(cbor.end(), root.bytes().begin(), root.bytes().end());
    }

    appendCborText(cbor, "version");
    appendCborHead(cbor, kMajorUnsigned, kCarVersion);

    Bytes header = encodeUvarint(cbor.size());
    header.insert(header.end(), cbor.begin(), cbor.end());
    return header;
}

}  // namespace pk::car
