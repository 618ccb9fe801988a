// =============================================================================
// piece-kit - Multibase Codecs Implementation
// =============================================================================

#include "pk/car/multibase.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace pk::car {

namespace {

constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::string_view kBase32Alphabet = "abcdefghijklmnopqrstuvwxyz234567";

/// @brief Reverse lookup table for base58btc, -1 for invalid characters.
constexpr std::array<std::int8_t, 128> makeBase58Index() {
    std::array<std::int8_t, 128> index{};
    for (auto& v : index) {
        v = -1;
    }
    for (std::size_t i = 0; i < kBase58Alphabet.size(); ++i) {
        index[static_cast<std::size_t>(kBase58Alphabet[i])] = static_cast<std::int8_t>(i);
    }
    return index;
}

constexpr auto kBase58Index = makeBase58Index();

int base32Value(char c) noexcept {
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= '2' && c <= '7') {
        return c - '2' + 26;
    }
    return -1;
}

}  // namespace

// =============================================================================
// base58btc
// =============================================================================

std::string encodeBase58Btc(std::span<const std::uint8_t> data) {
    std::size_t leadingZeros = 0;
    while (leadingZeros < data.size() && data[leadingZeros] == 0) {
        ++leadingZeros;
    }

    // Little-endian base58 digits
    std::vector<std::uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);

    for (std::size_t i = leadingZeros; i < data.size(); ++i) {
        std::uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<std::uint32_t>(digit) << 8;
            digit = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<std::uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(leadingZeros, '1');
    out.reserve(leadingZeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(kBase58Alphabet[*it]);
    }
    return out;
}

Result<Bytes> decodeBase58Btc(std::string_view text) {
    std::size_t leadingOnes = 0;
    while (leadingOnes < text.size() && text[leadingOnes] == '1') {
        ++leadingOnes;
    }

    // Little-endian base256 bytes
    Bytes bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);

    for (std::size_t i = leadingOnes; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c >= kBase58Index.size() || kBase58Index[c] < 0) {
            return makeError<Bytes>(ErrorCode::kFormatError,
                                    "invalid base58 character at position " + std::to_string(i));
        }
        std::uint32_t carry = static_cast<std::uint32_t>(kBase58Index[c]);
        for (auto& byte : bytes) {
            carry += static_cast<std::uint32_t>(byte) * 58;
            byte = static_cast<std::uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<std::uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    Bytes out(leadingOnes, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

// =============================================================================
// base32 (RFC 4648, unpadded)
// =============================================================================

std::string encodeBase32(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

Result<Bytes> decodeBase32(std::string_view text) {
    Bytes out;
    out.reserve(text.size() * 5 / 8);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        int value = base32Value(text[i]);
        if (value < 0) {
            return makeError<Bytes>(ErrorCode::kFormatError,
                                    "invalid base32 character at position " + std::to_string(i));
        }
        buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }

    if (bits >= 5 || (buffer & ((1U << bits) - 1)) != 0) {
        return makeError<Bytes>(ErrorCode::kFormatError, "invalid base32 trailing bits");
    }
    return out;
}

// =============================================================================
// Multibase Dispatch
// =============================================================================

std::string encodeMultibase(Multibase base, std::span<const std::uint8_t> data) {
    std::string body;
    switch (base) {
        case Multibase::kBase58Btc:
            body = encodeBase58Btc(data);
            break;
        case Multibase::kBase32Lower:
            body = encodeBase32(data);
            break;
        case Multibase::kBase32Upper:
            body = encodeBase32(data);
            std::transform(body.begin(), body.end(), body.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            break;
        case Multibase::kBase16Lower:
            body = toHex(data);
            break;
        case Multibase::kBase16Upper:
            body = toHex(data);
            std::transform(body.begin(), body.end(), body.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            break;
    }
    return std::string(1, static_cast<char>(base)) + body;
}

Result<Bytes> decodeMultibase(std::string_view text) {
    if (text.empty()) {
        return makeError<Bytes>(ErrorCode::kFormatError, "empty multibase string");
    }

    std::string_view body = text.substr(1);
    switch (text.front()) {
        case 'z':
            return decodeBase58Btc(body);
        case 'b':
        case 'B':
            return decodeBase32(body);
        case 'f':
        case 'F':
            return fromHex(body);
        default:
            return makeError<Bytes>(ErrorCode::kFormatError,
                                    std::string("unsupported multibase prefix: ") + text.front());
    }
}

}  // namespace pk::car
