// =============================================================================
// piece-kit - Common Type Definitions
// =============================================================================
// Core type definitions shared by the piece-kit library.
//
// This module defines:
// - PieceOffset, ItemId, Bytes: type aliases used across modules
// - ItemInfo: identity, path and size of a backing item
// - SourceRef: resolution key naming the source an item lives in
// - Hex helpers for manifests and CLI output
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef PK_COMMON_TYPES_H
#define PK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pk/common/error.h"

namespace pk {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Absolute byte offset inside a piece.
using PieceOffset = std::uint64_t;

/// @brief Identity of a backing item (unique across sources).
using ItemId = std::uint64_t;

/// @brief Owned byte buffer.
using Bytes = std::vector<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default buffer size for streaming a piece to an output.
inline constexpr std::size_t kDefaultReadBufferSize = 1024 * 1024;  // 1MB

/// @brief Scratch buffer size used to skip forward inside a source stream.
inline constexpr std::size_t kSkipBufferSize = 64 * 1024;

// =============================================================================
// Item and Source References
// =============================================================================

/// @brief Backing item metadata.
struct ItemInfo {
    /// @brief Item identity; consecutive blocks with the same id fold into one run.
    ItemId id = 0;

    /// @brief Path of the item inside its source.
    std::string path;

    /// @brief Declared total size of the item in bytes.
    std::uint64_t size = 0;

    bool operator==(const ItemInfo&) const = default;
};

/// @brief Key handed to a SourceResolver to obtain a handler.
struct SourceRef {
    std::string name;

    bool operator==(const SourceRef&) const = default;
};

// =============================================================================
// Hex Helpers
// =============================================================================

/// @brief Encode bytes as lowercase hex.
[[nodiscard]] std::string toHex(std::span<const std::uint8_t> data);

/// @brief Decode a hex string (either case, even length).
[[nodiscard]] Result<Bytes> fromHex(std::string_view hex);

}  // namespace pk

#endif  // PK_COMMON_TYPES_H
