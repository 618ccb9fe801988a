// =============================================================================
// piece-kit - Piece Block Descriptors
// =============================================================================
// Value types describing where each block of a piece lives.
//
// Block wire layout at piece offset P:
//
//   P            cidOffset()     payloadOffset()          endOffset()
//   | varint     | cid           | payload                |
//
// This module defines:
// - InlineBlock: all three fields held in memory
// - ItemBlockEntry: one block whose payload is a slice of a backing item
// - ItemRun: consecutive ItemBlockEntries sharing one item and one handler
// - PieceBlock: std::variant over InlineBlock and ItemRun
//
// All offsets other than the starting piece offset are derived, never stored.
// =============================================================================

#ifndef PK_PIECE_BLOCK_H
#define PK_PIECE_BLOCK_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

#include "pk/common/types.h"
#include "pk/piece/source.h"

namespace pk::piece {

// =============================================================================
// InlineBlock
// =============================================================================

/// @brief Block whose prefix, CID and payload are all in memory.
struct InlineBlock {
    PieceOffset pieceOffset = 0;
    Bytes varint;
    Bytes cid;
    Bytes data;

    [[nodiscard]] PieceOffset cidOffset() const noexcept { return pieceOffset + varint.size(); }
    [[nodiscard]] PieceOffset payloadOffset() const noexcept { return cidOffset() + cid.size(); }
    [[nodiscard]] PieceOffset endOffset() const noexcept { return payloadOffset() + data.size(); }
    [[nodiscard]] std::uint64_t length() const noexcept { return endOffset() - pieceOffset; }
};

// =============================================================================
// ItemBlockEntry
// =============================================================================

/// @brief One block of an item run; the payload is item[itemOffset, itemOffset + itemLength).
struct ItemBlockEntry {
    PieceOffset pieceOffset = 0;
    Bytes varint;
    Bytes cid;
    std::uint64_t itemOffset = 0;
    std::uint64_t itemLength = 0;

    [[nodiscard]] PieceOffset cidOffset() const noexcept { return pieceOffset + varint.size(); }
    [[nodiscard]] PieceOffset payloadOffset() const noexcept { return cidOffset() + cid.size(); }
    [[nodiscard]] PieceOffset endOffset() const noexcept { return payloadOffset() + itemLength; }
    [[nodiscard]] std::uint64_t length() const noexcept { return endOffset() - pieceOffset; }

    /// @brief Item offset one past the last payload byte.
    [[nodiscard]] std::uint64_t itemEnd() const noexcept { return itemOffset + itemLength; }
};

// =============================================================================
// ItemRun
// =============================================================================

/// @brief Consecutive blocks sourced from one item through one forward stream.
/// @note The handler slot is shared by every copy of the run, so the source is
///       resolved at most once no matter how many readers walk the run.
struct ItemRun {
    PieceOffset pieceOffset = 0;
    ItemInfo item;
    SourceRef source;

    /// @brief Entries in piece-offset order, mutually contiguous.
    std::vector<ItemBlockEntry> entries;

    /// @brief Lazily resolved source capability.
    std::shared_ptr<LazySourceHandler> handler;

    [[nodiscard]] PieceOffset endOffset() const noexcept {
        return entries.empty() ? pieceOffset : entries.back().endOffset();
    }
    [[nodiscard]] std::uint64_t length() const noexcept { return endOffset() - pieceOffset; }

    /// @brief Sum of the payload lengths of all entries.
    [[nodiscard]] std::uint64_t payloadBytes() const noexcept;

    /// @brief Index of the entry whose range contains offset.
    /// @note offset must lie inside [pieceOffset, endOffset()).
    [[nodiscard]] std::size_t findEntry(PieceOffset offset) const noexcept;
};

// =============================================================================
// PieceBlock
// =============================================================================

/// @brief A top-level element of a block list.
using PieceBlock = std::variant<InlineBlock, ItemRun>;

/// @brief Starting piece offset of a block.
[[nodiscard]] PieceOffset blockStart(const PieceBlock& block) noexcept;

/// @brief End piece offset of a block.
[[nodiscard]] PieceOffset blockEnd(const PieceBlock& block) noexcept;

/// @brief Check whether a block is an item run.
[[nodiscard]] inline bool isItemRun(const PieceBlock& block) noexcept {
    return std::holds_alternative<ItemRun>(block);
}

/// @brief Index of the block whose range contains offset.
/// @note blocks must be offset-sorted and offset must lie inside them.
[[nodiscard]] std::size_t findBlock(const std::vector<PieceBlock>& blocks,
                                    PieceOffset offset) noexcept;

}  // namespace pk::piece

#endif  // PK_PIECE_BLOCK_H
