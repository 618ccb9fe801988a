// =============================================================================
// piece-kit - Piece Block Descriptors Implementation
// =============================================================================

#include "pk/piece/block.h"

#include <algorithm>
#include <iterator>

namespace pk::piece {

std::uint64_t ItemRun::payloadBytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& entry : entries) {
        total += entry.itemLength;
    }
    return total;
}

std::size_t ItemRun::findEntry(PieceOffset offset) const noexcept {
    // Last entry starting at or before offset
    auto it = std::upper_bound(entries.begin(), entries.end(), offset,
                               [](PieceOffset value, const ItemBlockEntry& entry) {
                                   return value < entry.pieceOffset;
                               });
    if (it == entries.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(entries.begin(), it)) - 1;
}

PieceOffset blockStart(const PieceBlock& block) noexcept {
    return std::visit([](const auto& b) { return b.pieceOffset; }, block);
}

PieceOffset blockEnd(const PieceBlock& block) noexcept {
    return std::visit([](const auto& b) { return b.endOffset(); }, block);
}

std::size_t findBlock(const std::vector<PieceBlock>& blocks, PieceOffset offset) noexcept {
    auto it = std::upper_bound(blocks.begin(), blocks.end(), offset,
                               [](PieceOffset value, const PieceBlock& block) {
                                   return value < blockStart(block);
                               });
    if (it == blocks.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(blocks.begin(), it)) - 1;
}

}  // namespace pk::piece
