// =============================================================================
// piece-kit - Piece Plan Builder
// =============================================================================
// Validates an ordered list of candidate blocks and folds it into the block
// list a PieceReader streams from.
//
// Validation (checked in this order):
// - kEmptyPlan:             no candidates
// - kHeaderMisalignment:    first candidate does not start at header size
// - kFooterMisalignment:    last candidate does not end at piece size
// - kInconsistentBlock:     blockLength != varint + cid + payload
// - kNonContiguous:         gap or overlap between neighbours
// - kUnresolvableReference: item candidate without item, source or resolver
//
// Folding:
//   [item A][item A][item A][inline][item B][item B]
//   -> [ItemRun A (3 entries)][InlineBlock][ItemRun B (2 entries)]
//
// The resolver is not called here; each ItemRun resolves its handler on the
// first payload read.
// =============================================================================

#ifndef PK_PIECE_PLAN_BUILDER_H
#define PK_PIECE_PLAN_BUILDER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "pk/common/error.h"
#include "pk/common/types.h"
#include "pk/piece/block.h"
#include "pk/piece/source.h"

namespace pk::piece {

// =============================================================================
// Plan Inputs
// =============================================================================

/// @brief Fixed properties of the piece being assembled.
struct PieceDescriptor {
    /// @brief Verbatim leading bytes of the piece.
    Bytes header;

    /// @brief Declared total size of the piece (header included).
    std::uint64_t pieceSize = 0;
};

/// @brief Payload held in memory.
struct InlinePayload {
    Bytes data;
};

/// @brief Payload that is a slice of a backing item.
struct ItemSlice {
    std::optional<ItemInfo> item;
    std::optional<SourceRef> source;
    std::uint64_t itemOffset = 0;
    std::uint64_t itemLength = 0;
};

/// @brief One candidate block as supplied by the planner.
struct BlockCandidate {
    PieceOffset pieceOffset = 0;

    /// @brief Declared on-wire length (varint + cid + payload).
    std::uint64_t blockLength = 0;

    Bytes varint;
    Bytes cid;
    std::variant<InlinePayload, ItemSlice> payload;

    [[nodiscard]] bool isInline() const noexcept {
        return std::holds_alternative<InlinePayload>(payload);
    }

    [[nodiscard]] std::uint64_t payloadLength() const noexcept;

    [[nodiscard]] PieceOffset endOffset() const noexcept { return pieceOffset + blockLength; }

    /// @brief Build an inline candidate; blockLength is derived.
    [[nodiscard]] static BlockCandidate makeInline(PieceOffset offset, Bytes varint, Bytes cid,
                                                   Bytes data);

    /// @brief Build an item candidate; blockLength is derived.
    [[nodiscard]] static BlockCandidate makeItem(PieceOffset offset, Bytes varint, Bytes cid,
                                                 ItemInfo item, SourceRef source,
                                                 std::uint64_t itemOffset,
                                                 std::uint64_t itemLength);
};

// =============================================================================
// BlockPlan
// =============================================================================

/// @brief Validated, folded and immutable description of a piece.
/// @note Shared read-only by every reader created from it.
struct BlockPlan {
    Bytes header;
    std::uint64_t pieceSize = 0;
    std::vector<PieceBlock> blocks;

    /// @brief Number of candidates the plan was built from.
    std::size_t candidateCount = 0;

    /// @brief Number of ItemRun elements in blocks.
    [[nodiscard]] std::size_t itemRunCount() const noexcept;

    /// @brief Number of InlineBlock elements in blocks.
    [[nodiscard]] std::size_t inlineBlockCount() const noexcept;
};

// =============================================================================
// PlanBuilder
// =============================================================================

/// @brief Builds BlockPlans from candidate lists.
class PlanBuilder {
public:
    /// @brief Construct with the resolver item runs will use.
    /// @param resolver May be null when every candidate is inline.
    explicit PlanBuilder(std::shared_ptr<SourceResolver> resolver = nullptr);

    /// @brief Check candidates against the piece without building anything.
    [[nodiscard]] VoidResult validate(const PieceDescriptor& piece,
                                      std::span<const BlockCandidate> candidates) const;

    /// @brief Validate and fold candidates into a shared BlockPlan.
    [[nodiscard]] Result<std::shared_ptr<const BlockPlan>> build(
        const PieceDescriptor& piece, std::span<const BlockCandidate> candidates) const;

private:
    std::shared_ptr<SourceResolver> resolver_;
};

}  // namespace pk::piece

#endif  // PK_PIECE_PLAN_BUILDER_H
