// =============================================================================
// piece-kit - Piece Plan Builder Implementation
// =============================================================================

#include "pk/piece/plan_builder.h"

#include <limits>
#include <optional>

#include <fmt/format.h>

#include "pk/common/logger.h"

namespace pk::piece {

namespace {

/// @brief a + b, or nullopt if the sum does not fit in 64 bits.
std::optional<std::uint64_t> addLengths(std::uint64_t a, std::uint64_t b) noexcept {
    if (b > std::numeric_limits<std::uint64_t>::max() - a) {
        return std::nullopt;
    }
    return a + b;
}

}  // namespace

// =============================================================================
// BlockCandidate Implementation
// =============================================================================

std::uint64_t BlockCandidate::payloadLength() const noexcept {
    if (const auto* inlinePayload = std::get_if<InlinePayload>(&payload)) {
        return inlinePayload->data.size();
    }
    return std::get<ItemSlice>(payload).itemLength;
}

BlockCandidate BlockCandidate::makeInline(PieceOffset offset, Bytes varint, Bytes cid,
                                          Bytes data) {
    BlockCandidate candidate;
    candidate.pieceOffset = offset;
    candidate.blockLength = varint.size() + cid.size() + data.size();
    candidate.varint = std::move(varint);
    candidate.cid = std::move(cid);
    candidate.payload = InlinePayload{std::move(data)};
    return candidate;
}

BlockCandidate BlockCandidate::makeItem(PieceOffset offset, Bytes varint, Bytes cid,
                                        ItemInfo item, SourceRef source,
                                        std::uint64_t itemOffset, std::uint64_t itemLength) {
    BlockCandidate candidate;
    candidate.pieceOffset = offset;
    candidate.blockLength = varint.size() + cid.size() + itemLength;
    candidate.varint = std::move(varint);
    candidate.cid = std::move(cid);
    candidate.payload = ItemSlice{std::move(item), std::move(source), itemOffset, itemLength};
    return candidate;
}

// =============================================================================
// BlockPlan Implementation
// =============================================================================

std::size_t BlockPlan::itemRunCount() const noexcept {
    std::size_t count = 0;
    for (const auto& block : blocks) {
        if (isItemRun(block)) {
            ++count;
        }
    }
    return count;
}

std::size_t BlockPlan::inlineBlockCount() const noexcept {
    return blocks.size() - itemRunCount();
}

// =============================================================================
// PlanBuilder Implementation
// =============================================================================

PlanBuilder::PlanBuilder(std::shared_ptr<SourceResolver> resolver)
    : resolver_(std::move(resolver)) {}

VoidResult PlanBuilder::validate(const PieceDescriptor& piece,
                                 std::span<const BlockCandidate> candidates) const {
    if (candidates.empty()) {
        return makeVoidError(ErrorCode::kEmptyPlan, "no blocks provided");
    }

    if (candidates.front().pieceOffset != piece.header.size()) {
        return makeVoidError(
            ErrorCode::kHeaderMisalignment,
            fmt::format("first block must start at header end: offset {}, header size {}",
                        candidates.front().pieceOffset, piece.header.size()));
    }

    if (candidates.back().endOffset() != piece.pieceSize) {
        return makeVoidError(
            ErrorCode::kFooterMisalignment,
            fmt::format("last block must end at piece size: end {}, piece size {}",
                        candidates.back().endOffset(), piece.pieceSize));
    }

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];

        auto wireLength =
            addLengths(candidate.varint.size() + candidate.cid.size(), candidate.payloadLength());
        auto wireEnd = wireLength ? addLengths(candidate.pieceOffset, *wireLength) : std::nullopt;
        auto declaredEnd = addLengths(candidate.pieceOffset, candidate.blockLength);
        if (!wireEnd || !declaredEnd || *wireEnd > piece.pieceSize) {
            return makeVoidError(
                ErrorCode::kInconsistentBlock,
                fmt::format("block {} at offset {}: payload length {} overflows or runs past "
                            "piece size {}",
                            i, candidate.pieceOffset, candidate.payloadLength(), piece.pieceSize));
        }
        if (candidate.blockLength != *wireLength) {
            return makeVoidError(
                ErrorCode::kInconsistentBlock,
                fmt::format("block {} at offset {}: declared length {} but varint + cid + "
                            "payload is {}",
                            i, candidate.pieceOffset, candidate.blockLength, *wireLength));
        }

        if (i + 1 < candidates.size() && candidate.endOffset() != candidates[i + 1].pieceOffset) {
            return makeVoidError(
                ErrorCode::kNonContiguous,
                fmt::format("blocks must be contiguous: block {} ends at {}, block {} starts at {}",
                            i, candidate.endOffset(), i + 1, candidates[i + 1].pieceOffset));
        }

        if (const auto* slice = std::get_if<ItemSlice>(&candidate.payload)) {
            if (!slice->item.has_value() || !slice->source.has_value()) {
                return makeVoidError(
                    ErrorCode::kUnresolvableReference,
                    fmt::format("block {} at offset {} is neither inline nor a preloaded "
                                "item/source reference",
                                i, candidate.pieceOffset));
            }
            if (!resolver_) {
                return makeVoidError(
                    ErrorCode::kUnresolvableReference,
                    fmt::format("block {} references source '{}' but no resolver was supplied", i,
                                slice->source->name));
            }
        }
    }

    return makeVoidSuccess();
}

Result<std::shared_ptr<const BlockPlan>> PlanBuilder::build(
    const PieceDescriptor& piece, std::span<const BlockCandidate> candidates) const {
    if (auto valid = validate(piece, candidates); !valid) {
        return std::unexpected(valid.error());
    }

    auto plan = std::make_shared<BlockPlan>();
    plan->header = piece.header;
    plan->pieceSize = piece.pieceSize;
    plan->candidateCount = candidates.size();

    std::optional<ItemRun> currentRun;
    auto flushRun = [&]() {
        if (currentRun.has_value()) {
            plan->blocks.emplace_back(std::move(*currentRun));
            currentRun.reset();
        }
    };

    for (const auto& candidate : candidates) {
        if (const auto* inlinePayload = std::get_if<InlinePayload>(&candidate.payload)) {
            flushRun();
            plan->blocks.emplace_back(InlineBlock{candidate.pieceOffset, candidate.varint,
                                                  candidate.cid, inlinePayload->data});
            continue;
        }

        const auto& slice = std::get<ItemSlice>(candidate.payload);
        if (currentRun.has_value() && currentRun->item.id != slice.item->id) {
            flushRun();
        }

        if (!currentRun.has_value()) {
            ItemRun run;
            run.pieceOffset = candidate.pieceOffset;
            run.item = *slice.item;
            run.source = *slice.source;
            run.handler = std::make_shared<LazySourceHandler>(resolver_, *slice.source);
            currentRun = std::move(run);
        }

        currentRun->entries.push_back(ItemBlockEntry{candidate.pieceOffset, candidate.varint,
                                                     candidate.cid, slice.itemOffset,
                                                     slice.itemLength});
    }
    flushRun();

    PK_LOG_DEBUG("Piece plan built: {} candidates -> {} blocks ({} item runs), size={}",
                 plan->candidateCount, plan->blocks.size(), plan->itemRunCount(),
                 plan->pieceSize);

    return std::shared_ptr<const BlockPlan>(std::move(plan));
}

}  // namespace pk::piece
