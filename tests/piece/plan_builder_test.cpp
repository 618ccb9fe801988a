// =============================================================================
// piece-kit - Plan Builder Tests
// =============================================================================
// Validation errors and folding of candidates into inline blocks and item runs.
// =============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "memory_source.h"
#include "pk/common/error.h"
#include "pk/piece/plan_builder.h"

namespace pk::piece::test {

namespace {

const Bytes kHeader = {0x0a, 0x0a, 0x0a, 0x0a};

/// @brief Item candidate with a one-byte varint and a two-byte cid.
BlockCandidate itemAt(PieceOffset offset, ItemId id, std::uint64_t itemOffset,
                      std::uint64_t itemLength, const std::string& source = "mem") {
    return BlockCandidate::makeItem(offset, {static_cast<std::uint8_t>(2 + itemLength)},
                                    {0xAA, static_cast<std::uint8_t>(id)},
                                    ItemInfo{id, "item" + std::to_string(id), 1024},
                                    SourceRef{source}, itemOffset, itemLength);
}

BlockCandidate inlineAt(PieceOffset offset, Bytes data) {
    auto size = static_cast<std::uint8_t>(2 + data.size());
    return BlockCandidate::makeInline(offset, {size}, {0xBB, 0x01}, std::move(data));
}

/// @brief Lay out candidates back to back after the header.
std::uint64_t layOut(std::vector<BlockCandidate>& candidates, PieceOffset start) {
    PieceOffset offset = start;
    for (auto& candidate : candidates) {
        candidate.pieceOffset = offset;
        offset = candidate.endOffset();
    }
    return offset;
}

}  // namespace

// =============================================================================
// Validation
// =============================================================================

TEST(PlanBuilderTest, AcceptsSingleInlineBlock) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {
        BlockCandidate::makeInline(4, {0x05}, {0xAA, 0xBB}, {0xCC, 0xDD})};

    auto result = builder.validate(PieceDescriptor{kHeader, 9}, candidates);
    EXPECT_TRUE(result.has_value());
}

TEST(PlanBuilderTest, RejectsEmptyPlan) {
    PlanBuilder builder;
    auto result = builder.validate(PieceDescriptor{kHeader, 4}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kEmptyPlan);
}

TEST(PlanBuilderTest, RejectsHeaderMisalignment) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(5, {0x01})};
    auto result = builder.validate(PieceDescriptor{kHeader, candidates[0].endOffset()}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kHeaderMisalignment);
}

TEST(PlanBuilderTest, RejectsFooterMisalignment) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(4, {0x01, 0x02})};
    auto result =
        builder.validate(PieceDescriptor{kHeader, candidates[0].endOffset() + 1}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFooterMisalignment);
}

TEST(PlanBuilderTest, RejectsGapBetweenBlocks) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(4, {0x01}), inlineAt(0, {0x02})};
    candidates[1].pieceOffset = candidates[0].endOffset() + 1;

    auto result =
        builder.validate(PieceDescriptor{kHeader, candidates[1].endOffset()}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNonContiguous);
}

TEST(PlanBuilderTest, RejectsOverlappingBlocks) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(4, {0x01, 0x02}), inlineAt(0, {0x03})};
    candidates[1].pieceOffset = candidates[0].endOffset() - 1;

    auto result =
        builder.validate(PieceDescriptor{kHeader, candidates[1].endOffset()}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNonContiguous);
}

TEST(PlanBuilderTest, RejectsDeclaredLengthThatDisagreesWithFields) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(4, {0x01, 0x02})};
    candidates[0].blockLength += 1;

    auto result =
        builder.validate(PieceDescriptor{kHeader, candidates[0].endOffset()}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInconsistentBlock);
}

TEST(PlanBuilderTest, RejectsLengthThatWrapsAround) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    // varint + cid + payload sums to 2^64, so blockLength wraps to 0
    auto huge = BlockCandidate::makeItem(4, {0x01}, {0xAA, 0xBB}, ItemInfo{1, "item1", 1024},
                                         SourceRef{"mem"}, 0, UINT64_MAX - 2);
    ASSERT_EQ(huge.blockLength, 0u);
    std::vector<BlockCandidate> candidates = {huge, inlineAt(4, {0x01, 0x02})};

    auto result = builder.build(PieceDescriptor{kHeader, candidates[1].endOffset()}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInconsistentBlock);
}

TEST(PlanBuilderTest, RejectsDeclaredLengthThatWrapsAround) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {inlineAt(4, {0x01}), inlineAt(0, {0x02})};
    candidates[1].pieceOffset = candidates[0].endOffset();
    const auto pieceSize = candidates[1].endOffset();
    candidates[0].blockLength = UINT64_MAX;

    auto result = builder.validate(PieceDescriptor{kHeader, pieceSize}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInconsistentBlock);
}

TEST(PlanBuilderTest, RejectsPayloadPastPieceSize) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    // The item claims 40 bytes but only 10 fit before the declared piece end
    std::vector<BlockCandidate> candidates = {itemAt(4, 1, 0, 40)};
    candidates[0].blockLength = 3 + 10;

    auto result = builder.validate(PieceDescriptor{kHeader, 4 + 13}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInconsistentBlock);
}

TEST(PlanBuilderTest, RejectsItemWithoutSource) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates = {itemAt(0, 1, 0, 8)};
    std::get<ItemSlice>(candidates[0].payload).source.reset();
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.validate(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUnresolvableReference);
}

TEST(PlanBuilderTest, RejectsUnresolvableLastCandidate) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates = {inlineAt(0, {0x01}), itemAt(0, 1, 0, 8)};
    std::get<ItemSlice>(candidates[1].payload).item.reset();
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.validate(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUnresolvableReference);
}

TEST(PlanBuilderTest, RejectsItemBlocksWithoutResolver) {
    PlanBuilder builder;
    std::vector<BlockCandidate> candidates = {itemAt(0, 1, 0, 8)};
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.validate(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUnresolvableReference);
}

TEST(PlanBuilderTest, ReportsEarliestFailureFirst) {
    PlanBuilder builder;
    // Misaligned at both ends: the header check wins.
    std::vector<BlockCandidate> candidates = {inlineAt(7, {0x01})};
    auto result = builder.validate(PieceDescriptor{kHeader, 100}, candidates);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kHeaderMisalignment);
}

TEST(PlanBuilderTest, PlanErrorsAreClassifiedAsSuch) {
    EXPECT_TRUE(isPlanError(ErrorCode::kEmptyPlan));
    EXPECT_TRUE(isPlanError(ErrorCode::kInconsistentBlock));
    EXPECT_FALSE(isPlanError(ErrorCode::kSourceReadFailure));
    EXPECT_FALSE(isPlanError(ErrorCode::kIOError));
}

// =============================================================================
// Folding
// =============================================================================

TEST(PlanBuilderTest, FoldsConsecutiveItemBlocksIntoRuns) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates;
    for (std::uint64_t i = 0; i < 5; ++i) {
        candidates.push_back(itemAt(0, 1, i * 16, 16));
    }
    candidates.push_back(inlineAt(0, {0x01, 0x02, 0x03}));
    candidates.push_back(itemAt(0, 2, 0, 10));
    candidates.push_back(itemAt(0, 2, 10, 10));
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.build(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_TRUE(result.has_value()) << result.error().message();
    const auto& plan = **result;

    ASSERT_EQ(plan.blocks.size(), 3u);
    EXPECT_EQ(plan.candidateCount, 8u);
    EXPECT_EQ(plan.itemRunCount(), 2u);
    EXPECT_EQ(plan.inlineBlockCount(), 1u);

    const auto& first = std::get<ItemRun>(plan.blocks[0]);
    EXPECT_EQ(first.item.id, 1u);
    EXPECT_EQ(first.entries.size(), 5u);
    EXPECT_EQ(first.pieceOffset, kHeader.size());
    EXPECT_EQ(first.payloadBytes(), 80u);

    EXPECT_TRUE(std::holds_alternative<InlineBlock>(plan.blocks[1]));
    EXPECT_EQ(blockStart(plan.blocks[1]), first.endOffset());

    const auto& last = std::get<ItemRun>(plan.blocks[2]);
    EXPECT_EQ(last.item.id, 2u);
    EXPECT_EQ(last.entries.size(), 2u);
    EXPECT_EQ(last.endOffset(), size);
}

TEST(PlanBuilderTest, ItemChangeStartsNewRun) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates = {itemAt(0, 1, 0, 4), itemAt(0, 2, 0, 4),
                                              itemAt(0, 1, 4, 4)};
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.build(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->itemRunCount(), 3u);
}

TEST(PlanBuilderTest, BuildDoesNotResolveSources) {
    auto resolver = std::make_shared<MemoryResolver>();
    resolver->source("mem");
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates = {itemAt(0, 1, 0, 4), itemAt(0, 2, 0, 4)};
    auto size = layOut(candidates, kHeader.size());

    auto result = builder.build(PieceDescriptor{kHeader, size}, candidates);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(resolver->counters().resolves.load(), 0);

    for (const auto& block : (*result)->blocks) {
        const auto& run = std::get<ItemRun>(block);
        ASSERT_NE(run.handler, nullptr);
        EXPECT_FALSE(run.handler->isResolved());
    }
}

TEST(PlanBuilderTest, BuildPropagatesValidationError) {
    PlanBuilder builder;
    auto result = builder.build(PieceDescriptor{kHeader, 4}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kEmptyPlan);
}

TEST(PlanBuilderTest, FindBlockLocatesContainingBlock) {
    auto resolver = std::make_shared<MemoryResolver>();
    PlanBuilder builder(resolver);

    std::vector<BlockCandidate> candidates = {inlineAt(0, {0x01, 0x02}), itemAt(0, 1, 0, 4),
                                              itemAt(0, 1, 4, 4), inlineAt(0, {0x03})};
    auto size = layOut(candidates, kHeader.size());
    auto plan = *builder.build(PieceDescriptor{kHeader, size}, candidates);

    ASSERT_EQ(plan->blocks.size(), 3u);
    for (std::size_t i = 0; i < plan->blocks.size(); ++i) {
        const auto& block = plan->blocks[i];
        for (PieceOffset offset = blockStart(block); offset < blockEnd(block); ++offset) {
            EXPECT_EQ(findBlock(plan->blocks, offset), i) << "offset " << offset;
        }
    }

    const auto& run = std::get<ItemRun>(plan->blocks[1]);
    EXPECT_EQ(run.findEntry(run.entries[1].pieceOffset), 1u);
    EXPECT_EQ(run.findEntry(run.entries[1].pieceOffset - 1), 0u);
}

}  // namespace pk::piece::test
