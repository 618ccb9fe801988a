// =============================================================================
// piece-kit - Piece Reader Implementation
// =============================================================================

#include "pk/piece/piece_reader.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>

#include <fmt/format.h>

#include "pk/common/error.h"
#include "pk/common/logger.h"

namespace pk::piece {

namespace {

/// @brief Run a source call, converting foreign failures into SourceReadError.
template <typename F>
auto callSource(const ItemRun& run, PieceOffset pos, const char* what, F&& func) {
    try {
        return func();
    } catch (const SourceReadError&) {
        throw;
    } catch (const std::exception& ex) {
        PK_LOG_ERROR("Source '{}' failed to {} item {} ({}): {}", run.source.name, what,
                     run.item.id, run.item.path, ex.what());
        throw SourceReadError(
            fmt::format("failed to {} item {} from source '{}': {}", what, run.item.id,
                        run.source.name, ex.what()),
            ErrorContext{}.withFile(run.item.path).withOffset(pos));
    }
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

PieceReader::PieceReader(std::shared_ptr<const BlockPlan> plan) : plan_(std::move(plan)) {
    if (!plan_) {
        throw UsageError(ErrorCode::kInvalidArgument, "piece reader requires a plan");
    }
}

PieceReader PieceReader::create(const PieceDescriptor& piece,
                                std::span<const BlockCandidate> candidates,
                                std::shared_ptr<SourceResolver> resolver) {
    PlanBuilder builder(std::move(resolver));
    return PieceReader(unwrapOrThrow(builder.build(piece, candidates)));
}

PieceReader::~PieceReader() {
    close();
}

PieceReader::PieceReader(PieceReader&& other) noexcept
    : plan_(std::move(other.plan_)),
      pos_(other.pos_),
      blockIndex_(other.blockIndex_),
      entryIndex_(other.entryIndex_),
      stream_(std::move(other.stream_)),
      streamItemPos_(other.streamItemPos_) {}

PieceReader& PieceReader::operator=(PieceReader&& other) noexcept {
    if (this != &other) {
        close();
        plan_ = std::move(other.plan_);
        pos_ = other.pos_;
        blockIndex_ = other.blockIndex_;
        entryIndex_ = other.entryIndex_;
        stream_ = std::move(other.stream_);
        streamItemPos_ = other.streamItemPos_;
    }
    return *this;
}

// =============================================================================
// Public Interface
// =============================================================================

std::size_t PieceReader::read(std::span<std::uint8_t> out) {
    if (out.empty() || eof()) {
        return 0;
    }

    std::size_t written = copyField(plan_->header, 0, out);

    bool sourceRead = false;
    const auto& blocks = plan_->blocks;
    while (written < out.size() && blockIndex_ < blocks.size() && !sourceRead) {
        const auto& block = blocks[blockIndex_];
        auto rest = out.subspan(written);
        if (const auto* inlineBlock = std::get_if<InlineBlock>(&block)) {
            written += readInline(*inlineBlock, rest);
        } else {
            written += readItemRun(std::get<ItemRun>(block), rest, sourceRead);
        }
    }

    return written;
}

PieceReader PieceReader::makeCopy(PieceOffset offset) const {
    if (offset > plan_->pieceSize) {
        throw UsageError(ErrorCode::kInvalidArgument,
                         fmt::format("copy offset {} is past piece size {}", offset,
                                     plan_->pieceSize));
    }

    PieceReader copy(plan_);
    copy.seek(offset);
    return copy;
}

void PieceReader::close() noexcept {
    if (stream_) {
        stream_->close();
        stream_.reset();
        PK_LOG_TRACE("Closed source stream at piece offset {}", pos_);
    }
}

// =============================================================================
// Positioning
// =============================================================================

void PieceReader::seek(PieceOffset offset) {
    close();
    pos_ = offset;
    entryIndex_ = 0;

    const auto& blocks = plan_->blocks;
    if (offset < plan_->header.size()) {
        blockIndex_ = 0;
        return;
    }
    if (offset >= plan_->pieceSize) {
        blockIndex_ = blocks.size();
        return;
    }

    blockIndex_ = findBlock(blocks, offset);
    if (const auto* run = std::get_if<ItemRun>(&blocks[blockIndex_])) {
        entryIndex_ = run->findEntry(offset);
    }
}

// =============================================================================
// Block Readers
// =============================================================================

std::size_t PieceReader::copyField(const Bytes& field, PieceOffset fieldStart,
                                   std::span<std::uint8_t> out) noexcept {
    PieceOffset fieldEnd = fieldStart + field.size();
    if (out.empty() || pos_ < fieldStart || pos_ >= fieldEnd) {
        return 0;
    }

    std::size_t skip = static_cast<std::size_t>(pos_ - fieldStart);
    std::size_t count = std::min(out.size(), field.size() - skip);
    std::memcpy(out.data(), field.data() + skip, count);
    pos_ += count;
    return count;
}

std::size_t PieceReader::readInline(const InlineBlock& block, std::span<std::uint8_t> out) {
    std::size_t n = copyField(block.varint, block.pieceOffset, out);
    n += copyField(block.cid, block.cidOffset(), out.subspan(n));
    n += copyField(block.data, block.payloadOffset(), out.subspan(n));

    if (pos_ >= block.endOffset()) {
        ++blockIndex_;
        entryIndex_ = 0;
    }
    return n;
}

std::size_t PieceReader::readItemRun(const ItemRun& run, std::span<std::uint8_t> out,
                                     bool& sourceRead) {
    std::size_t n = 0;
    while (n < out.size() && entryIndex_ < run.entries.size()) {
        const auto& entry = run.entries[entryIndex_];
        n += copyField(entry.varint, entry.pieceOffset, out.subspan(n));
        n += copyField(entry.cid, entry.cidOffset(), out.subspan(n));

        if (n < out.size() && pos_ < entry.endOffset()) {
            std::uint64_t target = entry.itemOffset + (pos_ - entry.payloadOffset());
            ensureStream(run, target);

            std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(out.size() - n, entry.endOffset() - pos_));
            auto dest = out.subspan(n, want);
            std::size_t got =
                callSource(run, pos_, "read", [&]() { return stream_->read(dest); });
            if (got == 0) {
                PK_LOG_ERROR("Item {} ({}) ended at item offset {} before block end",
                             run.item.id, run.item.path, streamItemPos_);
                throw SourceReadError(
                    fmt::format("item {} ended at offset {} before block end (expected {} more "
                                "bytes)",
                                run.item.id, streamItemPos_, entry.endOffset() - pos_),
                    ErrorContext{}.withFile(run.item.path).withOffset(pos_));
            }

            n += got;
            pos_ += got;
            streamItemPos_ += got;
            sourceRead = true;
        }

        if (pos_ >= entry.endOffset() && advanceEntry(run)) {
            break;
        }
        if (sourceRead) {
            break;
        }
    }
    return n;
}

bool PieceReader::advanceEntry(const ItemRun& run) {
    ++entryIndex_;
    if (entryIndex_ < run.entries.size()) {
        return false;
    }
    close();
    ++blockIndex_;
    entryIndex_ = 0;
    return true;
}

// =============================================================================
// Source Stream Management
// =============================================================================

void PieceReader::ensureStream(const ItemRun& run, std::uint64_t targetItemPos) {
    if (stream_) {
        if (streamItemPos_ == targetItemPos) {
            return;
        }
        if (streamItemPos_ < targetItemPos) {
            skipStream(run, targetItemPos);
            return;
        }
        // Entries are not item-monotonic; start over
        close();
    }

    std::uint64_t streamEnd = targetItemPos;
    for (std::size_t i = entryIndex_; i < run.entries.size(); ++i) {
        streamEnd = std::max(streamEnd, run.entries[i].itemEnd());
    }
    std::uint64_t length = streamEnd - targetItemPos;
    if (run.item.size > targetItemPos) {
        length = std::min(length, run.item.size - targetItemPos);
    }

    auto handler = callSource(run, pos_, "resolve source for",
                              [&]() { return run.handler->acquire(); });
    auto stream = callSource(run, pos_, "open",
                             [&]() { return handler->open(run.item, targetItemPos, length); });
    if (!stream) {
        throw SourceReadError(
            fmt::format("source '{}' returned no stream for item {}", run.source.name,
                        run.item.id),
            ErrorContext{}.withFile(run.item.path).withOffset(pos_));
    }

    PK_LOG_TRACE("Opened item {} ({}) at offset {} length {}", run.item.id, run.item.path,
                 targetItemPos, length);
    stream_ = std::move(stream);
    streamItemPos_ = targetItemPos;
}

void PieceReader::skipStream(const ItemRun& run, std::uint64_t target) {
    std::vector<std::uint8_t> scratch(
        static_cast<std::size_t>(std::min<std::uint64_t>(kSkipBufferSize, target - streamItemPos_)));
    while (streamItemPos_ < target) {
        std::size_t want =
            static_cast<std::size_t>(std::min<std::uint64_t>(scratch.size(), target - streamItemPos_));
        std::span<std::uint8_t> dest(scratch.data(), want);
        std::size_t got = callSource(run, pos_, "skip within", [&]() { return stream_->read(dest); });
        if (got == 0) {
            throw SourceReadError(
                fmt::format("item {} ended at offset {} while skipping to {}", run.item.id,
                            streamItemPos_, target),
                ErrorContext{}.withFile(run.item.path).withOffset(pos_));
        }
        streamItemPos_ += got;
    }
}

// =============================================================================
// Helpers
// =============================================================================

Bytes readFully(PieceReader& reader, std::uint64_t limit, std::size_t bufferSize) {
    Bytes result;
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(bufferSize, 1));
    while (result.size() < limit) {
        std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), limit - result.size()));
        std::size_t got = reader.read(std::span<std::uint8_t>(buffer.data(), want));
        if (got == 0) {
            break;
        }
        result.insert(result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(got));
    }
    return result;
}

}  // namespace pk::piece
