// =============================================================================
// piece-kit - Piece Reader
// =============================================================================
// Seekable byte stream that reproduces a piece from its BlockPlan.
//
// Byte categories in piece order:
//
//   +--------+------------------------------------------------+
//   | Header | Block 0 | Block 1 | ... | Block N-1             |
//   +--------+------------------------------------------------+
//   each block: [varint][cid][payload]
//
// Header, varint, CID and inline payload bytes come from memory. Item payload
// bytes come from one forward SourceStream per item run, opened on first need
// and closed when the run is finished or the reader is closed.
//
// Thread Safety:
// - A PieceReader is not thread-safe. Copies made with makeCopy() share the
//   immutable plan and may be used concurrently from different threads.
// =============================================================================

#ifndef PK_PIECE_PIECE_READER_H
#define PK_PIECE_PIECE_READER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "pk/common/types.h"
#include "pk/piece/block.h"
#include "pk/piece/plan_builder.h"
#include "pk/piece/source.h"

namespace pk::piece {

/// @brief Streams the bytes of a piece described by a BlockPlan.
class PieceReader {
public:
    /// @brief Construct a reader positioned at offset 0.
    /// @param plan Validated plan (must not be null).
    explicit PieceReader(std::shared_ptr<const BlockPlan> plan);

    /// @brief Validate candidates, build a plan and open a reader on it.
    /// @throws PlanError if validation fails.
    [[nodiscard]] static PieceReader create(const PieceDescriptor& piece,
                                            std::span<const BlockCandidate> candidates,
                                            std::shared_ptr<SourceResolver> resolver);

    ~PieceReader();

    PieceReader(const PieceReader&) = delete;
    PieceReader& operator=(const PieceReader&) = delete;
    PieceReader(PieceReader&& other) noexcept;
    PieceReader& operator=(PieceReader&& other) noexcept;

    /// @brief Read the next bytes of the piece into out.
    /// @return Bytes written; 0 only at end of piece or when out is empty.
    /// @throws SourceReadError if the backing source fails or ends early.
    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out);

    /// @brief Create an independent reader positioned at offset.
    /// @throws UsageError (kInvalidArgument) if offset > size().
    [[nodiscard]] PieceReader makeCopy(PieceOffset offset) const;

    /// @brief Release any open source stream. Idempotent.
    void close() noexcept;

    [[nodiscard]] PieceOffset position() const noexcept { return pos_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return plan_->pieceSize; }
    [[nodiscard]] bool eof() const noexcept { return pos_ >= plan_->pieceSize; }

    [[nodiscard]] const std::shared_ptr<const BlockPlan>& plan() const noexcept { return plan_; }
    [[nodiscard]] const Bytes& header() const noexcept { return plan_->header; }
    [[nodiscard]] const std::vector<PieceBlock>& blocks() const noexcept { return plan_->blocks; }

private:
    /// @brief Position block and entry cursors for pos_.
    void seek(PieceOffset offset);

    /// @brief Copy from an in-memory field that starts at fieldStart.
    std::size_t copyField(const Bytes& field, PieceOffset fieldStart,
                          std::span<std::uint8_t> out) noexcept;

    std::size_t readInline(const InlineBlock& block, std::span<std::uint8_t> out);

    /// @brief Read from an item run; sets sourceRead when the stream was used.
    std::size_t readItemRun(const ItemRun& run, std::span<std::uint8_t> out, bool& sourceRead);

    /// @brief Make sure stream_ is positioned at targetItemPos for the current run.
    void ensureStream(const ItemRun& run, std::uint64_t targetItemPos);

    /// @brief Discard bytes from stream_ until streamItemPos_ reaches target.
    void skipStream(const ItemRun& run, std::uint64_t target);

    /// @brief Step to the next entry; returns true once the run is exhausted.
    bool advanceEntry(const ItemRun& run);

    std::shared_ptr<const BlockPlan> plan_;
    PieceOffset pos_ = 0;
    std::size_t blockIndex_ = 0;
    std::size_t entryIndex_ = 0;
    std::unique_ptr<SourceStream> stream_;
    std::uint64_t streamItemPos_ = 0;
};

/// @brief Drain up to limit bytes from reader into a vector.
[[nodiscard]] Bytes readFully(PieceReader& reader, std::uint64_t limit = UINT64_MAX,
                              std::size_t bufferSize = kDefaultReadBufferSize);

}  // namespace pk::piece

#endif  // PK_PIECE_PIECE_READER_H
