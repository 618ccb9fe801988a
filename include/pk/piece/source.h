// =============================================================================
// piece-kit - Source Interfaces
// =============================================================================
// Abstract seams between the piece engine and whatever stores item bytes.
//
// This module provides:
// - SourceStream: forward-only byte stream over a range of one item
// - SourceHandler: opens SourceStreams for items of one source
// - SourceResolver: maps a SourceRef to its SourceHandler
// - LazySourceHandler: resolves a handler at most once, on first use
//
// The engine never seeks backward inside a SourceStream. Handlers may be
// shared by several readers and must accept concurrent open() calls.
// =============================================================================

#ifndef PK_PIECE_SOURCE_H
#define PK_PIECE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>

#include "pk/common/types.h"

namespace pk::piece {

// =============================================================================
// SourceStream
// =============================================================================

/// @brief Forward-only stream over a byte range of one item.
class SourceStream {
public:
    virtual ~SourceStream() = default;

    /// @brief Read up to out.size() bytes.
    /// @return Bytes read; 0 means the requested range (or the item) ended.
    /// @throws PieceKitException (or std::exception) on source failure.
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> out) = 0;

    /// @brief Release the underlying resources. Must be idempotent.
    virtual void close() noexcept = 0;
};

// =============================================================================
// SourceHandler
// =============================================================================

/// @brief Capability to read byte ranges of the items of one source.
class SourceHandler {
public:
    virtual ~SourceHandler() = default;

    /// @brief Open a stream over [offset, offset + length) of an item.
    /// @param item Item to open.
    /// @param offset First item byte to deliver.
    /// @param length Maximum number of bytes the stream will deliver.
    /// @throws PieceKitException (or std::exception) if the item cannot be opened.
    [[nodiscard]] virtual std::unique_ptr<SourceStream> open(const ItemInfo& item,
                                                             std::uint64_t offset,
                                                             std::uint64_t length) = 0;
};

// =============================================================================
// SourceResolver
// =============================================================================

/// @brief Maps source references to handlers.
class SourceResolver {
public:
    virtual ~SourceResolver() = default;

    /// @brief Obtain the handler for a source.
    /// @throws PieceKitException (or std::exception) if the source is unknown.
    [[nodiscard]] virtual std::shared_ptr<SourceHandler> resolve(const SourceRef& source) = 0;
};

// =============================================================================
// LazySourceHandler
// =============================================================================

/// @brief Resolves a SourceRef into a handler on first acquire().
///
/// Thread Safety:
/// - acquire() may be called concurrently; the resolver runs at most once
///   per successful resolution. A failed resolution is retried on the next call.
/// - The internal mutex is held while the resolver runs, so every reader that
///   touches a run sharing this handler waits for a slow resolve() to return.
///   Resolvers must not call back into readers of the same plan.
class LazySourceHandler {
public:
    LazySourceHandler(std::shared_ptr<SourceResolver> resolver, SourceRef source);

    LazySourceHandler(const LazySourceHandler&) = delete;
    LazySourceHandler& operator=(const LazySourceHandler&) = delete;

    /// @brief Get the handler, resolving it if needed.
    /// @throws Whatever the resolver throws, or SourceReadError if it returns null.
    [[nodiscard]] std::shared_ptr<SourceHandler> acquire();

    /// @brief Check whether the handler has been resolved.
    [[nodiscard]] bool isResolved() const;

    [[nodiscard]] const SourceRef& source() const noexcept { return source_; }

private:
    std::shared_ptr<SourceResolver> resolver_;
    SourceRef source_;
    mutable std::mutex mutex_;
    std::shared_ptr<SourceHandler> handler_;
};

}  // namespace pk::piece

#endif  // PK_PIECE_SOURCE_H
