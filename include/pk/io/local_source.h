// =============================================================================
// piece-kit - Local Filesystem Source
// =============================================================================
// SourceResolver/SourceHandler implementation backed by local directories.
//
// This module provides:
// - LocalFileStream: bounded forward stream over a byte range of one file
// - LocalSourceHandler: opens items as files below a root directory
// - LocalSourceResolver: maps source names to root directories
//
// Usage:
//   auto resolver = std::make_shared<LocalSourceResolver>();
//   resolver->addSource("data", "/srv/items");
//   auto reader = PieceReader::create(piece, candidates, resolver);
// =============================================================================

#ifndef PK_IO_LOCAL_SOURCE_H
#define PK_IO_LOCAL_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include "pk/common/types.h"
#include "pk/piece/source.h"

namespace pk::io {

// =============================================================================
// LocalFileStream
// =============================================================================

/// @brief Reads at most `length` bytes of a file starting at `offset`.
class LocalFileStream : public piece::SourceStream {
public:
    /// @throws IOError if the file cannot be opened or positioned.
    LocalFileStream(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length);

    ~LocalFileStream() override;

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out) override;

    void close() noexcept override;

    [[nodiscard]] std::uint64_t remaining() const noexcept { return remaining_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t remaining_;
};

// =============================================================================
// LocalSourceHandler
// =============================================================================

/// @brief Opens items as `root / item.path`.
class LocalSourceHandler : public piece::SourceHandler {
public:
    explicit LocalSourceHandler(std::filesystem::path root);

    [[nodiscard]] std::unique_ptr<piece::SourceStream> open(const ItemInfo& item,
                                                            std::uint64_t offset,
                                                            std::uint64_t length) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

// =============================================================================
// LocalSourceResolver
// =============================================================================

/// @brief Resolves source names registered with addSource().
class LocalSourceResolver : public piece::SourceResolver {
public:
    LocalSourceResolver() = default;

    /// @brief Construct from a name -> root directory map.
    explicit LocalSourceResolver(const std::map<std::string, std::filesystem::path>& roots);

    /// @brief Register (or replace) a source root.
    void addSource(std::string name, std::filesystem::path root);

    /// @throws IOError if the source name is unknown.
    [[nodiscard]] std::shared_ptr<piece::SourceHandler> resolve(const SourceRef& source) override;

    [[nodiscard]] std::size_t sourceCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::filesystem::path> roots_;
};

}  // namespace pk::io

#endif  // PK_IO_LOCAL_SOURCE_H
