// =============================================================================
// piece-kit - Local Filesystem Source Implementation
// =============================================================================

#include "pk/io/local_source.h"

#include <algorithm>
#include <system_error>

#include "pk/common/error.h"
#include "pk/common/logger.h"

namespace pk::io {

// =============================================================================
// LocalFileStream Implementation
// =============================================================================

LocalFileStream::LocalFileStream(const std::filesystem::path& path, std::uint64_t offset,
                                 std::uint64_t length)
    : path_(path), remaining_(length) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw IOError("Item file not found: " + path_.string(),
                      ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                      ErrorContext(path_.string()));
    }

    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        throw IOError("Failed to open item file: " + path_.string(), ErrorContext(path_.string()));
    }

    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        throw IOError("Failed to seek in item file", ErrorContext(path_.string()));
    }
}

LocalFileStream::~LocalFileStream() {
    close();
}

std::size_t LocalFileStream::read(std::span<std::uint8_t> out) {
    if (out.empty() || remaining_ == 0 || !stream_.is_open()) {
        return 0;
    }

    auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(out.size(), remaining_));
    stream_.read(reinterpret_cast<char*>(out.data()), want);
    auto got = stream_.gcount();
    if (stream_.bad()) {
        throw IOError("Failed to read from item file", ErrorContext(path_.string()));
    }

    remaining_ -= static_cast<std::uint64_t>(got);
    return static_cast<std::size_t>(got);
}

void LocalFileStream::close() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }
}

// =============================================================================
// LocalSourceHandler Implementation
// =============================================================================

LocalSourceHandler::LocalSourceHandler(std::filesystem::path root) : root_(std::move(root)) {}

std::unique_ptr<piece::SourceStream> LocalSourceHandler::open(const ItemInfo& item,
                                                              std::uint64_t offset,
                                                              std::uint64_t length) {
    auto path = root_ / item.path;
    PK_LOG_TRACE("Opening local item {} [{}, +{})", path.string(), offset, length);
    return std::make_unique<LocalFileStream>(path, offset, length);
}

// =============================================================================
// LocalSourceResolver Implementation
// =============================================================================

LocalSourceResolver::LocalSourceResolver(
    const std::map<std::string, std::filesystem::path>& roots)
    : roots_(roots) {}

void LocalSourceResolver::addSource(std::string name, std::filesystem::path root) {
    std::lock_guard<std::mutex> lock(mutex_);
    roots_[std::move(name)] = std::move(root);
}

std::shared_ptr<piece::SourceHandler> LocalSourceResolver::resolve(const SourceRef& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(source.name);
    if (it == roots_.end()) {
        throw IOError("Unknown source: " + source.name);
    }
    PK_LOG_DEBUG("Resolved local source '{}' -> {}", source.name, it->second.string());
    return std::make_shared<LocalSourceHandler>(it->second);
}

std::size_t LocalSourceResolver::sourceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roots_.size();
}

}  // namespace pk::io
