// =============================================================================
// piece-kit - Source Interfaces Implementation
// =============================================================================

#include "pk/piece/source.h"

#include "pk/common/logger.h"

namespace pk::piece {

LazySourceHandler::LazySourceHandler(std::shared_ptr<SourceResolver> resolver, SourceRef source)
    : resolver_(std::move(resolver)), source_(std::move(source)) {}

std::shared_ptr<SourceHandler> LazySourceHandler::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handler_) {
        return handler_;
    }

    if (!resolver_) {
        throw SourceReadError("no source resolver available for source: " + source_.name);
    }

    auto handler = resolver_->resolve(source_);
    if (!handler) {
        throw SourceReadError("resolver returned no handler for source: " + source_.name);
    }

    PK_LOG_DEBUG("Resolved source handler: {}", source_.name);
    handler_ = std::move(handler);
    return handler_;
}

bool LazySourceHandler::isResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handler_ != nullptr;
}

}  // namespace pk::piece
