// =============================================================================
// piece-kit - Error Handling Framework Implementation
// =============================================================================

#include "pk/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace pk {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "item: " << filePath;
        hasContent = true;
    }

    if (blockIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "block: " << *blockIndex;
        hasContent = true;
    }

    if (pieceOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *pieceOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// PieceKitException Implementation
// =============================================================================

void PieceKitException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return fmt::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(code_, message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kEmptyPlan:
        case ErrorCode::kHeaderMisalignment:
        case ErrorCode::kFooterMisalignment:
        case ErrorCode::kNonContiguous:
        case ErrorCode::kUnresolvableReference:
        case ErrorCode::kInconsistentBlock:
            throw PlanError(code_, message_);
        case ErrorCode::kSourceReadFailure:
            throw SourceReadError(message_);
        case ErrorCode::kSuccess:
            throw PieceKitException(ErrorCode::kSuccess, message_);
    }
    throw PieceKitException(code_, message_);
}

}  // namespace pk
