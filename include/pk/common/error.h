// =============================================================================
// piece-kit - Error Handling Framework
// =============================================================================
// Error handling for the piece-kit library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - PieceKitException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed manifest, CID or varint)
// - 4: Checksum verification failure
// - 10-15: Plan validation failures
// - 20: Source read failure while streaming a piece
// =============================================================================

#ifndef PK_COMMON_ERROR_H
#define PK_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace pk {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Malformed input format (manifest, CID, varint, hex).
    kFormatError = 3,

    /// @brief Checksum verification failure.
    kChecksumError = 4,

    /// @brief Invalid argument value.
    kInvalidArgument = 5,

    /// @brief The candidate block list is empty.
    kEmptyPlan = 10,

    /// @brief First block does not start right after the header.
    kHeaderMisalignment = 11,

    /// @brief Last block does not end at the declared piece size.
    kFooterMisalignment = 12,

    /// @brief Two consecutive blocks leave a gap or overlap.
    kNonContiguous = 13,

    /// @brief An item block carries neither a usable item nor a source reference.
    kUnresolvableReference = 14,

    /// @brief A block's declared length disagrees with its prefix, CID and payload.
    kInconsistentBlock = 15,

    /// @brief Backing source failed to open or read while streaming.
    kSourceReadFailure = 20
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kEmptyPlan:
            return "empty plan";
        case ErrorCode::kHeaderMisalignment:
            return "header misalignment";
        case ErrorCode::kFooterMisalignment:
            return "footer misalignment";
        case ErrorCode::kNonContiguous:
            return "non-contiguous blocks";
        case ErrorCode::kUnresolvableReference:
            return "unresolvable reference";
        case ErrorCode::kInconsistentBlock:
            return "inconsistent block";
        case ErrorCode::kSourceReadFailure:
            return "source read failure";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code is raised by plan validation.
[[nodiscard]] constexpr bool isPlanError(ErrorCode code) noexcept {
    return code >= ErrorCode::kEmptyPlan && code <= ErrorCode::kInconsistentBlock;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Item path or file path associated with the error (if applicable).
    std::string filePath;

    /// @brief Index of the block (or candidate) where the error occurred.
    std::optional<std::uint64_t> blockIndex;

    /// @brief Piece offset where the error occurred.
    std::optional<std::uint64_t> pieceOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the block index.
    ErrorContext& withBlock(std::uint64_t index) {
        blockIndex = index;
        return *this;
    }

    /// @brief Set the piece offset.
    ErrorContext& withOffset(std::uint64_t offset) {
        pieceOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all piece-kit errors.
class PieceKitException : public std::exception {
public:
    PieceKitException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    PieceKitException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~PieceKitException() override = default;

    PieceKitException(const PieceKitException&) = default;
    PieceKitException(PieceKitException&&) noexcept = default;
    PieceKitException& operator=(const PieceKitException&) = default;
    PieceKitException& operator=(PieceKitException&&) noexcept = default;

    /// @brief Get the formatted error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors.
class UsageError : public PieceKitException {
public:
    explicit UsageError(std::string message)
        : PieceKitException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : PieceKitException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}

    /// @brief Construct with an explicit code (kUsageError or kInvalidArgument).
    UsageError(ErrorCode code, std::string message)
        : PieceKitException(code, std::move(message)) {}
};

/// @brief Exception for I/O errors.
class IOError : public PieceKitException {
public:
    explicit IOError(std::string message)
        : PieceKitException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : PieceKitException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : PieceKitException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : PieceKitException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                            std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed input (manifest, CID, varint, hex).
class FormatError : public PieceKitException {
public:
    explicit FormatError(std::string message)
        : PieceKitException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : PieceKitException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for plan validation failures.
/// @note The code is one of kEmptyPlan .. kInconsistentBlock.
class PlanError : public PieceKitException {
public:
    PlanError(ErrorCode code, std::string message)
        : PieceKitException(code, std::move(message)) {}

    PlanError(ErrorCode code, std::string message, ErrorContext context)
        : PieceKitException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for failures of the backing source while streaming a piece.
/// @note Fatal to the reader that raised it; build a new reader to retry.
class SourceReadError : public PieceKitException {
public:
    explicit SourceReadError(std::string message)
        : PieceKitException(ErrorCode::kSourceReadFailure, std::move(message)) {}

    SourceReadError(std::string message, ErrorContext context)
        : PieceKitException(ErrorCode::kSourceReadFailure, std::move(message),
                            std::move(context)) {}
};

/// @brief Exception for checksum verification failures.
class ChecksumError : public PieceKitException {
public:
    explicit ChecksumError(std::string message)
        : PieceKitException(ErrorCode::kChecksumError, std::move(message)) {}

    /// @brief Construct with expected and actual checksum values.
    ChecksumError(std::uint64_t expected, std::uint64_t actual)
        : PieceKitException(ErrorCode::kChecksumError, formatChecksumMismatch(expected, actual)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a PieceKitException.
    explicit Error(const PieceKitException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Convert a Result to an exception if it contains an error.
/// @throws PieceKitException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a VoidResult to an exception if it contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const PieceKitException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace pk

#endif  // PK_COMMON_ERROR_H
