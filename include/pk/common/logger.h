// =============================================================================
// piece-kit - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// One process-wide Quill logger writing to stderr (stdout may carry piece
// bytes) and optionally to a log file. The level comes from -v/-q or
// --log-level.
//
// Usage:
//   pk::log::init("piecekit.log", pk::log::Level::kInfo);
//   PK_LOG_INFO("Message with {} args", 42);
//
// The PK_LOG_* macros are no-ops until init() has been called, so library
// code may log unconditionally (tests never initialize the backend).
// =============================================================================

#ifndef PK_COMMON_LOGGER_H
#define PK_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pk::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Name of the piecekit logger inside Quill.
inline constexpr std::string_view kLoggerName = "piecekit";

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path, appended to. Empty disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Write to stderr. Ignored (forced on) when no log file is set.
    bool console = true;
};

// =============================================================================
// Level Selection
// =============================================================================

/// @brief Parse a --log-level value ("trace" ... "critical").
/// @return nullopt for anything else.
[[nodiscard]] std::optional<Level> parseLevel(std::string_view name) noexcept;

/// @brief Lowercase name of a level, the inverse of parseLevel().
[[nodiscard]] std::string_view levelName(Level level) noexcept;

/// @brief Level selected by the -v / -q flags: quiet wins, then -vv trace, -v debug.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger. Later calls are ignored until shutdown().
/// @note Call once from main() before spawning worker threads.
void init(const Config& config);

/// @brief Initialize with a console sink and an optional log file.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

}  // namespace pk::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define PK_LOG_IMPL_(quillMacro, fmt, ...)                            \
    do {                                                              \
        if (quill::Logger* pkLogger_ = pk::log::logger()) {           \
            quillMacro(pkLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);    \
        }                                                             \
    } while (false)

/// @brief Log a trace message.
#define PK_LOG_TRACE(fmt, ...) PK_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define PK_LOG_DEBUG(fmt, ...) PK_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define PK_LOG_INFO(fmt, ...) PK_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define PK_LOG_WARNING(fmt, ...) PK_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define PK_LOG_ERROR(fmt, ...) PK_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define PK_LOG_CRITICAL(fmt, ...) PK_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PK_COMMON_LOGGER_H
