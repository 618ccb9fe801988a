// =============================================================================
// piece-kit - Cat Command
// =============================================================================
// Command handler that streams a piece (or a byte range of it) to a file or
// stdout.
// =============================================================================

#ifndef PK_COMMANDS_CAT_COMMAND_H
#define PK_COMMANDS_CAT_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "pk/common/types.h"
#include "pk/piece/piece_reader.h"

namespace pk::commands {

// =============================================================================
// Cat Options
// =============================================================================

/// @brief Configuration options for cat command.
struct CatOptions {
    /// @brief Plan manifest path.
    std::filesystem::path planPath;

    /// @brief Output path ("-" for stdout).
    std::string outputPath = "-";

    /// @brief First piece offset to emit.
    std::uint64_t offset = 0;

    /// @brief Number of bytes to emit (to the end of the piece when unset).
    std::optional<std::uint64_t> length;

    /// @brief Read buffer size.
    std::size_t bufferSize = kDefaultReadBufferSize;

    /// @brief NAME=DIR source overrides.
    std::vector<std::string> sources;
};

// =============================================================================
// CatCommand Class
// =============================================================================

/// @brief Command handler for streaming piece bytes.
class CatCommand {
public:
    explicit CatCommand(CatOptions options);

    /// @brief Execute the cat command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Copy [offset, offset + length) of the reader's piece to out.
    /// @return Bytes written.
    [[nodiscard]] static std::uint64_t streamRange(const piece::PieceReader& reader,
                                                   std::uint64_t offset,
                                                   std::optional<std::uint64_t> length,
                                                   std::size_t bufferSize, std::ostream& out);

    [[nodiscard]] const CatOptions& options() const noexcept { return options_; }

private:
    CatOptions options_;
};

}  // namespace pk::commands

#endif  // PK_COMMANDS_CAT_COMMAND_H
