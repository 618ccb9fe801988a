// =============================================================================
// piece-kit - Info Command
// =============================================================================
// Command handler for displaying plan information.
//
// This module provides:
// - InfoCommand: piece size, header size and block/run statistics
// - Support for JSON output format
// - Detailed per-block listing
// =============================================================================

#ifndef PK_COMMANDS_INFO_COMMAND_H
#define PK_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "pk/piece/piece_reader.h"

namespace pk::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Plan manifest path.
    std::filesystem::path planPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Show every block and run.
    bool detailed = false;

    /// @brief NAME=DIR source overrides.
    std::vector<std::string> sources;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying plan information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Print info in text format.
    void printTextInfo(const piece::BlockPlan& plan, std::ostream& out) const;

    /// @brief Print info in JSON format.
    void printJsonInfo(const piece::BlockPlan& plan, std::ostream& out) const;

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printBlockDetails(const piece::BlockPlan& plan, std::ostream& out) const;

    InfoOptions options_;
};

/// @brief Escape text for a JSON string literal (quotes, backslash and all
///        control characters below 0x20).
[[nodiscard]] std::string jsonEscape(std::string_view text);

}  // namespace pk::commands

#endif  // PK_COMMANDS_INFO_COMMAND_H
