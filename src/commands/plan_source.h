// =============================================================================
// piece-kit - Plan Loading for Commands
// =============================================================================
// Shared by the cat, info and verify commands: reads a plan manifest, applies
// --source NAME=DIR overrides and opens a PieceReader over the result.
// =============================================================================

#ifndef PK_COMMANDS_PLAN_SOURCE_H
#define PK_COMMANDS_PLAN_SOURCE_H

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "pk/piece/piece_reader.h"

namespace pk::commands {

/// @brief Parse NAME=DIR source overrides.
/// @throws UsageError on entries without '=' or with an empty name.
[[nodiscard]] std::map<std::string, std::filesystem::path> parseSourceOverrides(
    const std::vector<std::string>& specs);

/// @brief Load a plan manifest and open a reader positioned at offset 0.
/// @throws IOError, FormatError or PlanError.
[[nodiscard]] piece::PieceReader openPlan(const std::filesystem::path& planPath,
                                          const std::vector<std::string>& sourceOverrides);

}  // namespace pk::commands

#endif  // PK_COMMANDS_PLAN_SOURCE_H
