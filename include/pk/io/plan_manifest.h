// =============================================================================
// piece-kit - Plan Manifest
// =============================================================================
// Loads a piece description and its candidate blocks from a JSON manifest.
//
// Manifest layout:
//   {
//     "header": "<hex>",              // or "roots": ["<cid>", ...] (CARv1 header)
//     "pieceSize": 1048576,
//     "sources": { "data": "items" }, // relative roots resolve against the manifest dir
//     "blocks": [
//       { "offset": 59, "cid": "bafk...", "data": "<hex>" },
//       { "offset": 100, "cid": "bafk...", "varint": "<hex>", "length": 1062,
//         "item": { "id": 7, "path": "a.bin", "size": 4096 },
//         "source": "data", "itemOffset": 0, "itemLength": 1024 }
//     ]
//   }
//
// "varint" defaults to uvarint(cid bytes + payload length) and "length" to the
// derived wire length. Blocks with neither "data" nor a complete item/source
// reference are kept so plan validation can report them.
// =============================================================================

#ifndef PK_IO_PLAN_MANIFEST_H
#define PK_IO_PLAN_MANIFEST_H

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "pk/car/cid.h"
#include "pk/piece/plan_builder.h"

namespace pk::io {

/// @brief Parsed manifest contents.
struct PlanManifest {
    piece::PieceDescriptor piece;
    std::vector<piece::BlockCandidate> candidates;

    /// @brief Source name -> root directory.
    std::map<std::string, std::filesystem::path> sources;

    /// @brief Roots the header was generated from (empty for a hex header).
    std::vector<car::Cid> roots;
};

/// @brief Parse a manifest from JSON text.
/// @param json Manifest text.
/// @param baseDir Directory relative source roots are resolved against.
/// @throws FormatError on malformed JSON or invalid fields.
[[nodiscard]] PlanManifest parsePlanManifest(std::string_view json,
                                             const std::filesystem::path& baseDir = {});

/// @brief Read and parse a manifest file.
/// @throws IOError if the file cannot be read; FormatError if it is malformed.
[[nodiscard]] PlanManifest loadPlanManifest(const std::filesystem::path& path);

}  // namespace pk::io

#endif  // PK_IO_PLAN_MANIFEST_H
