// =============================================================================
// piece-kit - Plan Loading for Commands Implementation
// =============================================================================

#include "plan_source.h"

#include <memory>

#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "pk/io/local_source.h"
#include "pk/io/plan_manifest.h"

namespace pk::commands {

std::map<std::string, std::filesystem::path> parseSourceOverrides(
    const std::vector<std::string>& specs) {
    std::map<std::string, std::filesystem::path> overrides;
    for (const auto& spec : specs) {
        auto eq = spec.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw UsageError("Invalid --source value (expected NAME=DIR): " + spec);
        }
        overrides[spec.substr(0, eq)] = spec.substr(eq + 1);
    }
    return overrides;
}

piece::PieceReader openPlan(const std::filesystem::path& planPath,
                            const std::vector<std::string>& sourceOverrides) {
    auto manifest = io::loadPlanManifest(planPath);

    for (auto& [name, dir] : parseSourceOverrides(sourceOverrides)) {
        PK_LOG_DEBUG("Source override: {} -> {}", name, dir.string());
        manifest.sources[name] = std::move(dir);
    }

    auto resolver = std::make_shared<io::LocalSourceResolver>(manifest.sources);
    auto reader = piece::PieceReader::create(manifest.piece, manifest.candidates, resolver);

    PK_LOG_INFO("Loaded plan {}: {} bytes, {} blocks", planPath.string(), reader.size(),
                reader.blocks().size());
    return reader;
}

}  // namespace pk::commands
