// =============================================================================
// piece-kit - Cat Command Implementation
// =============================================================================

#include "cat_command.h"

#include <algorithm>
#include <fstream>
#include <iostream>

#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "plan_source.h"

namespace pk::commands {

CatCommand::CatCommand(CatOptions options) : options_(std::move(options)) {}

int CatCommand::execute() {
    try {
        if (options_.bufferSize == 0) {
            throw UsageError(ErrorCode::kInvalidArgument, "--buffer-size must be positive");
        }

        auto reader = openPlan(options_.planPath, options_.sources);

        std::uint64_t written = 0;
        if (options_.outputPath == "-") {
            written = streamRange(reader, options_.offset, options_.length, options_.bufferSize,
                                  std::cout);
            std::cout.flush();
        } else {
            std::ofstream file(options_.outputPath, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw IOError("Failed to open output file: " + options_.outputPath,
                              ErrorContext(options_.outputPath));
            }
            written = streamRange(reader, options_.offset, options_.length, options_.bufferSize,
                                  file);
            file.close();
            if (file.fail()) {
                throw IOError("Failed to write output file: " + options_.outputPath,
                              ErrorContext(options_.outputPath));
            }
        }

        PK_LOG_INFO("Wrote {} bytes from offset {}", written, options_.offset);
        return 0;

    } catch (const PieceKitException& e) {
        PK_LOG_ERROR("Cat command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PK_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

std::uint64_t CatCommand::streamRange(const piece::PieceReader& reader, std::uint64_t offset,
                                      std::optional<std::uint64_t> length,
                                      std::size_t bufferSize, std::ostream& out) {
    auto copy = reader.makeCopy(offset);
    std::uint64_t limit = length.value_or(copy.size() - offset);

    std::vector<std::uint8_t> buffer(bufferSize);
    std::uint64_t written = 0;
    while (written < limit) {
        auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), limit - written));
        std::size_t got = copy.read(std::span<std::uint8_t>(buffer.data(), want));
        if (got == 0) {
            break;
        }
        out.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(got));
        if (!out) {
            throw IOError("Failed to write piece bytes");
        }
        written += got;
    }
    return written;
}

}  // namespace pk::commands
