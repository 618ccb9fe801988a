// =============================================================================
// piece-kit - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iostream>

#include <fmt/format.h>

#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "pk/common/types.h"
#include "plan_source.h"

namespace pk::commands {

std::string jsonEscape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

int InfoCommand::execute() {
    try {
        auto reader = openPlan(options_.planPath, options_.sources);

        if (options_.jsonOutput) {
            printJsonInfo(*reader.plan(), std::cout);
        } else {
            printTextInfo(*reader.plan(), std::cout);
        }
        return 0;

    } catch (const PieceKitException& e) {
        PK_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PK_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void InfoCommand::printTextInfo(const piece::BlockPlan& plan, std::ostream& out) const {
    out << "=== Piece Plan Information ===" << '\n';
    out << '\n';
    out << "Plan:           " << options_.planPath.string() << '\n';
    out << "Piece size:     " << plan.pieceSize << " bytes" << '\n';
    out << "Header size:    " << plan.header.size() << " bytes" << '\n';
    out << "Candidates:     " << plan.candidateCount << '\n';
    out << "Blocks:         " << plan.blocks.size() << '\n';
    out << "  Inline:       " << plan.inlineBlockCount() << '\n';
    out << "  Item runs:    " << plan.itemRunCount() << '\n';

    if (options_.detailed) {
        printBlockDetails(plan, out);
    }

    out << '\n';
    out << "==============================" << std::endl;
}

void InfoCommand::printJsonInfo(const piece::BlockPlan& plan, std::ostream& out) const {
    out << "{\n";
    out << "  \"plan\": \"" << jsonEscape(options_.planPath.string()) << "\",\n";
    out << "  \"piece_size\": " << plan.pieceSize << ",\n";
    out << "  \"header_size\": " << plan.header.size() << ",\n";
    out << "  \"candidates\": " << plan.candidateCount << ",\n";
    out << "  \"blocks\": " << plan.blocks.size() << ",\n";
    out << "  \"inline_blocks\": " << plan.inlineBlockCount() << ",\n";
    out << "  \"item_runs\": " << plan.itemRunCount();

    if (options_.detailed) {
        out << ",\n  \"block_list\": [";
        for (std::size_t i = 0; i < plan.blocks.size(); ++i) {
            const auto& block = plan.blocks[i];
            out << (i == 0 ? "\n" : ",\n");
            out << "    {\"offset\": " << piece::blockStart(block)
                << ", \"length\": " << piece::blockEnd(block) - piece::blockStart(block);
            if (const auto* run = std::get_if<piece::ItemRun>(&block)) {
                out << ", \"type\": \"item_run\", \"item_id\": " << run->item.id
                    << ", \"path\": \"" << jsonEscape(run->item.path) << "\""
                    << ", \"source\": \"" << jsonEscape(run->source.name) << "\""
                    << ", \"entries\": " << run->entries.size()
                    << ", \"payload_bytes\": " << run->payloadBytes() << "}";
            } else {
                out << ", \"type\": \"inline\"}";
            }
        }
        out << "\n  ]";
    }

    out << "\n}" << std::endl;
}

void InfoCommand::printBlockDetails(const piece::BlockPlan& plan, std::ostream& out) const {
    out << '\n';
    out << "--- Block Details ---" << '\n';
    for (std::size_t i = 0; i < plan.blocks.size(); ++i) {
        const auto& block = plan.blocks[i];
        out << "[" << i << "] offset " << piece::blockStart(block) << " - "
            << piece::blockEnd(block);
        if (const auto* run = std::get_if<piece::ItemRun>(&block)) {
            out << "  item run: item " << run->item.id << " (" << run->item.path << ") from '"
                << run->source.name << "', " << run->entries.size() << " blocks, "
                << run->payloadBytes() << " payload bytes";
        } else {
            const auto& inlineBlock = std::get<piece::InlineBlock>(block);
            out << "  inline: cid " << toHex(inlineBlock.cid) << ", " << inlineBlock.data.size()
                << " payload bytes";
        }
        out << '\n';
    }
}

}  // namespace pk::commands
