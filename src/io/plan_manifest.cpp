// =============================================================================
// piece-kit - Plan Manifest Implementation
// =============================================================================

#include "pk/io/plan_manifest.h"

#include <fstream>
#include <memory>
#include <optional>
#include <sstream>

#include <fmt/format.h>
#include <json/json.h>

#include "pk/car/car_header.h"
#include "pk/car/varint.h"
#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "pk/common/types.h"

namespace pk::io {

namespace {

[[noreturn]] void throwField(std::optional<std::size_t> block, const std::string& message) {
    ErrorContext context;
    if (block.has_value()) {
        context.withBlock(*block);
        throw FormatError(fmt::format("block {}: {}", *block, message), context);
    }
    throw FormatError(message, context);
}

std::uint64_t requireUInt64(const Json::Value& object, const char* key,
                            std::optional<std::size_t> block) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        throwField(block, fmt::format("missing field '{}'", key));
    }
    if (!value.isUInt64()) {
        throwField(block, fmt::format("field '{}' must be a non-negative integer", key));
    }
    return value.asUInt64();
}

std::optional<std::uint64_t> optionalUInt64(const Json::Value& object, const char* key,
                                            std::optional<std::size_t> block) {
    if (!object.isMember(key)) {
        return std::nullopt;
    }
    return requireUInt64(object, key, block);
}

std::string requireString(const Json::Value& object, const char* key,
                          std::optional<std::size_t> block) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        throwField(block, fmt::format("missing field '{}'", key));
    }
    if (!value.isString()) {
        throwField(block, fmt::format("field '{}' must be a string", key));
    }
    return value.asString();
}

Bytes requireHex(const Json::Value& object, const char* key, std::optional<std::size_t> block) {
    auto decoded = fromHex(requireString(object, key, block));
    if (!decoded) {
        throwField(block, fmt::format("field '{}': {}", key, decoded.error().message()));
    }
    return std::move(*decoded);
}

car::Cid parseCid(const std::string& text, std::optional<std::size_t> block) {
    auto cid = car::Cid::parse(text);
    if (!cid) {
        throwField(block, fmt::format("invalid CID '{}': {}", text, cid.error().message()));
    }
    return std::move(*cid);
}

Json::Value parseJson(std::string_view json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw FormatError("Invalid manifest JSON: " + errors);
    }
    if (!root.isObject()) {
        throw FormatError("Manifest must be a JSON object");
    }
    return root;
}

void parseHeader(const Json::Value& root, PlanManifest& manifest) {
    if (root.isMember("header") && root.isMember("roots")) {
        throw FormatError("Manifest may specify 'header' or 'roots', not both");
    }

    if (root.isMember("header")) {
        manifest.piece.header = requireHex(root, "header", std::nullopt);
        return;
    }

    if (root.isMember("roots")) {
        const Json::Value& roots = root["roots"];
        if (!roots.isArray()) {
            throw FormatError("Field 'roots' must be an array of CIDs");
        }
        for (const auto& entry : roots) {
            if (!entry.isString()) {
                throw FormatError("Field 'roots' must be an array of CIDs");
            }
            manifest.roots.push_back(parseCid(entry.asString(), std::nullopt));
        }
        manifest.piece.header = car::encodeCarHeader(manifest.roots);
    }
}

void parseSources(const Json::Value& root, const std::filesystem::path& baseDir,
                  PlanManifest& manifest) {
    if (!root.isMember("sources")) {
        return;
    }

    const Json::Value& sources = root["sources"];
    if (!sources.isObject()) {
        throw FormatError("Field 'sources' must be an object of name -> directory");
    }
    for (const auto& name : sources.getMemberNames()) {
        if (!sources[name].isString()) {
            throw FormatError(fmt::format("Source '{}' must map to a directory path", name));
        }
        std::filesystem::path dir = sources[name].asString();
        if (dir.is_relative() && !baseDir.empty()) {
            dir = baseDir / dir;
        }
        manifest.sources.emplace(name, std::move(dir));
    }
}

piece::BlockCandidate parseBlock(const Json::Value& block, std::size_t index) {
    if (!block.isObject()) {
        throwField(index, "block must be an object");
    }

    piece::BlockCandidate candidate;
    candidate.pieceOffset = requireUInt64(block, "offset", index);
    candidate.cid = parseCid(requireString(block, "cid", index), index).bytes();

    if (block.isMember("data")) {
        candidate.payload = piece::InlinePayload{requireHex(block, "data", index)};
    } else {
        piece::ItemSlice slice;
        if (block.isMember("item")) {
            const Json::Value& item = block["item"];
            if (!item.isObject()) {
                throwField(index, "field 'item' must be an object");
            }
            slice.item = ItemInfo{requireUInt64(item, "id", index),
                                  requireString(item, "path", index),
                                  requireUInt64(item, "size", index)};
        }
        if (block.isMember("source")) {
            slice.source = SourceRef{requireString(block, "source", index)};
        }
        slice.itemOffset = optionalUInt64(block, "itemOffset", index).value_or(0);
        slice.itemLength = requireUInt64(block, "itemLength", index);
        candidate.payload = std::move(slice);
    }

    std::uint64_t payloadLength = candidate.payloadLength();
    if (block.isMember("varint")) {
        candidate.varint = requireHex(block, "varint", index);
    } else {
        try {
            candidate.varint = car::encodeUvarint(candidate.cid.size() + payloadLength);
        } catch (const UsageError& ex) {
            throwField(index, ex.message());
        }
    }

    candidate.blockLength = optionalUInt64(block, "length", index)
                                .value_or(candidate.varint.size() + candidate.cid.size() +
                                          payloadLength);
    return candidate;
}

}  // namespace

PlanManifest parsePlanManifest(std::string_view json, const std::filesystem::path& baseDir) {
    Json::Value root = parseJson(json);

    PlanManifest manifest;
    parseHeader(root, manifest);
    manifest.piece.pieceSize = requireUInt64(root, "pieceSize", std::nullopt);
    parseSources(root, baseDir, manifest);

    const Json::Value& blocks = root["blocks"];
    if (!blocks.isArray()) {
        throw FormatError("Field 'blocks' must be an array");
    }
    manifest.candidates.reserve(blocks.size());
    for (Json::ArrayIndex i = 0; i < blocks.size(); ++i) {
        manifest.candidates.push_back(parseBlock(blocks[i], i));
    }

    PK_LOG_DEBUG("Parsed manifest: header={} bytes, pieceSize={}, blocks={}, sources={}",
                 manifest.piece.header.size(), manifest.piece.pieceSize,
                 manifest.candidates.size(), manifest.sources.size());
    return manifest;
}

PlanManifest loadPlanManifest(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open manifest: " + path.string(), ErrorContext(path.string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw IOError("Failed to read manifest: " + path.string(), ErrorContext(path.string()));
    }

    try {
        return parsePlanManifest(contents.str(), path.parent_path());
    } catch (const FormatError& ex) {
        ErrorContext context = ex.context().value_or(ErrorContext{});
        context.withFile(path.string());
        throw FormatError(ex.message(), context);
    }
}

}  // namespace pk::io
