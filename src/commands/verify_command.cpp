// =============================================================================
// piece-kit - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <memory>
#include <string_view>

#include <fmt/format.h>
#include <xxhash.h>

#include "pk/car/cid.h"
#include "pk/car/varint.h"
#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "plan_source.h"

namespace pk::commands {

namespace {

struct Xxh64StateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

using Xxh64State = std::unique_ptr<XXH64_state_t, Xxh64StateDeleter>;

/// @brief Check one block prefix; returns an error message or empty.
std::string checkPrefix(const Bytes& varint, std::uint64_t expected) {
    auto decoded = car::decodeUvarint(varint);
    if (!decoded) {
        return decoded.error().message();
    }
    if (decoded->length != varint.size()) {
        return fmt::format("{} trailing bytes after varint", varint.size() - decoded->length);
    }
    if (decoded->value != expected) {
        return fmt::format("varint is {} but cid + payload is {}", decoded->value, expected);
    }
    return {};
}

}  // namespace

std::uint64_t parseDigest(const std::string& text) {
    std::string_view digits = text;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        digits.remove_prefix(2);
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (digits.empty() || digits.size() > 16 || ec != std::errc{} ||
        ptr != digits.data() + digits.size()) {
        throw UsageError(ErrorCode::kInvalidArgument, "Invalid XXH64 digest: " + text);
    }
    return value;
}

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

int VerifyCommand::execute() {
    try {
        if (options_.verbose) {
            std::cout << "Verifying: " << options_.planPath.string() << std::endl;
            std::cout << std::endl;
        }

        auto reader = openPlan(options_.planPath, options_.sources);
        verify(reader);
        printSummary();

        if (!summary_.passed()) {
            return toExitCode(ErrorCode::kFormatError);
        }
        return 0;

    } catch (const ChecksumError& e) {
        printSummary();
        PK_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const PieceKitException& e) {
        PK_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PK_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void VerifyCommand::verify(const piece::PieceReader& reader) {
    summary_ = VerificationSummary{};

    const auto& plan = *reader.plan();

    auto prefixResult = verifyBlockPrefixes(plan);
    report(prefixResult);
    summary_.addResult(std::move(prefixResult));

    auto cidResult = verifyBlockCids(plan);
    report(cidResult);
    summary_.addResult(std::move(cidResult));

    auto streamResult = verifyStream(reader);
    report(streamResult);
    summary_.addResult(std::move(streamResult));

    if (options_.expectedXxh64.has_value()) {
        std::uint64_t expected = parseDigest(*options_.expectedXxh64);
        VerificationResult result;
        result.checkName = "XXH64 digest";
        result.passed = (expected == digest_);
        result.details = fmt::format("{:016x}", digest_);
        if (!result.passed) {
            result.errorMessage = fmt::format("expected {:016x}, got {:016x}", expected, digest_);
        }
        report(result);
        summary_.addResult(std::move(result));
        if (expected != digest_) {
            throw ChecksumError(expected, digest_);
        }
    }
}

VerificationResult VerifyCommand::verifyBlockPrefixes(const piece::BlockPlan& plan) const {
    VerificationResult result;
    result.checkName = "Block prefixes";

    std::size_t checked = 0;
    for (std::size_t i = 0; i < plan.blocks.size(); ++i) {
        const auto& block = plan.blocks[i];
        std::string error;
        if (const auto* inlineBlock = std::get_if<piece::InlineBlock>(&block)) {
            error = checkPrefix(inlineBlock->varint,
                                inlineBlock->cid.size() + inlineBlock->data.size());
            ++checked;
        } else {
            for (const auto& entry : std::get<piece::ItemRun>(block).entries) {
                error = checkPrefix(entry.varint, entry.cid.size() + entry.itemLength);
                ++checked;
                if (!error.empty()) {
                    break;
                }
            }
        }
        if (!error.empty()) {
            result.errorMessage = fmt::format("block {}: {}", i, error);
            return result;
        }
    }

    result.passed = true;
    result.details = fmt::format("{} prefixes", checked);
    return result;
}

VerificationResult VerifyCommand::verifyBlockCids(const piece::BlockPlan& plan) const {
    VerificationResult result;
    result.checkName = "Block CIDs";

    std::size_t checked = 0;
    auto check = [&](std::size_t index, const Bytes& cid) {
        auto parsed = car::Cid::fromBytes(cid);
        ++checked;
        if (!parsed) {
            result.errorMessage = fmt::format("block {}: {}", index, parsed.error().message());
            return false;
        }
        return true;
    };

    for (std::size_t i = 0; i < plan.blocks.size(); ++i) {
        const auto& block = plan.blocks[i];
        if (const auto* inlineBlock = std::get_if<piece::InlineBlock>(&block)) {
            if (!check(i, inlineBlock->cid)) {
                return result;
            }
        } else {
            for (const auto& entry : std::get<piece::ItemRun>(block).entries) {
                if (!check(i, entry.cid)) {
                    return result;
                }
            }
        }
    }

    result.passed = true;
    result.details = fmt::format("{} CIDs", checked);
    return result;
}

VerificationResult VerifyCommand::verifyStream(const piece::PieceReader& reader) {
    VerificationResult result;
    result.checkName = "Piece length";

    Xxh64State state(XXH64_createState());
    if (!state) {
        throw IOError("Failed to create xxHash64 state");
    }
    XXH64_reset(state.get(), 0);

    auto stream = reader.makeCopy(0);
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options_.bufferSize, 1));
    std::uint64_t total = 0;
    while (true) {
        std::size_t got = stream.read(buffer);
        if (got == 0) {
            break;
        }
        XXH64_update(state.get(), buffer.data(), got);
        total += got;
    }
    digest_ = XXH64_digest(state.get());

    result.passed = (total == reader.size());
    result.details = fmt::format("{} bytes", total);
    if (!result.passed) {
        result.errorMessage = fmt::format("streamed {} bytes, expected {}", total, reader.size());
    }

    PK_LOG_INFO("Streamed {} bytes, xxh64={:016x}", total, digest_);
    return result;
}

void VerifyCommand::report(const VerificationResult& result) const {
    if (!options_.verbose) {
        return;
    }
    std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
    if (result.passed) {
        std::cout << " (" << result.details << ")";
    } else {
        std::cout << ": " << result.errorMessage;
    }
    std::cout << std::endl;
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "Plan:    " << options_.planPath.string() << std::endl;
    std::cout << "Checks:  " << summary_.passedChecks << "/" << summary_.totalChecks << " passed"
              << std::endl;
    std::cout << "XXH64:   " << fmt::format("{:016x}", digest_) << std::endl;

    if (summary_.passed()) {
        std::cout << "Status:  OK" << std::endl;
    } else {
        std::cout << "Status:  FAILED" << std::endl;
        std::cout << std::endl;
        std::cout << "Failed checks:" << std::endl;
        for (const auto& result : summary_.results) {
            if (!result.passed) {
                std::cout << "  - " << result.checkName << ": " << result.errorMessage << std::endl;
            }
        }
    }
    std::cout << "=============================" << std::endl;
}

}  // namespace pk::commands
