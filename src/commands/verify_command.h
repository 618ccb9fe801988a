// =============================================================================
// piece-kit - Verify Command
// =============================================================================
// Command handler that checks a plan end to end.
//
// Checks:
// - Block prefixes: every varint decodes to cid + payload length
// - Block CIDs: every CID is a valid binary CID
// - Piece length: streaming the piece yields exactly the declared size
// - XXH64 digest: compared when an expected digest is given
// =============================================================================

#ifndef PK_COMMANDS_VERIFY_COMMAND_H
#define PK_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pk/common/types.h"
#include "pk/piece/piece_reader.h"

namespace pk::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;
    bool passed = false;
    std::string errorMessage;
    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;
    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Plan manifest path.
    std::filesystem::path planPath;

    /// @brief Expected XXH64 digest of the piece (hex).
    std::optional<std::string> expectedXxh64;

    /// @brief Read buffer size.
    std::size_t bufferSize = kDefaultReadBufferSize;

    /// @brief NAME=DIR source overrides.
    std::vector<std::string> sources;

    /// @brief Print each check as it completes.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying a plan.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, kChecksumError on digest mismatch).
    [[nodiscard]] int execute();

    /// @brief Run every check against reader and record the results.
    /// @throws ChecksumError if the digest does not match the expected one.
    void verify(const piece::PieceReader& reader);

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    /// @brief Digest computed by the last verify() run.
    [[nodiscard]] std::uint64_t digest() const noexcept { return digest_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VerificationResult verifyBlockPrefixes(const piece::BlockPlan& plan) const;
    [[nodiscard]] VerificationResult verifyBlockCids(const piece::BlockPlan& plan) const;
    [[nodiscard]] VerificationResult verifyStream(const piece::PieceReader& reader);

    void report(const VerificationResult& result) const;
    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
    std::uint64_t digest_ = 0;
};

/// @brief Parse a 64-bit hex digest (optionally 0x-prefixed).
/// @throws UsageError (kInvalidArgument) on malformed input.
[[nodiscard]] std::uint64_t parseDigest(const std::string& text);

}  // namespace pk::commands

#endif  // PK_COMMANDS_VERIFY_COMMAND_H
