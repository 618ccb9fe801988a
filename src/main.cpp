// =============================================================================
// piece-kit - Piece Assembly Toolkit
// =============================================================================
// Main entry point for the piecekit command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: cat, info, verify
// - Global options: verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "pk/common/error.h"
#include "pk/common/logger.h"
#include "pk/common/types.h"

#include "commands/cat_command.h"
#include "commands/info_command.h"
#include "commands/verify_command.h"

namespace pk::commands {
int runCat(CLI::App* app);
int runInfo(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace pk::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "piecekit: stream data pieces assembled from inline blocks and item slices\n"
    "A plan manifest lists the piece header and its blocks; item payloads are\n"
    "read lazily from local source directories.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logLevel;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Cat Command Options
// =============================================================================

struct CliCatOptions {
    std::string plan;
    std::string output = "-";
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::size_t bufferSize = pk::kDefaultReadBufferSize;
    std::vector<std::string> sources;
};

CliCatOptions gCatOpts;
CLI::Option* gCatLengthOpt = nullptr;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string plan;
    bool json = false;
    bool detailed = false;
    std::vector<std::string> sources;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string plan;
    std::string xxh64;
    std::size_t bufferSize = pk::kDefaultReadBufferSize;
    std::vector<std::string> sources;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCatCommand(CLI::App& app) {
    auto* cat = app.add_subcommand("cat", "Stream piece bytes to a file or stdout");

    cat->add_option("-p,--plan", gCatOpts.plan, "Plan manifest (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    cat->add_option("-o,--output", gCatOpts.output, "Output file (or '-' for stdout)")
        ->default_val("-");

    cat->add_option("--offset", gCatOpts.offset, "First piece offset to emit")->default_val(0);

    gCatLengthOpt = cat->add_option("--length", gCatOpts.length,
                                    "Number of bytes to emit (default: to end of piece)");

    cat->add_option("--buffer-size", gCatOpts.bufferSize, "Read buffer size in bytes")
        ->default_val(pk::kDefaultReadBufferSize)
        ->check(CLI::PositiveNumber);

    cat->add_option("--source", gCatOpts.sources, "Override a source root (NAME=DIR)");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display plan information");
    info->alias("i");

    info->add_option("-p,--plan", gInfoOpts.plan, "Plan manifest (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--detailed", gInfoOpts.detailed, "Show every block and item run");

    info->add_option("--source", gInfoOpts.sources, "Override a source root (NAME=DIR)");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Stream a piece and check its structure");

    verify->add_option("-p,--plan", gVerifyOpts.plan, "Plan manifest (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_option("--xxh64", gVerifyOpts.xxh64, "Expected XXH64 digest of the piece (hex)");

    verify->add_option("--buffer-size", gVerifyOpts.bufferSize, "Read buffer size in bytes")
        ->default_val(pk::kDefaultReadBufferSize)
        ->check(CLI::PositiveNumber);

    verify->add_option("--source", gVerifyOpts.sources, "Override a source root (NAME=DIR)");

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show each check as it completes");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level (trace, debug, info, warning, error, critical); overrides -v/-q");

    app.add_option("--log-file", gOptions.logFile, "Append log output to this file");

    setupCatCommand(app);
    setupInfoCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    auto logLevel = pk::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
    if (!gOptions.logLevel.empty()) {
        auto parsed = pk::log::parseLevel(gOptions.logLevel);
        if (!parsed) {
            std::cerr << "Invalid --log-level: " << gOptions.logLevel << std::endl;
            return pk::toExitCode(pk::ErrorCode::kUsageError);
        }
        logLevel = *parsed;
    }

    try {
        pk::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    PK_LOG_DEBUG("Logging at {} level", pk::log::levelName(logLevel));

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("cat")) {
            exitCode = pk::commands::runCat(app.get_subcommand("cat"));
        } else if (app.got_subcommand("info")) {
            exitCode = pk::commands::runInfo(app.get_subcommand("info"));
        } else if (app.got_subcommand("verify")) {
            exitCode = pk::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const pk::PieceKitException& ex) {
        PK_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PK_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    pk::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace pk::commands {

int runCat([[maybe_unused]] CLI::App* app) {
    CatOptions opts;
    opts.planPath = gCatOpts.plan;
    opts.outputPath = gCatOpts.output;
    opts.offset = gCatOpts.offset;
    if (gCatLengthOpt != nullptr && gCatLengthOpt->count() > 0) {
        opts.length = gCatOpts.length;
    }
    opts.bufferSize = gCatOpts.bufferSize;
    opts.sources = gCatOpts.sources;

    CatCommand cmd(std::move(opts));
    return cmd.execute();
}

int runInfo([[maybe_unused]] CLI::App* app) {
    InfoOptions opts;
    opts.planPath = gInfoOpts.plan;
    opts.jsonOutput = gInfoOpts.json;
    opts.detailed = gInfoOpts.detailed;
    opts.sources = gInfoOpts.sources;

    InfoCommand cmd(std::move(opts));
    return cmd.execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.planPath = gVerifyOpts.plan;
    if (!gVerifyOpts.xxh64.empty()) {
        opts.expectedXxh64 = gVerifyOpts.xxh64;
    }
    opts.bufferSize = gVerifyOpts.bufferSize;
    opts.sources = gVerifyOpts.sources;
    opts.verbose = gVerifyOpts.verbose;

    VerifyCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace pk::commands
