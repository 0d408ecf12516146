// =============================================================================
// pgen - Distance-Checked Numeric Pseudonym Generator
// =============================================================================
// Main entry point for the pgen command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: generate, verify
// - Global options: verbose, quiet, log-level, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pgen/common/error.h"
#include "pgen/common/logger.h"
#include "pgen/common/types.h"

// Command implementations
#include "commands/generate_command.h"
#include "commands/verify_command.h"

// Forward declarations for command handlers
namespace pgen::commands {
int runGenerate(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace pgen::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "pgen: numeric pseudonym generator for de-identification at the source\n"
    "Pseudonyms are PREFIX + DIGITS + Damm check digit. Codes are unique and\n"
    "kept at a minimum Damerau-Levenshtein distance from each other and from\n"
    "previously issued codes, so a single typo cannot yield another valid code.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = debug
    bool quiet = false;
    std::string logLevel;  // overrides -v/-q when set
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    std::vector<std::string> prefixes;  // PREFIX[:COUNT]
    int count = pgen::kDefaultCountPerPrefix;
    int digits = pgen::kDefaultDigits;
    int minDistance = pgen::kDefaultMinDistance;
    std::optional<pgen::Seed> seed;
    std::string existing;
    bool updateExisting = false;
    std::string output;
    bool force = false;
    bool strict = false;
    bool report = false;
    int threads = 0;
    std::size_t parallelThreshold = pgen::kDefaultParallelThreshold;
};

CliGenerateOptions gGenerateOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::vector<std::string> pseudonyms;
    std::string input;
    std::size_t length = 0;  // 0 = any length
    bool failuresOnly = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Generate pseudonyms for one or more prefixes");
    generate->alias("g");

    generate->add_option("-p,--prefix", gGenerateOpts.prefixes,
                         "Prefix and count as PREFIX[:COUNT], repeatable "
                         "(default: 1000, 1100, ..., 2400)");

    generate->add_option("-n,--count", gGenerateOpts.count,
                         "Count for prefixes given without one")
        ->default_val(pgen::kDefaultCountPerPrefix)
        ->check(CLI::PositiveNumber);

    generate->add_option("-d,--digits", gGenerateOpts.digits,
                         "Number of digits in a code, check digit excluded")
        ->default_val(pgen::kDefaultDigits)
        ->check(CLI::Range(1, pgen::kMaxDigits));

    generate->add_option("-m,--min-distance", gGenerateOpts.minDistance,
                         "Minimum Damerau-Levenshtein distance between codes")
        ->default_val(pgen::kDefaultMinDistance)
        ->check(CLI::NonNegativeNumber);

    generate->add_option("-s,--seed", gGenerateOpts.seed,
                         "Shuffle seed for a reproducible run");

    generate->add_option("-e,--existing", gGenerateOpts.existing,
                         "File of previously issued codes, one per line")
        ->check(CLI::ExistingFile);

    generate->add_flag("--update-existing", gGenerateOpts.updateExisting,
                       "Append the new codes to the --existing file");

    generate->add_option("-o,--output", gGenerateOpts.output,
                         "Output file (default: stdout)");

    generate->add_flag("-f,--force", gGenerateOpts.force, "Overwrite existing output file");

    generate->add_flag("--strict", gGenerateOpts.strict,
                       "Exit with an error if some prefix gets fewer pseudonyms than requested");

    generate->add_flag("--report", gGenerateOpts.report,
                       "Print the per-prefix fulfillment report to stderr");

    generate->add_option("-t,--threads", gGenerateOpts.threads,
                         "Threads for distance evaluation (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    generate->add_option("--parallel-threshold", gGenerateOpts.parallelThreshold,
                         "Accepted codes from which distances are computed in parallel "
                         "(0 = never)")
        ->default_val(pgen::kDefaultParallelThreshold);
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Check the Damm check digit of pseudonyms");
    verify->alias("v");

    verify->add_option("pseudonyms", gVerifyOpts.pseudonyms, "Pseudonyms to check");

    verify->add_option("-i,--input", gVerifyOpts.input,
                       "File with one pseudonym per line (or '-' for stdin)")
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    verify->add_option("-l,--length", gVerifyOpts.length,
                       "Required pseudonym length (0 = any)")
        ->default_val(0);

    verify->add_flag("--failures-only", gVerifyOpts.failuresOnly,
                     "Only list pseudonyms that fail");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v, -vv for debug)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error",
                               "critical", "fatal"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile,
                   "Also write log messages to this file");

    setupGenerateCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        pgen::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        if (!gOptions.logLevel.empty()) {
            logConfig.level =
                pgen::log::levelFromString(gOptions.logLevel).value_or(logConfig.level);
        } else if (gOptions.quiet) {
            logConfig.level = pgen::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logConfig.level = pgen::log::Level::kDebug;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = pgen::log::Level::kInfo;
        }
        pgen::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("generate")) {
            exitCode = pgen::commands::runGenerate(app.get_subcommand("generate"));
        } else if (app.got_subcommand("verify")) {
            exitCode = pgen::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const pgen::PgenException& ex) {
        PGEN_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PGEN_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    pgen::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace pgen::commands {

int runGenerate([[maybe_unused]] CLI::App* app) {
    GenerateOptions opts;
    for (const auto& text : gGenerateOpts.prefixes) {
        opts.prefixes.push_back(unwrapOrThrow(algo::parsePrefixQuota(text, gGenerateOpts.count)));
    }
    if (opts.prefixes.empty()) {
        opts.prefixes = algo::defaultPrefixQuotas(gGenerateOpts.count);
    }

    opts.digits = gGenerateOpts.digits;
    opts.minDistance = gGenerateOpts.minDistance;
    opts.seed = gGenerateOpts.seed;
    opts.existingPath = gGenerateOpts.existing;
    opts.updateExisting = gGenerateOpts.updateExisting;
    opts.outputPath = gGenerateOpts.output;
    opts.forceOverwrite = gGenerateOpts.force;
    opts.strict = gGenerateOpts.strict;
    opts.showReport = gGenerateOpts.report;
    opts.threads = gGenerateOpts.threads;
    opts.parallelThreshold = gGenerateOpts.parallelThreshold;

    auto cmd = std::make_unique<GenerateCommand>(std::move(opts));
    return cmd->execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.pseudonyms = gVerifyOpts.pseudonyms;
    opts.inputPath = gVerifyOpts.input;
    if (gVerifyOpts.length > 0) {
        opts.expectedLength = gVerifyOpts.length;
    }
    opts.failuresOnly = gVerifyOpts.failuresOnly;

    auto cmd = std::make_unique<VerifyCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace pgen::commands
