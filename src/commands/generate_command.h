// =============================================================================
// pgen - Generate Command
// =============================================================================
// Command handler for generating pseudonyms.
//
// This module provides:
// - GenerateCommand: Load existing codes, run the generator, write pseudonyms
// - Fulfillment report printing and strict under-delivery handling
// - Optional update of the existing-code file with the new codes
// =============================================================================

#ifndef PGEN_COMMANDS_GENERATE_COMMAND_H
#define PGEN_COMMANDS_GENERATE_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <vector>

#include "pgen/algo/pseudonym_generator.h"
#include "pgen/common/error.h"
#include "pgen/common/types.h"

namespace pgen::commands {

// =============================================================================
// Generate Options
// =============================================================================

/// @brief Configuration options for generate command.
struct GenerateOptions {
    /// @brief Prefixes and target counts, in priority order.
    PrefixQuotaList prefixes;

    /// @brief Candidate length (check digit excluded).
    int digits = kDefaultDigits;

    /// @brief Minimum Damerau-Levenshtein distance between codes.
    int minDistance = kDefaultMinDistance;

    /// @brief Shuffle seed (unset = random).
    std::optional<Seed> seed;

    /// @brief Existing-code file (empty = no previous codes).
    std::filesystem::path existingPath;

    /// @brief Append newly generated codes to the existing-code file.
    bool updateExisting = false;

    /// @brief Output file (empty or "-" = stdout).
    std::filesystem::path outputPath;

    /// @brief Overwrite the output file if it exists.
    bool forceOverwrite = false;

    /// @brief Fail with kIncomplete when some prefix falls short.
    bool strict = false;

    /// @brief Print the fulfillment report after the run.
    bool showReport = false;

    /// @brief Worker threads for distance evaluation (0 = auto-detect).
    int threads = 0;

    /// @brief AcceptedSet size from which distances are computed in parallel.
    std::size_t parallelThreshold = kDefaultParallelThreshold;
};

// =============================================================================
// GenerateCommand Class
// =============================================================================

/// @brief Command handler for generating pseudonyms.
class GenerateCommand {
public:
    explicit GenerateCommand(GenerateOptions options);

    ~GenerateCommand();

    // Non-copyable, movable
    GenerateCommand(const GenerateCommand&) = delete;
    GenerateCommand& operator=(const GenerateCommand&) = delete;
    GenerateCommand(GenerateCommand&&) noexcept;
    GenerateCommand& operator=(GenerateCommand&&) noexcept;

    /// @brief Execute the generate command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Fulfillment report of the last run (empty before execute()).
    [[nodiscard]] const algo::FulfillmentReport& report() const noexcept { return report_; }

    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    /// @brief Validate options before touching any file.
    void validateOptions() const;

    /// @brief Build the generator configuration from the options.
    [[nodiscard]] algo::GeneratorConfig buildConfig() const;

    /// @brief Run the generator against the existing codes, writing each
    ///        pseudonym to out.
    /// @return Codes issued by this run, in output order.
    [[nodiscard]] std::vector<Code> generate(std::ostream& out, std::span<const Code> existing);

    /// @brief Print the fulfillment report to the given stream.
    void printReport(std::ostream& out) const;

    GenerateOptions options_;
    algo::FulfillmentReport report_;
};

/// @brief Write a fulfillment report as a text table.
void writeReport(std::ostream& out, const algo::FulfillmentReport& report);

}  // namespace pgen::commands

#endif  // PGEN_COMMANDS_GENERATE_COMMAND_H
