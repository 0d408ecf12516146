// =============================================================================
// pgen - Verify Command
// =============================================================================
// Command handler for checking pseudonyms typed back in by a user.
//
// This module provides:
// - VerifyCommand: Validate check digits (and optionally lengths)
// - Per-entry OK/FAIL output with a summary
// =============================================================================

#ifndef PGEN_COMMANDS_VERIFY_COMMAND_H
#define PGEN_COMMANDS_VERIFY_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pgen/algo/checksum.h"
#include "pgen/common/error.h"

namespace pgen::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of checking one pseudonym.
struct VerificationResult {
    /// @brief Pseudonym as given.
    std::string pseudonym;

    bool passed = false;

    /// @brief Failure reason (if failed).
    std::string errorMessage;
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
    /// @brief Pseudonyms given on the command line.
    std::vector<std::string> pseudonyms;

    /// @brief File with one pseudonym per line (empty = none, "-" = stdin).
    std::filesystem::path inputPath;

    /// @brief Required pseudonym length, if any.
    std::optional<std::size_t> expectedLength;

    /// @brief Only print failures and the summary.
    bool failuresOnly = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for checking pseudonyms.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = all valid, kChecksumError if any entry fails).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    /// @brief Gather entries from the command line and the input file.
    [[nodiscard]] std::vector<std::string> collectEntries() const;

    /// @brief Check one pseudonym.
    [[nodiscard]] VerificationResult verifyOne(std::string_view pseudonym) const;

    void printSummary() const;

    VerifyOptions options_;
    algo::DammChecksum checksum_;
    VerificationSummary summary_;
};

}  // namespace pgen::commands

#endif  // PGEN_COMMANDS_VERIFY_COMMAND_H
