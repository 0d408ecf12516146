// =============================================================================
// pgen - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <fstream>
#include <iostream>

#include "pgen/common/logger.h"
#include "pgen/common/types.h"

namespace pgen::commands {

namespace {

void readEntries(std::istream& input, std::vector<std::string>& entries) {
    std::string line;
    while (std::getline(input, line)) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        entries.push_back(line.substr(first, last - first + 1));
    }
}

}  // namespace

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        const auto entries = collectEntries();
        if (entries.empty()) {
            throw UsageError("No pseudonyms to verify");
        }

        for (const auto& entry : entries) {
            auto result = verifyOne(entry);
            if (!result.passed) {
                std::cout << "FAIL " << result.pseudonym << ": " << result.errorMessage
                          << std::endl;
            } else if (!options_.failuresOnly) {
                std::cout << "OK   " << result.pseudonym << std::endl;
            }
            summary_.addResult(std::move(result));
        }

        printSummary();

        return summary_.passed() ? 0 : toExitCode(ErrorCode::kChecksumError);

    } catch (const PgenException& e) {
        PGEN_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PGEN_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

std::vector<std::string> VerifyCommand::collectEntries() const {
    std::vector<std::string> entries = options_.pseudonyms;

    if (options_.inputPath.empty()) {
        return entries;
    }

    if (options_.inputPath == "-") {
        readEntries(std::cin, entries);
        return entries;
    }

    std::ifstream file(options_.inputPath);
    if (!file) {
        throw IOError("Failed to open input file: " + options_.inputPath.string());
    }
    readEntries(file, entries);
    if (file.bad()) {
        throw IOError("Failed to read input file: " + options_.inputPath.string());
    }
    return entries;
}

VerificationResult VerifyCommand::verifyOne(std::string_view pseudonym) const {
    VerificationResult result;
    result.pseudonym = std::string(pseudonym);

    if (!isDigitString(pseudonym)) {
        result.errorMessage = "not a digit string";
        return result;
    }

    if (options_.expectedLength.has_value() && pseudonym.size() != *options_.expectedLength) {
        result.errorMessage = "expected " + std::to_string(*options_.expectedLength) +
                              " digits, got " + std::to_string(pseudonym.size());
        return result;
    }

    if (pseudonym.size() < 2) {
        result.errorMessage = "too short";
        return result;
    }

    if (!checksum_.validate(pseudonym)) {
        const auto body = pseudonym.substr(0, pseudonym.size() - 1);
        result.errorMessage =
            ChecksumError::formatCheckDigitMismatch(checksum_.checkDigit(body), pseudonym.back());
        return result;
    }

    result.passed = true;
    return result;
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "Checked: " << summary_.totalChecks << std::endl;
    std::cout << "Valid:   " << summary_.passedChecks << "/" << summary_.totalChecks << std::endl;
    std::cout << "Status:  " << (summary_.passed() ? "OK" : "FAILED") << std::endl;
    std::cout << "============================" << std::endl;
}

}  // namespace pgen::commands
