// =============================================================================
// pgen - Verify Command Tests
// =============================================================================
// Tests for check digit verification of pseudonyms given on the command line
// or read from a file.
// =============================================================================

#include "commands/verify_command.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace pgen::commands {
namespace {

/// @brief Create a unique temporary file path.
[[nodiscard]] std::filesystem::path tempFilePath() {
    static std::atomic<int> counter{0};
    auto path = std::filesystem::temp_directory_path() /
                ("pgen_verify_test_" + std::to_string(counter++) + "_" +
                 std::to_string(std::random_device{}()) + ".txt");
    return path;
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

private:
    std::filesystem::path path_;
};

/// @brief A valid pseudonym for body, and the same body with another check digit.
struct PseudonymPair {
    std::string valid;
    std::string invalid;
    char expected;
    char actual;
};

PseudonymPair makePair(const std::string& body) {
    const char expected = algo::dammCheckDigit(body);
    const char actual = expected == '9' ? '0' : static_cast<char>(expected + 1);
    return {body + expected, body + actual, expected, actual};
}

// =============================================================================
// VerifyCommand Tests
// =============================================================================

TEST(VerifyCommandTest, ValidPseudonymsPass) {
    VerifyOptions options;
    options.pseudonyms = {makePair("100012345").valid, makePair("2400").valid};
    options.failuresOnly = true;

    VerifyCommand cmd(options);
    EXPECT_EQ(cmd.execute(), 0);
    EXPECT_EQ(cmd.summary().totalChecks, 2u);
    EXPECT_TRUE(cmd.summary().passed());
}

TEST(VerifyCommandTest, WrongCheckDigitReportsMismatch) {
    const auto pair = makePair("572");

    VerifyOptions options;
    options.pseudonyms = {pair.valid, pair.invalid};
    options.failuresOnly = true;

    VerifyCommand cmd(options);
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kChecksumError));

    const auto& summary = cmd.summary();
    ASSERT_EQ(summary.results.size(), 2u);
    EXPECT_TRUE(summary.results[0].passed);
    EXPECT_FALSE(summary.results[1].passed);
    EXPECT_EQ(summary.results[1].errorMessage,
              ChecksumError::formatCheckDigitMismatch(pair.expected, pair.actual));
    EXPECT_EQ(summary.failedChecks, 1u);
}

TEST(VerifyCommandTest, MalformedEntriesFailWithoutChecksum) {
    VerifyOptions options;
    options.pseudonyms = {"12a4", "7", makePair("1000123").valid};
    options.expectedLength = 8;
    options.failuresOnly = true;

    VerifyCommand cmd(options);
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kChecksumError));

    const auto& results = cmd.summary().results;
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].errorMessage, "not a digit string");
    EXPECT_EQ(results[1].errorMessage, "expected 8 digits, got 1");
    EXPECT_TRUE(results[2].passed);
}

TEST(VerifyCommandTest, ReadsEntriesFromFile) {
    auto path = tempFilePath();
    TempFileGuard guard(path);
    {
        std::ofstream file(path);
        file << "# issued 2026\n\n  " << makePair("1100").valid << "  \n"
             << makePair("1200").invalid << '\n';
    }

    VerifyOptions options;
    options.inputPath = path;
    options.failuresOnly = true;

    VerifyCommand cmd(options);
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kChecksumError));
    EXPECT_EQ(cmd.summary().totalChecks, 2u);
    EXPECT_EQ(cmd.summary().passedChecks, 1u);
}

TEST(VerifyCommandTest, NothingToVerifyIsUsageError) {
    VerifyCommand cmd(VerifyOptions{});
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kUsageError));
}

TEST(VerifyCommandTest, MissingInputFileIsIOError) {
    VerifyOptions options;
    options.inputPath = tempFilePath();

    VerifyCommand cmd(options);
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kIOError));
}

}  // namespace
}  // namespace pgen::commands
