// =============================================================================
// pgen - Logger Tests
// =============================================================================
// Unit tests for level parsing and the file-backed logger lifecycle.
// =============================================================================

#include "pgen/common/logger.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

namespace pgen::log {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

/// @brief Create a unique temporary file path.
[[nodiscard]] std::filesystem::path tempFilePath() {
    static std::atomic<int> counter{0};
    auto path = std::filesystem::temp_directory_path() /
                ("pgen_log_test_" + std::to_string(counter++) + "_" +
                 std::to_string(std::random_device{}()) + ".log");
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

[[nodiscard]] std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

// =============================================================================
// Level Conversion Tests
// =============================================================================

TEST(LoggerLevelTest, NamesRoundTrip) {
    for (auto level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                       Level::kError, Level::kCritical}) {
        auto parsed = levelFromString(levelToString(level));
        ASSERT_TRUE(parsed.has_value()) << levelToString(level);
        EXPECT_EQ(*parsed, level);
    }
}

TEST(LoggerLevelTest, ParsingIgnoresCaseAndAcceptsAliases) {
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
    EXPECT_EQ(levelToString(Level::kWarning), "warning");
    EXPECT_EQ(levelToString(Level::kCritical), "critical");
}

TEST(LoggerLevelTest, UnknownNamesAreRejected) {
    EXPECT_FALSE(levelFromString("").has_value());
    EXPECT_FALSE(levelFromString("verbose").has_value());
    EXPECT_FALSE(levelFromString("info ").has_value());
}

TEST(LoggerLevelTest, MapsToQuillLevels) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kDebug), quill::LogLevel::Debug);
    EXPECT_EQ(toQuillLevel(Level::kInfo), quill::LogLevel::Info);
    EXPECT_EQ(toQuillLevel(Level::kWarning), quill::LogLevel::Warning);
    EXPECT_EQ(toQuillLevel(Level::kError), quill::LogLevel::Error);
    EXPECT_EQ(toQuillLevel(Level::kCritical), quill::LogLevel::Critical);
}

// =============================================================================
// Lifecycle Tests
// =============================================================================
// The Quill backend is started once per process, so the whole lifecycle runs
// in a single test.

TEST(LoggerLifecycleTest, FileSinkReceivesMessagesAtOrAboveLevel) {
    auto path = tempFilePath();
    TempFileGuard guard(path);

    ASSERT_EQ(logger(), nullptr);
    PGEN_LOG_ERROR("dropped before init");

    Config config;
    config.logFile = path.string();
    config.level = Level::kInfo;
    config.enableConsole = false;
    init(config);
    ASSERT_NE(logger(), nullptr);

    quill::Logger* first = logger();
    init(config);
    EXPECT_EQ(logger(), first);

    PGEN_LOG_INFO("generated {} pseudonyms", 42);
    PGEN_LOG_DEBUG("candidate table built");
    PGEN_LOG_WARNING("prefix {} short by {}", "1000", 3);

    shutdown();
    EXPECT_EQ(logger(), nullptr);
    PGEN_LOG_ERROR("dropped after shutdown");
    shutdown();

    const std::string content = readFile(path);
    EXPECT_NE(content.find("generated 42 pseudonyms"), std::string::npos) << content;
    EXPECT_NE(content.find("prefix 1000 short by 3"), std::string::npos) << content;
    EXPECT_EQ(content.find("candidate table built"), std::string::npos) << content;
    EXPECT_EQ(content.find("dropped"), std::string::npos) << content;
}

}  // namespace
}  // namespace pgen::log
