// =============================================================================
// pgen - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// One process-wide logger named "pgen" writes to the console and, when a log
// file is configured, appends to that file. Library code logs through the
// PGEN_LOG_* macros, which drop messages until init() has run.
//
// Usage:
//   pgen::log::Config config;
//   config.level = pgen::log::Level::kInfo;
//   pgen::log::init(config);
//   PGEN_LOG_INFO("Generated {} pseudonyms", 42);
//   pgen::log::shutdown();
// =============================================================================

#ifndef PGEN_COMMON_LOGGER_H
#define PGEN_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pgen::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path, opened in append mode. Empty disables file logging.
    std::string logFile;

    /// @brief Minimum level that reaches the sinks.
    Level level = Level::kWarning;

    /// @brief Write to the console as well as the log file.
    /// @note Ignored when no log file is configured: the console is then the only sink.
    bool enableConsole = true;
};

// =============================================================================
// Logger Lifecycle
// =============================================================================

/// @brief Start the Quill backend and create the "pgen" logger.
/// @note A second call while the logger is running is ignored.
void init(const Config& config);

/// @brief The running logger, or nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush and stop the backend thread. The macros are inert afterwards.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name ("trace" ... "critical", "warn", "fatal"), case-insensitive.
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace pgen::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Messages are dropped until pgen::log::init() has run, so library code can
// log from unit tests that never set up a backend.

#define PGEN_LOG_IMPL(macro, fmt, ...)                                  \
    do {                                                                \
        if (quill::Logger* pgenLogger_ = pgen::log::logger()) {         \
            macro(pgenLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                               \
    } while (false)

#define PGEN_LOG_TRACE(fmt, ...) PGEN_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

#define PGEN_LOG_DEBUG(fmt, ...) PGEN_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

#define PGEN_LOG_INFO(fmt, ...) PGEN_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

#define PGEN_LOG_WARNING(fmt, ...) PGEN_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

#define PGEN_LOG_ERROR(fmt, ...) PGEN_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#define PGEN_LOG_CRITICAL(fmt, ...) PGEN_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PGEN_COMMON_LOGGER_H
