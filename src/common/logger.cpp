// =============================================================================
// pgen - Logger Module Implementation
// =============================================================================

#include "pgen/common/logger.h"

#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <vector>

namespace pgen::log {

namespace {

constexpr std::string_view kLoggerName = "pgen";

struct NamedLevel {
    std::string_view name;
    Level level;
};

constexpr std::array<NamedLevel, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

/// @brief Running logger; null outside init()/shutdown().
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gLifecycleMutex;

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::vector<std::shared_ptr<quill::Sink>> createSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    return sinks;
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

std::optional<Level> levelFromString(std::string_view name) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name, name)) {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    // First spelling wins, so aliases never come back out
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);

    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(std::string(kLoggerName), createSinks(config));
    created->set_log_level(toQuillLevel(config.level));

    gLogger.store(created, std::memory_order_release);

    PGEN_LOG_DEBUG("Logging at level {}{}", levelToString(config.level),
                   config.logFile.empty() ? std::string{} : " to " + config.logFile);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);

    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }

    current->flush_log();
    quill::Backend::stop();
}

}  // namespace pgen::log
