// =============================================================================
// pgen - Existing Code Store Implementation
// =============================================================================

#include "pgen/io/code_store.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <string_view>
#include <system_error>

#include "pgen/common/logger.h"

namespace pgen::io {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view str) noexcept {
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

}  // namespace

// =============================================================================
// FileCodeStore Implementation
// =============================================================================

FileCodeStore::FileCodeStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<Code> FileCodeStore::parse(std::istream& input, const std::string& sourceName) {
    std::vector<Code> codes;
    std::string line;
    std::uint64_t lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        const std::string_view entry = trim(line);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        if (!isDigitString(entry)) {
            throw FormatError("Invalid code '" + std::string(entry) + "': expected digits only",
                              ErrorContext(sourceName).withLine(lineNumber));
        }
        codes.emplace_back(entry);
    }

    return codes;
}

std::vector<Code> FileCodeStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw IOError("Existing code file not found: " + path_.string());
    }

    std::ifstream file(path_);
    if (!file) {
        throw IOError("Failed to open existing code file",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(path_.string()));
    }

    auto codes = parse(file, path_.string());
    if (file.bad()) {
        throw IOError("Failed to read existing code file", ErrorContext(path_.string()));
    }

    PGEN_LOG_INFO("Loaded {} existing codes from {}", codes.size(), path_.string());
    return codes;
}

void FileCodeStore::append(std::span<const Code> codes) {
    std::ofstream file(path_, std::ios::app);
    if (!file) {
        throw IOError("Failed to open existing code file for writing",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(path_.string()));
    }

    for (const auto& code : codes) {
        file << code << '\n';
    }

    file.flush();
    if (!file) {
        throw IOError("Failed to write existing code file", ErrorContext(path_.string()));
    }

    PGEN_LOG_INFO("Appended {} codes to {}", codes.size(), path_.string());
}

std::unique_ptr<ICodeStore> createCodeStore(const std::filesystem::path& path) {
    if (path.empty()) {
        return std::make_unique<EmptyCodeStore>();
    }
    return std::make_unique<FileCodeStore>(path);
}

}  // namespace pgen::io
