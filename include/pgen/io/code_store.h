// =============================================================================
// pgen - Existing Code Store
// =============================================================================
// Sources of previously issued codes. Their contents seed the AcceptedSet so
// new codes stay unique and distant from codes already in circulation.
//
// This module provides:
// - ICodeStore: interface used by the generate command
// - EmptyCodeStore: no previous codes
// - FileCodeStore: plain text file, one code per line
//
// File format:
//   # comment lines and blank lines are ignored
//   123456
//   204718
//
// Codes are stored without their prefix (digits + check digit only).
// =============================================================================

#ifndef PGEN_IO_CODE_STORE_H
#define PGEN_IO_CODE_STORE_H

#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "pgen/common/error.h"
#include "pgen/common/types.h"

namespace pgen::io {

// =============================================================================
// Code Store Interface
// =============================================================================

/// @brief Provider of previously issued codes.
class ICodeStore {
public:
    virtual ~ICodeStore() = default;

    /// @brief Load every previously issued code.
    /// @throws IOError if the store cannot be read.
    /// @throws FormatError if an entry is not a digit string.
    [[nodiscard]] virtual std::vector<Code> load() = 0;

    /// @brief Record newly issued codes.
    /// @throws IOError if the store cannot be written.
    virtual void append(std::span<const Code> codes) = 0;

    /// @brief Human-readable description for logs.
    [[nodiscard]] virtual std::string description() const = 0;
};

// =============================================================================
// Empty Code Store
// =============================================================================

/// @brief Store with no previous codes. Appends are discarded.
class EmptyCodeStore final : public ICodeStore {
public:
    [[nodiscard]] std::vector<Code> load() override { return {}; }

    void append(std::span<const Code> /*codes*/) override {}

    [[nodiscard]] std::string description() const override { return "(none)"; }
};

// =============================================================================
// File Code Store
// =============================================================================

/// @brief Plain text file with one code per line.
class FileCodeStore final : public ICodeStore {
public:
    explicit FileCodeStore(std::filesystem::path path);

    /// @throws IOError if the file is missing or unreadable.
    /// @throws FormatError with the line number of the first bad entry.
    [[nodiscard]] std::vector<Code> load() override;

    /// @brief Append codes, one per line, creating the file if needed.
    void append(std::span<const Code> codes) override;

    [[nodiscard]] std::string description() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Parse codes from a stream in the store file format.
    /// @param input Stream to read.
    /// @param sourceName Name used in error context.
    /// @throws FormatError on a non-digit entry.
    [[nodiscard]] static std::vector<Code> parse(std::istream& input,
                                                 const std::string& sourceName);

private:
    std::filesystem::path path_;
};

/// @brief Create a store: FileCodeStore for a non-empty path, else EmptyCodeStore.
[[nodiscard]] std::unique_ptr<ICodeStore> createCodeStore(const std::filesystem::path& path);

}  // namespace pgen::io

#endif  // PGEN_IO_CODE_STORE_H
