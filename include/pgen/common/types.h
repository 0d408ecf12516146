// =============================================================================
// pgen - Common Type Definitions
// =============================================================================
// Core type definitions for the pgen library.
//
// This module defines:
// - Prefix, Code, Pseudonym: string aliases for the three identifier layers
// - PrefixQuota: a prefix and the number of pseudonyms requested for it
// - Default generation parameters
// - Digit string helpers shared by the algorithms and the I/O layer
//
// A pseudonym is laid out as:
//
//   +----------+--------------------+-------------+
//   |  prefix  |  candidate digits  | check digit |
//   +----------+--------------------+-------------+
//              |<------------- code ------------->|
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef PGEN_COMMON_TYPES_H
#define PGEN_COMMON_TYPES_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pgen {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Digit string identifying a cohort or acquisition site.
using Prefix = std::string;

/// @brief Candidate digits followed by one check digit.
/// @note Codes are unique across all prefixes of a run.
using Code = std::string;

/// @brief Final identifier: prefix followed by code.
using Pseudonym = std::string;

/// @brief Seed type for the candidate shuffle.
using Seed = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of candidate digits in a code (check digit excluded).
inline constexpr int kDefaultDigits = 5;

/// @brief Default minimum Damerau-Levenshtein distance between codes.
inline constexpr int kDefaultMinDistance = 3;

/// @brief Default number of pseudonyms requested per prefix.
inline constexpr int kDefaultCountPerPrefix = 20;

/// @brief Largest supported candidate length.
/// @note The whole candidate space is held in memory (8 digits = 9e7 values).
inline constexpr int kMaxDigits = 8;

/// @brief Shortest run of identical consecutive digits that rejects a candidate.
inline constexpr std::size_t kRepeatedRunLength = 3;

/// @brief AcceptedSet size from which distances are evaluated in parallel.
inline constexpr std::size_t kDefaultParallelThreshold = 4096;

// =============================================================================
// Prefix Quota
// =============================================================================

/// @brief A prefix and the number of pseudonyms requested for it.
struct PrefixQuota {
    Prefix prefix;
    int count = kDefaultCountPerPrefix;

    [[nodiscard]] bool operator==(const PrefixQuota& other) const noexcept = default;
};

/// @brief Ordered list of prefix quotas.
/// @note Order matters: when a candidate suits several prefixes the first
///       pending one in this list receives it.
using PrefixQuotaList = std::vector<PrefixQuota>;

// =============================================================================
// Digit String Helpers
// =============================================================================

/// @brief Check that a string is non-empty and made only of ASCII digits.
[[nodiscard]] inline bool isDigitString(std::string_view str) noexcept {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/// @brief Length of a pseudonym for a given prefix length and digit count.
[[nodiscard]] constexpr std::size_t pseudonymLength(std::size_t prefixLength,
                                                    int digits) noexcept {
    return prefixLength + static_cast<std::size_t>(digits) + 1;
}

}  // namespace pgen

#endif  // PGEN_COMMON_TYPES_H
