// =============================================================================
// pgen - Candidate Space Module
// =============================================================================
// Builds the search space of candidate digit strings for a run:
// 1. Enumerate every value in [10^(digits-1), 10^digits - 1] (no leading zero)
// 2. Drop values containing a run of 3 or more identical consecutive digits
// 3. Shuffle the survivors uniformly
// 4. Hand them out one by one through a single-pass cursor
//
// The list is materialized once and never restarted: a candidate handed out
// by next() is consumed whether or not any prefix accepts it.
//
// Memory: 4 bytes per candidate (~360MB for 8 digits, ~300KB for 5 digits)
// =============================================================================

#ifndef PGEN_ALGO_CANDIDATE_SPACE_H
#define PGEN_ALGO_CANDIDATE_SPACE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "pgen/common/error.h"
#include "pgen/common/types.h"

namespace pgen::algo {

// =============================================================================
// Candidate Filters
// =============================================================================

/// @brief Check whether a string contains a run of identical characters.
/// @param str String to scan.
/// @param runLength Minimum run length that counts (default 3).
/// @return true if some character repeats at least runLength times in a row.
[[nodiscard]] bool hasRepeatedRun(std::string_view str,
                                  std::size_t runLength = kRepeatedRunLength) noexcept;

/// @brief Smallest candidate value for a digit count (10^(digits-1)).
[[nodiscard]] std::uint32_t minCandidateValue(int digits) noexcept;

/// @brief Largest candidate value for a digit count (10^digits - 1).
[[nodiscard]] std::uint32_t maxCandidateValue(int digits) noexcept;

/// @brief Check that a digit count can back a candidate space.
/// @return Usage error if digits is outside [1, kMaxDigits].
[[nodiscard]] VoidResult validateDigits(int digits);

/// @brief Enumerate valid candidate values in ascending order.
/// @param digits Candidate length, already validated.
/// @return Values whose decimal form has no repeated run.
[[nodiscard]] std::vector<std::uint32_t> enumerateCandidates(int digits);

// =============================================================================
// Candidate Space
// =============================================================================

/// @brief Shuffled, single-pass sequence of candidate digit strings.
///
/// Usage:
/// @code
/// auto space = CandidateSpace::create(5, seed);
/// while (auto candidate = space->next()) {
///     // try *candidate against every pending prefix
/// }
/// @endcode
class CandidateSpace {
public:
    /// @brief Build a shuffled candidate space.
    /// @param digits Candidate length in [1, kMaxDigits].
    /// @param rng Random engine driving the shuffle.
    /// @return Candidate space or usage error.
    [[nodiscard]] static Result<CandidateSpace> create(int digits, std::mt19937_64& rng);

    /// @brief Build a shuffled candidate space from a seed.
    [[nodiscard]] static Result<CandidateSpace> create(int digits, Seed seed);

    CandidateSpace(const CandidateSpace&) = delete;
    CandidateSpace& operator=(const CandidateSpace&) = delete;
    CandidateSpace(CandidateSpace&&) noexcept = default;
    CandidateSpace& operator=(CandidateSpace&&) noexcept = default;

    /// @brief Hand out the next candidate.
    /// @return Candidate digits, or std::nullopt once the space is exhausted.
    [[nodiscard]] std::optional<std::string> next();

    /// @brief Check whether every candidate has been handed out.
    [[nodiscard]] bool exhausted() const noexcept { return cursor_ >= values_.size(); }

    /// @brief Total number of candidates in the space.
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    /// @brief Candidates handed out so far.
    [[nodiscard]] std::size_t consumed() const noexcept { return cursor_; }

    /// @brief Candidates not yet handed out.
    [[nodiscard]] std::size_t remaining() const noexcept { return values_.size() - cursor_; }

    /// @brief Candidate length.
    [[nodiscard]] int digits() const noexcept { return digits_; }

private:
    CandidateSpace(int digits, std::vector<std::uint32_t> values) noexcept;

    int digits_;
    std::vector<std::uint32_t> values_;
    std::size_t cursor_ = 0;
};

}  // namespace pgen::algo

#endif  // PGEN_ALGO_CANDIDATE_SPACE_H
