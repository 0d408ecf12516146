// =============================================================================
// pgen - Admission Filter Module
// =============================================================================
// Decides whether a candidate code is far enough from every code already
// accepted in the run.
//
// This module provides:
// - damerauLevenshtein: unrestricted Damerau-Levenshtein edit distance
//   (insertion, deletion, substitution, adjacent transposition; unit costs)
// - AcceptedSet: insertion-ordered set of accepted codes
// - AdmissionFilter: minimum-distance admission test, optionally evaluated
//   with TBB against the current snapshot of the AcceptedSet
//
// Cost: O(|accepted| * L^2) per admission test, L = code length. This is
// the dominant cost of a run (O(total_codes^2 * L^2) overall).
// =============================================================================

#ifndef PGEN_ALGO_ADMISSION_FILTER_H
#define PGEN_ALGO_ADMISSION_FILTER_H

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "pgen/common/types.h"

namespace pgen::algo {

// =============================================================================
// Edit Distance
// =============================================================================

/// @brief Unrestricted Damerau-Levenshtein distance between two strings.
/// @note Unlike the optimal string alignment variant, a transposed pair may
///       be edited again ("ca" -> "abc" costs 2).
[[nodiscard]] std::size_t damerauLevenshtein(std::string_view a, std::string_view b);

// =============================================================================
// Accepted Set
// =============================================================================

/// @brief Codes accepted so far in a run, seeded with previously issued codes.
///
/// Codes are kept in insertion order for the distance scan and indexed for
/// O(1) membership checks. The set only grows: codes are never removed.
///
/// The set is owned by the caller and handed to the generator by reference,
/// so a caller can chain runs or persist the new codes afterwards.
class AcceptedSet {
public:
    AcceptedSet() = default;

    /// @brief Seed the set with previously issued codes.
    /// @note Duplicates in existing are collapsed. Seeded codes are not
    ///       checked against each other.
    explicit AcceptedSet(std::span<const Code> existing);

    /// @brief Check whether a code is already present.
    [[nodiscard]] bool contains(std::string_view code) const;

    /// @brief Insert a code.
    /// @return false if the code was already present.
    bool insert(Code code);

    [[nodiscard]] std::size_t size() const noexcept { return codes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return codes_.empty(); }

    /// @brief All codes, seeded ones first, in insertion order.
    [[nodiscard]] std::span<const Code> codes() const noexcept { return codes_; }

    /// @brief Number of codes supplied at construction.
    [[nodiscard]] std::size_t seededCount() const noexcept { return seededCount_; }

    /// @brief Codes inserted after construction, in insertion order.
    [[nodiscard]] std::span<const Code> newCodes() const noexcept {
        return std::span<const Code>(codes_).subspan(seededCount_);
    }

private:
    struct TransparentHash {
        using is_transparent = void;
        [[nodiscard]] std::size_t operator()(std::string_view str) const noexcept {
            return std::hash<std::string_view>{}(str);
        }
    };

    std::vector<Code> codes_;
    std::unordered_set<Code, TransparentHash, std::equal_to<>> index_;
    std::size_t seededCount_ = 0;
};

// =============================================================================
// Admission Test
// =============================================================================

/// @brief Smallest distance from code to any member of others.
/// @param code Candidate code.
/// @param others Codes to compare against.
/// @param emptyValue Value returned when others is empty.
[[nodiscard]] std::size_t minimumDistance(std::string_view code, std::span<const Code> others,
                                          std::size_t emptyValue);

/// @brief Sequential admission test.
/// @return true if every accepted code is at distance >= minDistance from
///         code. An empty set admits everything.
[[nodiscard]] bool admit(std::string_view code, const AcceptedSet& accepted, int minDistance);

/// @brief Configuration for AdmissionFilter.
struct AdmissionFilterConfig {
    /// @brief Minimum acceptable Damerau-Levenshtein distance.
    int minDistance = kDefaultMinDistance;

    /// @brief AcceptedSet size from which distances are computed with TBB.
    /// @note 0 disables parallel evaluation.
    std::size_t parallelThreshold = kDefaultParallelThreshold;
};

/// @brief Minimum-distance admission test.
///
/// Only evaluates distances; never mutates the AcceptedSet. The caller
/// inserts an admitted code before testing the next candidate, which keeps
/// acceptance strictly sequential even when the scan itself is parallel.
class AdmissionFilter {
public:
    explicit AdmissionFilter(AdmissionFilterConfig config = {}) noexcept : config_(config) {}

    /// @brief Test a candidate code against the current AcceptedSet.
    [[nodiscard]] bool admit(std::string_view code, const AcceptedSet& accepted) const;

    [[nodiscard]] int minDistance() const noexcept { return config_.minDistance; }

    [[nodiscard]] const AdmissionFilterConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool admitParallel(std::string_view code, std::span<const Code> codes) const;

    AdmissionFilterConfig config_;
};

}  // namespace pgen::algo

#endif  // PGEN_ALGO_ADMISSION_FILTER_H
