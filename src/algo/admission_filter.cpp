// =============================================================================
// pgen - Admission Filter Module Implementation
// =============================================================================

#include "pgen/algo/admission_filter.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <limits>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace pgen::algo {

// =============================================================================
// Edit Distance
// =============================================================================

std::size_t damerauLevenshtein(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    const std::size_t infinity = n + m;
    const std::size_t stride = m + 2;

    // (n + 2) x (m + 2) matrix with a sentinel row and column
    std::vector<std::size_t> d((n + 2) * stride);
    auto at = [&d, stride](std::size_t i, std::size_t j) -> std::size_t& {
        return d[i * stride + j];
    };

    at(0, 0) = infinity;
    for (std::size_t i = 0; i <= n; ++i) {
        at(i + 1, 0) = infinity;
        at(i + 1, 1) = i;
    }
    for (std::size_t j = 0; j <= m; ++j) {
        at(0, j + 1) = infinity;
        at(1, j + 1) = j;
    }

    // Last row in which each character was seen in a
    std::array<std::size_t, 256> lastRow{};

    for (std::size_t i = 1; i <= n; ++i) {
        std::size_t lastMatchCol = 0;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t i1 = lastRow[static_cast<unsigned char>(b[j - 1])];
            const std::size_t j1 = lastMatchCol;

            std::size_t cost = 1;
            if (a[i - 1] == b[j - 1]) {
                cost = 0;
                lastMatchCol = j;
            }

            at(i + 1, j + 1) = std::min({at(i, j) + cost,
                                         at(i + 1, j) + 1,
                                         at(i, j + 1) + 1,
                                         at(i1, j1) + (i - i1 - 1) + 1 + (j - j1 - 1)});
        }
        lastRow[static_cast<unsigned char>(a[i - 1])] = i;
    }

    return at(n + 1, m + 1);
}

// =============================================================================
// AcceptedSet Implementation
// =============================================================================

AcceptedSet::AcceptedSet(std::span<const Code> existing) {
    codes_.reserve(existing.size());
    for (const auto& code : existing) {
        insert(code);
    }
    seededCount_ = codes_.size();
}

bool AcceptedSet::contains(std::string_view code) const {
    return index_.find(code) != index_.end();
}

bool AcceptedSet::insert(Code code) {
    if (contains(code)) {
        return false;
    }
    index_.insert(code);
    codes_.push_back(std::move(code));
    return true;
}

// =============================================================================
// Admission Test
// =============================================================================

std::size_t minimumDistance(std::string_view code, std::span<const Code> others,
                            std::size_t emptyValue) {
    if (others.empty()) {
        return emptyValue;
    }

    std::size_t best = std::numeric_limits<std::size_t>::max();
    for (const auto& other : others) {
        best = std::min(best, damerauLevenshtein(code, other));
        if (best == 0) {
            break;
        }
    }
    return best;
}

bool admit(std::string_view code, const AcceptedSet& accepted, int minDistance) {
    if (minDistance <= 0) {
        return true;
    }

    const auto threshold = static_cast<std::size_t>(minDistance);
    return std::none_of(accepted.codes().begin(), accepted.codes().end(),
                        [&](const Code& other) {
                            return damerauLevenshtein(code, other) < threshold;
                        });
}

// =============================================================================
// AdmissionFilter Implementation
// =============================================================================

bool AdmissionFilter::admit(std::string_view code, const AcceptedSet& accepted) const {
    if (config_.parallelThreshold != 0 && accepted.size() >= config_.parallelThreshold &&
        config_.minDistance > 0) {
        return admitParallel(code, accepted.codes());
    }
    return algo::admit(code, accepted, config_.minDistance);
}

bool AdmissionFilter::admitParallel(std::string_view code, std::span<const Code> codes) const {
    const auto threshold = static_cast<std::size_t>(config_.minDistance);
    std::atomic<bool> tooClose{false};

    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, codes.size()),
        [&](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i < range.end(); ++i) {
                if (tooClose.load(std::memory_order_relaxed)) {
                    return;
                }
                if (damerauLevenshtein(code, codes[i]) < threshold) {
                    tooClose.store(true, std::memory_order_relaxed);
                    return;
                }
            }
        });

    return !tooClose.load();
}

}  // namespace pgen::algo
