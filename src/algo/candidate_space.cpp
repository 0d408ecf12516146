// =============================================================================
// pgen - Candidate Space Module Implementation
// =============================================================================

#include "pgen/algo/candidate_space.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

#include "pgen/common/logger.h"

namespace pgen::algo {

namespace {

constexpr std::array<std::uint32_t, kMaxDigits + 1> kPowersOfTen = {
    1, 10, 100, 1'000, 10'000, 100'000, 1'000'000, 10'000'000, 100'000'000};

}  // namespace

// =============================================================================
// Candidate Filters
// =============================================================================

bool hasRepeatedRun(std::string_view str, std::size_t runLength) noexcept {
    if (runLength <= 1) {
        return !str.empty();
    }

    std::size_t run = 1;
    for (std::size_t i = 1; i < str.size(); ++i) {
        if (str[i] == str[i - 1]) {
            if (++run >= runLength) {
                return true;
            }
        } else {
            run = 1;
        }
    }
    return false;
}

std::uint32_t minCandidateValue(int digits) noexcept {
    return kPowersOfTen[static_cast<std::size_t>(digits - 1)];
}

std::uint32_t maxCandidateValue(int digits) noexcept {
    return kPowersOfTen[static_cast<std::size_t>(digits)] - 1;
}

VoidResult validateDigits(int digits) {
    if (digits < 1 || digits > kMaxDigits) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("digits must be between 1 and {}, got {}", kMaxDigits,
                                         digits));
    }
    return makeVoidSuccess();
}

std::vector<std::uint32_t> enumerateCandidates(int digits) {
    const std::uint32_t minValue = minCandidateValue(digits);
    const std::uint32_t maxValue = maxCandidateValue(digits);

    std::vector<std::uint32_t> values;
    values.reserve(maxValue - minValue + 1);

    std::array<char, kMaxDigits> buffer{};
    for (std::uint32_t value = minValue; value <= maxValue; ++value) {
        const auto converted =
            std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        const auto length = static_cast<std::size_t>(converted.ptr - buffer.data());
        if (!hasRepeatedRun(std::string_view(buffer.data(), length))) {
            values.push_back(value);
        }
    }

    values.shrink_to_fit();
    return values;
}

// =============================================================================
// CandidateSpace Implementation
// =============================================================================

CandidateSpace::CandidateSpace(int digits, std::vector<std::uint32_t> values) noexcept
    : digits_(digits), values_(std::move(values)) {}

Result<CandidateSpace> CandidateSpace::create(int digits, std::mt19937_64& rng) {
    if (auto valid = validateDigits(digits); !valid) {
        return std::unexpected(valid.error());
    }

    auto values = enumerateCandidates(digits);
    std::shuffle(values.begin(), values.end(), rng);

    PGEN_LOG_DEBUG("Candidate space: {} of {} values for {} digits", values.size(),
                   maxCandidateValue(digits) - minCandidateValue(digits) + 1, digits);

    return CandidateSpace(digits, std::move(values));
}

Result<CandidateSpace> CandidateSpace::create(int digits, Seed seed) {
    std::mt19937_64 rng(seed);
    return create(digits, rng);
}

std::optional<std::string> CandidateSpace::next() {
    if (exhausted()) {
        return std::nullopt;
    }
    return std::to_string(values_[cursor_++]);
}

}  // namespace pgen::algo
