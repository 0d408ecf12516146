// =============================================================================
// pgen - Candidate Space Tests
// =============================================================================
// Unit tests for candidate enumeration, repeated-run filtering, shuffling and
// single-pass consumption.
// =============================================================================

#include "pgen/algo/candidate_space.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace pgen::algo {
namespace {

/// @brief Independent oracle: a digit repeated three times in a row.
[[nodiscard]] bool matchesRepeatedRunPattern(const std::string& str) {
    static const std::regex kPattern(R"((\d)\1\1)");
    return std::regex_search(str, kPattern);
}

/// @brief Drain a space into a vector of strings.
[[nodiscard]] std::vector<std::string> drain(CandidateSpace& space) {
    std::vector<std::string> out;
    while (auto candidate = space.next()) {
        out.push_back(*candidate);
    }
    return out;
}

// =============================================================================
// hasRepeatedRun Tests
// =============================================================================

TEST(RepeatedRunTest, DetectsRunsOfThreeOrMore) {
    EXPECT_TRUE(hasRepeatedRun("111"));
    EXPECT_TRUE(hasRepeatedRun("12333"));
    EXPECT_TRUE(hasRepeatedRun("10007"));
    EXPECT_TRUE(hasRepeatedRun("99999"));
}

TEST(RepeatedRunTest, AllowsPairs) {
    EXPECT_FALSE(hasRepeatedRun(""));
    EXPECT_FALSE(hasRepeatedRun("7"));
    EXPECT_FALSE(hasRepeatedRun("11"));
    EXPECT_FALSE(hasRepeatedRun("11223"));
    EXPECT_FALSE(hasRepeatedRun("12121"));
    EXPECT_FALSE(hasRepeatedRun("1001"));
}

TEST(RepeatedRunTest, CustomRunLength) {
    EXPECT_TRUE(hasRepeatedRun("1223", 2));
    EXPECT_FALSE(hasRepeatedRun("1213", 2));
    EXPECT_FALSE(hasRepeatedRun("1112", 4));
    EXPECT_TRUE(hasRepeatedRun("11112", 4));
}

// =============================================================================
// Enumeration Tests
// =============================================================================

TEST(EnumerateCandidatesTest, RangeBounds) {
    EXPECT_EQ(minCandidateValue(1), 1u);
    EXPECT_EQ(maxCandidateValue(1), 9u);
    EXPECT_EQ(minCandidateValue(5), 10000u);
    EXPECT_EQ(maxCandidateValue(5), 99999u);
}

TEST(EnumerateCandidatesTest, SingleDigitHasNoLeadingZero) {
    auto values = enumerateCandidates(1);
    std::vector<std::uint32_t> expected = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    EXPECT_EQ(values, expected);
}

TEST(EnumerateCandidatesTest, TwoDigitsKeepsEverything) {
    EXPECT_EQ(enumerateCandidates(2).size(), 90u);
}

TEST(EnumerateCandidatesTest, ThreeDigitsDropsTriples) {
    auto values = enumerateCandidates(3);
    EXPECT_EQ(values.size(), 900u - 9u);
    EXPECT_EQ(std::count(values.begin(), values.end(), 555u), 0);
    EXPECT_EQ(std::count(values.begin(), values.end(), 100u), 1);
}

TEST(EnumerateCandidatesTest, MembershipMatchesPatternForFourDigits) {
    auto values = enumerateCandidates(4);
    std::set<std::uint32_t> members(values.begin(), values.end());

    for (std::uint32_t value = 1000; value <= 9999; ++value) {
        const bool expected = !matchesRepeatedRunPattern(std::to_string(value));
        EXPECT_EQ(members.count(value) == 1, expected) << "value " << value;
    }
    EXPECT_EQ(members.size(), values.size());
}

TEST(EnumerateCandidatesTest, ValidateDigitsRange) {
    EXPECT_FALSE(validateDigits(0).has_value());
    EXPECT_FALSE(validateDigits(-3).has_value());
    EXPECT_FALSE(validateDigits(kMaxDigits + 1).has_value());
    EXPECT_TRUE(validateDigits(1).has_value());
    EXPECT_TRUE(validateDigits(kMaxDigits).has_value());
    EXPECT_EQ(validateDigits(0).error().code(), ErrorCode::kUsageError);
}

// =============================================================================
// CandidateSpace Tests
// =============================================================================

TEST(CandidateSpaceTest, CreateRejectsInvalidDigits) {
    auto space = CandidateSpace::create(0, Seed{1});
    ASSERT_FALSE(space.has_value());
    EXPECT_EQ(space.error().code(), ErrorCode::kUsageError);
}

TEST(CandidateSpaceTest, YieldsAPermutationOfTheEnumeration) {
    auto space = CandidateSpace::create(3, Seed{7});
    ASSERT_TRUE(space.has_value());

    auto drawn = drain(*space);
    std::vector<std::string> expected;
    for (auto value : enumerateCandidates(3)) {
        expected.push_back(std::to_string(value));
    }

    EXPECT_NE(drawn, expected) << "candidates should be shuffled";

    std::sort(drawn.begin(), drawn.end());
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(drawn, expected);
}

TEST(CandidateSpaceTest, EveryCandidateHasRequestedLength) {
    auto space = CandidateSpace::create(5, Seed{3});
    ASSERT_TRUE(space.has_value());

    for (const auto& candidate : drain(*space)) {
        ASSERT_EQ(candidate.size(), 5u);
        ASSERT_NE(candidate.front(), '0');
        ASSERT_FALSE(matchesRepeatedRunPattern(candidate));
    }
}

TEST(CandidateSpaceTest, SameSeedSameOrder) {
    auto a = CandidateSpace::create(3, Seed{42});
    auto b = CandidateSpace::create(3, Seed{42});
    auto c = CandidateSpace::create(3, Seed{43});
    ASSERT_TRUE(a && b && c);

    auto drawnA = drain(*a);
    EXPECT_EQ(drawnA, drain(*b));
    EXPECT_NE(drawnA, drain(*c));
}

TEST(CandidateSpaceTest, SinglePassConsumption) {
    auto space = CandidateSpace::create(1, Seed{0});
    ASSERT_TRUE(space.has_value());

    EXPECT_EQ(space->size(), 9u);
    EXPECT_EQ(space->remaining(), 9u);
    EXPECT_FALSE(space->exhausted());

    ASSERT_TRUE(space->next().has_value());
    EXPECT_EQ(space->consumed(), 1u);
    EXPECT_EQ(space->remaining(), 8u);

    auto rest = drain(*space);
    EXPECT_EQ(rest.size(), 8u);
    EXPECT_TRUE(space->exhausted());
    EXPECT_FALSE(space->next().has_value());
    EXPECT_FALSE(space->next().has_value());
}

}  // namespace
}  // namespace pgen::algo
