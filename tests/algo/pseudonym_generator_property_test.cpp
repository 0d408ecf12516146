// =============================================================================
// pgen - Pseudonym Generator Property Tests
// =============================================================================
// Property-based tests for the guarantees every generation run must keep:
// unique codes, pairwise minimum distance, quota bounds and valid check digits.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "pgen/algo/pseudonym_generator.h"

namespace pgen::algo::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate a small run configuration with distinct prefixes.
[[nodiscard]] rc::Gen<GeneratorConfig> smallConfig() {
    return rc::gen::apply(
        [](int digits, int minDistance, std::uint64_t seed, int prefixCount,
           std::vector<int> counts) {
            GeneratorConfig config;
            config.digits = digits;
            config.minDistance = minDistance;
            config.seed = seed;
            config.parallelThreshold = 0;
            for (int i = 0; i < prefixCount; ++i) {
                config.prefixes.push_back(
                    PrefixQuota{std::to_string(10 + i), counts[static_cast<std::size_t>(i)]});
            }
            return config;
        },
        rc::gen::inRange(1, 4),
        rc::gen::inRange(0, 4),
        rc::gen::arbitrary<std::uint64_t>(),
        rc::gen::inRange(1, 4),
        rc::gen::container<std::vector<int>>(3, rc::gen::inRange(1, 25)));
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(PseudonymGeneratorProperty, CodesAreUniqueAndWellSeparated, ()) {
    const auto config = *gen::smallConfig();

    AcceptedSet accepted;
    auto generator = PseudonymGenerator::create(config, accepted);
    RC_ASSERT(generator.has_value());
    auto pseudonyms = generator->generateAll();

    const auto codes = accepted.newCodes();
    RC_ASSERT(codes.size() == pseudonyms.size());

    std::set<Code> unique(codes.begin(), codes.end());
    RC_ASSERT(unique.size() == codes.size());

    for (std::size_t i = 0; i < codes.size(); ++i) {
        for (std::size_t j = i + 1; j < codes.size(); ++j) {
            RC_ASSERT(damerauLevenshtein(codes[i], codes[j]) >=
                      static_cast<std::size_t>(config.minDistance));
        }
    }
}

RC_GTEST_PROP(PseudonymGeneratorProperty, QuotasAreNeverExceeded, ()) {
    const auto config = *gen::smallConfig();

    AcceptedSet accepted;
    auto generator = PseudonymGenerator::create(config, accepted);
    RC_ASSERT(generator.has_value());
    auto pseudonyms = generator->generateAll();
    auto report = generator->report();

    RC_ASSERT(report.prefixes.size() == config.prefixes.size());
    RC_ASSERT(static_cast<std::size_t>(report.totalEmitted()) == pseudonyms.size());

    for (const auto& quota : config.prefixes) {
        std::size_t count = 0;
        for (const auto& pseudonym : pseudonyms) {
            if (pseudonym.starts_with(quota.prefix)) {
                ++count;
            }
        }
        const auto* entry = report.find(quota.prefix);
        RC_ASSERT(entry != nullptr);
        RC_ASSERT(entry->emitted <= quota.count);
        RC_ASSERT(static_cast<std::size_t>(entry->emitted) == count);
    }

    // Under-delivery only happens when the candidate space runs dry
    RC_ASSERT(report.complete() != report.exhausted);
}

RC_GTEST_PROP(PseudonymGeneratorProperty, EveryPseudonymCarriesValidCheckDigit, ()) {
    const auto config = *gen::smallConfig();

    AcceptedSet accepted;
    auto generator = PseudonymGenerator::create(config, accepted);
    RC_ASSERT(generator.has_value());

    DammChecksum damm;
    for (const auto& pseudonym : generator->generateAll()) {
        RC_ASSERT(pseudonym.size() == pseudonymLength(2, config.digits));
        RC_ASSERT(damm.validate(pseudonym));
    }
}

RC_GTEST_PROP(PseudonymGeneratorProperty, ExistingCodesAreRespected, ()) {
    auto config = *gen::smallConfig();
    config.minDistance = *rc::gen::inRange(1, 4);

    // Issue a first batch, then run again against it
    AcceptedSet first;
    auto firstRun = PseudonymGenerator::create(config, first);
    RC_ASSERT(firstRun.has_value());
    [[maybe_unused]] auto firstBatch = firstRun->generateAll();
    const std::vector<Code> existing(first.codes().begin(), first.codes().end());

    config.seed = *config.seed + 1;
    AcceptedSet second(existing);
    auto secondRun = PseudonymGenerator::create(config, second);
    RC_ASSERT(secondRun.has_value());
    [[maybe_unused]] auto secondBatch = secondRun->generateAll();

    for (const auto& code : second.newCodes()) {
        for (const auto& old : existing) {
            RC_ASSERT(damerauLevenshtein(code, old) >=
                      static_cast<std::size_t>(config.minDistance));
        }
    }
}

}  // namespace pgen::algo::test
