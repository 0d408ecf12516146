// =============================================================================
// pgen - Pseudonym Generator Module
// =============================================================================
// Drives a generation run:
// 1. Build the shuffled candidate space
// 2. For each candidate, offer it to every pending prefix in configured order
// 3. code = candidate + checkDigit(prefix + candidate)
// 4. Skip the prefix if the code is already accepted
// 5. Otherwise run the admission filter; the first prefix that admits the
//    code consumes the candidate
// 6. Stop when every quota is met or the candidate space is exhausted
//
// Per-prefix state machine:
//
//   PENDING (remaining > 0) --accept--> ... --accept--> SATISFIED (remaining == 0)
//
// Running out of candidates is not an error. The run ends normally and the
// FulfillmentReport shows which prefixes fell short.
// =============================================================================

#ifndef PGEN_ALGO_PSEUDONYM_GENERATOR_H
#define PGEN_ALGO_PSEUDONYM_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pgen/algo/admission_filter.h"
#include "pgen/algo/checksum.h"
#include "pgen/common/error.h"
#include "pgen/common/types.h"

namespace pgen::algo {

// =============================================================================
// Forward Declarations
// =============================================================================

class PseudonymGeneratorImpl;

// =============================================================================
// Generator Configuration
// =============================================================================

/// @brief Configuration for a generation run. Fixed once the run starts.
struct GeneratorConfig {
    /// @brief Prefixes and their target counts, in priority order.
    PrefixQuotaList prefixes;

    /// @brief Candidate length (check digit excluded).
    int digits = kDefaultDigits;

    /// @brief Minimum Damerau-Levenshtein distance between any two codes.
    int minDistance = kDefaultMinDistance;

    /// @brief Shuffle seed. Unset means a fresh seed from std::random_device.
    std::optional<Seed> seed;

    /// @brief AcceptedSet size from which distances are computed with TBB.
    /// @note 0 disables parallel evaluation.
    std::size_t parallelThreshold = kDefaultParallelThreshold;

    /// @brief Validate configuration
    /// @return VoidResult indicating success or a usage error
    [[nodiscard]] VoidResult validate() const;

    /// @brief Total number of pseudonyms requested over all prefixes.
    [[nodiscard]] std::size_t totalRequested() const noexcept;
};

/// @brief Production prefix table: 1000, 1100, ..., 2400.
/// @param count Number of pseudonyms requested per prefix.
[[nodiscard]] PrefixQuotaList defaultPrefixQuotas(int count = kDefaultCountPerPrefix);

/// @brief Parse a "PREFIX[:COUNT]" specification.
/// @param text Specification such as "1000:20" or "1000".
/// @param defaultCount Count used when text has no ":COUNT" part.
/// @return Parsed quota or usage error.
[[nodiscard]] Result<PrefixQuota> parsePrefixQuota(std::string_view text,
                                                   int defaultCount = kDefaultCountPerPrefix);

// =============================================================================
// Fulfillment Report
// =============================================================================

/// @brief Requested versus emitted pseudonyms for one prefix.
struct PrefixFulfillment {
    Prefix prefix;
    int requested = 0;
    int emitted = 0;

    [[nodiscard]] bool satisfied() const noexcept { return emitted >= requested; }

    [[nodiscard]] int shortfall() const noexcept {
        return satisfied() ? 0 : requested - emitted;
    }
};

/// @brief Outcome of a run, per prefix and overall.
struct FulfillmentReport {
    /// @brief One entry per prefix, in configured order.
    std::vector<PrefixFulfillment> prefixes;

    /// @brief Candidates drawn from the candidate space.
    std::size_t candidatesConsumed = 0;

    /// @brief Size of the candidate space.
    std::size_t candidatesTotal = 0;

    /// @brief Codes in the AcceptedSet before the run started.
    std::size_t existingCodes = 0;

    /// @brief Seed that drove the shuffle (replays the run).
    Seed seed = 0;

    /// @brief Candidate space ran out while some quota was still pending.
    bool exhausted = false;

    [[nodiscard]] bool complete() const noexcept;

    /// @note Totals are 64-bit: the sum of several int quotas can exceed INT_MAX.
    [[nodiscard]] std::int64_t totalRequested() const noexcept;

    [[nodiscard]] std::int64_t totalEmitted() const noexcept;

    [[nodiscard]] std::int64_t shortfall() const noexcept;

    /// @brief Look up the entry for a prefix.
    /// @return Pointer to the entry, or nullptr if the prefix is unknown.
    [[nodiscard]] const PrefixFulfillment* find(std::string_view prefix) const noexcept;
};

// =============================================================================
// Pseudonym Generator
// =============================================================================

/// @brief Lazy, single-pass pseudonym generator.
///
/// The AcceptedSet is borrowed for the lifetime of the generator: every
/// accepted code is inserted into it, so the caller sees the full set of
/// issued codes once the run ends.
///
/// Usage:
/// @code
/// GeneratorConfig config;
/// config.prefixes = {{"1000", 2}};
///
/// AcceptedSet accepted(existingCodes);
/// auto generator = PseudonymGenerator::create(config, accepted);
/// if (generator) {
///     while (auto pseudonym = generator->next()) {
///         std::cout << *pseudonym << '\n';
///     }
///     auto report = generator->report();
/// }
/// @endcode
class PseudonymGenerator {
public:
    /// @brief Validate the configuration and build the candidate space.
    /// @param config Run configuration.
    /// @param accepted AcceptedSet seeded with previously issued codes.
    /// @param checksum Check digit scheme; nullptr selects Damm.
    /// @return Generator or usage error.
    [[nodiscard]] static Result<PseudonymGenerator> create(
        GeneratorConfig config,
        AcceptedSet& accepted,
        std::unique_ptr<IChecksum> checksum = nullptr);

    ~PseudonymGenerator();

    // Non-copyable, movable
    PseudonymGenerator(const PseudonymGenerator&) = delete;
    PseudonymGenerator& operator=(const PseudonymGenerator&) = delete;
    PseudonymGenerator(PseudonymGenerator&&) noexcept;
    PseudonymGenerator& operator=(PseudonymGenerator&&) noexcept;

    /// @brief Produce the next accepted pseudonym.
    /// @return Pseudonym, or std::nullopt once every quota is met or the
    ///         candidate space is exhausted.
    [[nodiscard]] std::optional<Pseudonym> next();

    /// @brief Drain the generator, handing each pseudonym to a sink.
    /// @return Number of pseudonyms emitted by this call.
    std::size_t run(const std::function<void(const Pseudonym&)>& sink);

    /// @brief Drain the generator into a vector.
    [[nodiscard]] std::vector<Pseudonym> generateAll();

    /// @brief Check whether next() can still produce pseudonyms.
    [[nodiscard]] bool finished() const noexcept;

    /// @brief Snapshot of the fulfillment so far.
    [[nodiscard]] FulfillmentReport report() const;

    [[nodiscard]] const GeneratorConfig& config() const noexcept;

private:
    explicit PseudonymGenerator(std::unique_ptr<PseudonymGeneratorImpl> impl) noexcept;

    std::unique_ptr<PseudonymGeneratorImpl> impl_;
};

}  // namespace pgen::algo

#endif  // PGEN_ALGO_PSEUDONYM_GENERATOR_H
