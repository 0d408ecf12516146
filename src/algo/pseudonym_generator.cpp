// =============================================================================
// pgen - Pseudonym Generator Module Implementation
// =============================================================================

#include "pgen/algo/pseudonym_generator.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <numeric>
#include <random>
#include <unordered_set>

#include "pgen/algo/candidate_space.h"
#include "pgen/common/logger.h"

namespace pgen::algo {

// =============================================================================
// GeneratorConfig Implementation
// =============================================================================

VoidResult GeneratorConfig::validate() const {
    if (auto valid = validateDigits(digits); !valid) {
        return valid;
    }

    if (minDistance < 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("min distance must be non-negative, got {}",
                                         minDistance));
    }

    if (prefixes.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "at least one prefix is required");
    }

    std::unordered_set<std::string_view> seen;
    for (const auto& quota : prefixes) {
        if (!isDigitString(quota.prefix)) {
            return makeVoidError(ErrorCode::kUsageError,
                                 std::format("prefix must be a non-empty digit string: '{}'",
                                             quota.prefix));
        }
        if (quota.count <= 0) {
            return makeVoidError(ErrorCode::kUsageError,
                                 std::format("count for prefix {} must be positive, got {}",
                                             quota.prefix, quota.count));
        }
        if (!seen.insert(quota.prefix).second) {
            return makeVoidError(ErrorCode::kUsageError,
                                 std::format("duplicate prefix: {}", quota.prefix));
        }
    }

    return makeVoidSuccess();
}

std::size_t GeneratorConfig::totalRequested() const noexcept {
    std::size_t total = 0;
    for (const auto& quota : prefixes) {
        total += quota.count > 0 ? static_cast<std::size_t>(quota.count) : 0;
    }
    return total;
}

PrefixQuotaList defaultPrefixQuotas(int count) {
    PrefixQuotaList quotas;
    for (int site = 10; site <= 24; ++site) {
        quotas.push_back(PrefixQuota{std::to_string(site * 100), count});
    }
    return quotas;
}

Result<PrefixQuota> parsePrefixQuota(std::string_view text, int defaultCount) {
    const auto colon = text.find(':');
    const std::string_view prefix = text.substr(0, colon);

    if (!isDigitString(prefix)) {
        return makeError<PrefixQuota>(
            ErrorCode::kUsageError,
            std::format("invalid prefix specification '{}': prefix must be digits", text));
    }

    int count = defaultCount;
    if (colon != std::string_view::npos) {
        const std::string_view countText = text.substr(colon + 1);
        const char* first = countText.data();
        const char* last = countText.data() + countText.size();
        auto [ptr, ec] = std::from_chars(first, last, count);
        if (countText.empty() || ec != std::errc{} || ptr != last) {
            return makeError<PrefixQuota>(
                ErrorCode::kUsageError,
                std::format("invalid prefix specification '{}': count must be an integer", text));
        }
    }

    if (count <= 0) {
        return makeError<PrefixQuota>(
            ErrorCode::kUsageError,
            std::format("invalid prefix specification '{}': count must be positive", text));
    }

    return PrefixQuota{std::string(prefix), count};
}

// =============================================================================
// FulfillmentReport Implementation
// =============================================================================

bool FulfillmentReport::complete() const noexcept {
    return std::all_of(prefixes.begin(), prefixes.end(),
                       [](const PrefixFulfillment& entry) { return entry.satisfied(); });
}

std::int64_t FulfillmentReport::totalRequested() const noexcept {
    return std::accumulate(prefixes.begin(), prefixes.end(), std::int64_t{0},
                           [](std::int64_t sum, const PrefixFulfillment& e) {
                               return sum + e.requested;
                           });
}

std::int64_t FulfillmentReport::totalEmitted() const noexcept {
    return std::accumulate(prefixes.begin(), prefixes.end(), std::int64_t{0},
                           [](std::int64_t sum, const PrefixFulfillment& e) {
                               return sum + e.emitted;
                           });
}

std::int64_t FulfillmentReport::shortfall() const noexcept {
    return std::accumulate(prefixes.begin(), prefixes.end(), std::int64_t{0},
                           [](std::int64_t sum, const PrefixFulfillment& e) {
                               return sum + e.shortfall();
                           });
}

const PrefixFulfillment* FulfillmentReport::find(std::string_view prefix) const noexcept {
    auto it = std::find_if(prefixes.begin(), prefixes.end(),
                           [prefix](const PrefixFulfillment& e) { return e.prefix == prefix; });
    return it != prefixes.end() ? &*it : nullptr;
}

// =============================================================================
// PseudonymGeneratorImpl
// =============================================================================

class PseudonymGeneratorImpl {
public:
    PseudonymGeneratorImpl(GeneratorConfig config, AcceptedSet& accepted,
                           std::unique_ptr<IChecksum> checksum, CandidateSpace space, Seed seed)
        : config_(std::move(config)),
          accepted_(accepted),
          checksum_(std::move(checksum)),
          filter_(AdmissionFilterConfig{config_.minDistance, config_.parallelThreshold}),
          space_(std::move(space)),
          seed_(seed),
          existingCodes_(accepted.size()) {
        remaining_.reserve(config_.prefixes.size());
        emitted_.assign(config_.prefixes.size(), 0);
        for (const auto& quota : config_.prefixes) {
            remaining_.push_back(quota.count);
        }
        pendingCount_ = remaining_.size();
    }

    std::optional<Pseudonym> next() {
        while (pendingCount_ > 0) {
            auto candidate = space_.next();
            if (!candidate) {
                onExhausted();
                return std::nullopt;
            }

            if (auto pseudonym = offer(*candidate)) {
                return pseudonym;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool finished() const noexcept {
        return pendingCount_ == 0 || space_.exhausted();
    }

    [[nodiscard]] FulfillmentReport report() const {
        FulfillmentReport report;
        report.prefixes.reserve(config_.prefixes.size());
        for (std::size_t i = 0; i < config_.prefixes.size(); ++i) {
            report.prefixes.push_back(
                PrefixFulfillment{config_.prefixes[i].prefix, config_.prefixes[i].count,
                                  emitted_[i]});
        }
        report.candidatesConsumed = space_.consumed();
        report.candidatesTotal = space_.size();
        report.existingCodes = existingCodes_;
        report.seed = seed_;
        report.exhausted = pendingCount_ > 0 && space_.exhausted();
        return report;
    }

    [[nodiscard]] const GeneratorConfig& config() const noexcept { return config_; }

    /// @brief Upper bound on what next() can still emit.
    [[nodiscard]] std::size_t emittableBound() const noexcept {
        std::size_t pending = 0;
        for (int count : remaining_) {
            pending += static_cast<std::size_t>(count);
        }
        return std::min(pending, space_.remaining());
    }

private:
    /// @brief Offer one candidate to the pending prefixes in configured order.
    /// @return The pseudonym of the first prefix that admits it.
    std::optional<Pseudonym> offer(const std::string& candidate) {
        for (std::size_t i = 0; i < config_.prefixes.size(); ++i) {
            if (remaining_[i] == 0) {
                continue;
            }

            const Prefix& prefix = config_.prefixes[i].prefix;
            Code code = candidate;
            code.push_back(checksum_->checkDigit(prefix + candidate));

            // Already issued under this or another prefix
            if (accepted_.contains(code)) {
                continue;
            }

            if (!filter_.admit(code, accepted_)) {
                continue;
            }

            Pseudonym pseudonym = prefix + code;
            accepted_.insert(std::move(code));
            ++emitted_[i];
            if (--remaining_[i] == 0) {
                --pendingCount_;
                PGEN_LOG_DEBUG("Prefix {} satisfied with {} pseudonyms", prefix, emitted_[i]);
            }
            return pseudonym;
        }
        return std::nullopt;
    }

    void onExhausted() {
        if (exhaustionLogged_) {
            return;
        }
        exhaustionLogged_ = true;

        PGEN_LOG_WARNING("Candidate space exhausted after {} candidates", space_.size());
        for (std::size_t i = 0; i < config_.prefixes.size(); ++i) {
            if (remaining_[i] > 0) {
                PGEN_LOG_WARNING("Prefix {}: generated {} of {} requested pseudonyms",
                                 config_.prefixes[i].prefix, emitted_[i],
                                 config_.prefixes[i].count);
            }
        }
    }

    GeneratorConfig config_;
    AcceptedSet& accepted_;
    std::unique_ptr<IChecksum> checksum_;
    AdmissionFilter filter_;
    CandidateSpace space_;
    Seed seed_;
    std::size_t existingCodes_;
    std::vector<int> remaining_;
    std::vector<int> emitted_;
    std::size_t pendingCount_ = 0;
    bool exhaustionLogged_ = false;
};

// =============================================================================
// PseudonymGenerator Implementation
// =============================================================================

PseudonymGenerator::PseudonymGenerator(std::unique_ptr<PseudonymGeneratorImpl> impl) noexcept
    : impl_(std::move(impl)) {}

PseudonymGenerator::~PseudonymGenerator() = default;

PseudonymGenerator::PseudonymGenerator(PseudonymGenerator&&) noexcept = default;
PseudonymGenerator& PseudonymGenerator::operator=(PseudonymGenerator&&) noexcept = default;

Result<PseudonymGenerator> PseudonymGenerator::create(GeneratorConfig config,
                                                      AcceptedSet& accepted,
                                                      std::unique_ptr<IChecksum> checksum) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    if (!checksum) {
        checksum = createDefaultChecksum();
    }

    const Seed seed = config.seed.has_value() ? *config.seed
                                              : (static_cast<Seed>(std::random_device{}()) << 32) |
                                                    std::random_device{}();

    auto space = CandidateSpace::create(config.digits, seed);
    if (!space) {
        return std::unexpected(space.error());
    }

    PGEN_LOG_INFO("Generating {} pseudonyms for {} prefixes ({} digits, min distance {}, "
                  "{} candidates, {} existing codes, {} check digit, seed {})",
                  config.totalRequested(), config.prefixes.size(), config.digits,
                  config.minDistance, space->size(), accepted.size(), checksum->name(), seed);

    auto impl = std::make_unique<PseudonymGeneratorImpl>(std::move(config), accepted,
                                                         std::move(checksum),
                                                         std::move(*space), seed);
    return PseudonymGenerator(std::move(impl));
}

std::optional<Pseudonym> PseudonymGenerator::next() {
    return impl_->next();
}

std::size_t PseudonymGenerator::run(const std::function<void(const Pseudonym&)>& sink) {
    std::size_t count = 0;
    while (auto pseudonym = next()) {
        sink(*pseudonym);
        ++count;
    }
    return count;
}

std::vector<Pseudonym> PseudonymGenerator::generateAll() {
    std::vector<Pseudonym> pseudonyms;
    pseudonyms.reserve(impl_->emittableBound());
    run([&pseudonyms](const Pseudonym& pseudonym) { pseudonyms.push_back(pseudonym); });
    return pseudonyms;
}

bool PseudonymGenerator::finished() const noexcept {
    return impl_->finished();
}

FulfillmentReport PseudonymGenerator::report() const {
    return impl_->report();
}

const GeneratorConfig& PseudonymGenerator::config() const noexcept {
    return impl_->config();
}

}  // namespace pgen::algo
