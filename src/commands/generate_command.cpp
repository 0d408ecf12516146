// =============================================================================
// pgen - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <fstream>
#include <iomanip>
#include <iostream>

#include <tbb/global_control.h>

#include "pgen/algo/admission_filter.h"
#include "pgen/common/logger.h"
#include "pgen/io/code_store.h"

namespace pgen::commands {

namespace {

[[nodiscard]] bool isStdout(const std::filesystem::path& path) {
    return path.empty() || path == "-";
}

}  // namespace

// =============================================================================
// GenerateCommand Implementation
// =============================================================================

GenerateCommand::GenerateCommand(GenerateOptions options) : options_(std::move(options)) {}

GenerateCommand::~GenerateCommand() = default;

GenerateCommand::GenerateCommand(GenerateCommand&&) noexcept = default;
GenerateCommand& GenerateCommand::operator=(GenerateCommand&&) noexcept = default;

int GenerateCommand::execute() {
    try {
        validateOptions();

        // Read the store before the output is truncated
        auto store = io::createCodeStore(options_.existingPath);
        const auto existing = store->load();

        std::vector<Code> issued;
        if (isStdout(options_.outputPath)) {
            issued = generate(std::cout, existing);
            std::cout.flush();
            if (!std::cout) {
                throw IOError("Failed to write pseudonyms to stdout");
            }
        } else {
            std::ofstream out(options_.outputPath);
            if (!out) {
                throw IOError("Failed to open output file: " + options_.outputPath.string());
            }
            issued = generate(out, existing);
            out.flush();
            if (!out) {
                throw IOError("Failed to write output file: " + options_.outputPath.string());
            }
        }

        // Only codes that reached the output are recorded as issued
        if (options_.updateExisting) {
            store->append(issued);
        }

        if (options_.showReport) {
            printReport(std::cerr);
        }

        if (!report_.complete()) {
            PGEN_LOG_WARNING("Generated {} of {} requested pseudonyms ({} missing)",
                             report_.totalEmitted(), report_.totalRequested(),
                             report_.shortfall());
            if (options_.strict) {
                return toExitCode(ErrorCode::kIncomplete);
            }
        } else {
            PGEN_LOG_INFO("Generated {} pseudonyms from {} of {} candidates",
                          report_.totalEmitted(), report_.candidatesConsumed,
                          report_.candidatesTotal);
        }

        return 0;

    } catch (const PgenException& e) {
        PGEN_LOG_ERROR("Generation failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PGEN_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void GenerateCommand::validateOptions() const {
    if (options_.updateExisting && options_.existingPath.empty()) {
        throw UsageError("--update-existing requires --existing");
    }

    if (options_.threads < 0) {
        throw UsageError("thread count must be non-negative");
    }

    if (!isStdout(options_.outputPath) && !options_.forceOverwrite &&
        std::filesystem::exists(options_.outputPath)) {
        throw UsageError("Output file already exists (use --force to overwrite): " +
                         options_.outputPath.string());
    }

    unwrapOrThrow(buildConfig().validate());
}

algo::GeneratorConfig GenerateCommand::buildConfig() const {
    algo::GeneratorConfig config;
    config.prefixes = options_.prefixes.empty() ? algo::defaultPrefixQuotas() : options_.prefixes;
    config.digits = options_.digits;
    config.minDistance = options_.minDistance;
    config.seed = options_.seed;
    config.parallelThreshold = options_.parallelThreshold;
    return config;
}

std::vector<Code> GenerateCommand::generate(std::ostream& out, std::span<const Code> existing) {
    // Outlives the generator, which borrows it
    algo::AcceptedSet accepted(existing);
    if (accepted.size() != existing.size()) {
        PGEN_LOG_WARNING("Ignored {} duplicate existing codes",
                         existing.size() - accepted.size());
    }

    std::optional<tbb::global_control> parallelism;
    if (options_.threads > 0) {
        parallelism.emplace(tbb::global_control::max_allowed_parallelism,
                            static_cast<std::size_t>(options_.threads));
    }

    auto generator = unwrapOrThrow(algo::PseudonymGenerator::create(buildConfig(), accepted));

    generator.run([&out](const Pseudonym& pseudonym) { out << pseudonym << '\n'; });
    report_ = generator.report();

    const auto issued = accepted.newCodes();
    return std::vector<Code>(issued.begin(), issued.end());
}

void GenerateCommand::printReport(std::ostream& out) const {
    writeReport(out, report_);
}

// =============================================================================
// Report Formatting
// =============================================================================

void writeReport(std::ostream& out, const algo::FulfillmentReport& report) {
    out << "=== Fulfillment Report ===" << '\n';
    out << std::left << std::setw(12) << "Prefix" << std::right << std::setw(10) << "Requested"
        << std::setw(10) << "Emitted" << std::setw(10) << "Missing" << '\n';

    for (const auto& entry : report.prefixes) {
        out << std::left << std::setw(12) << entry.prefix << std::right << std::setw(10)
            << entry.requested << std::setw(10) << entry.emitted << std::setw(10)
            << entry.shortfall() << '\n';
    }

    out << std::left << std::setw(12) << "Total" << std::right << std::setw(10)
        << report.totalRequested() << std::setw(10) << report.totalEmitted() << std::setw(10)
        << report.shortfall() << '\n';
    out << '\n';
    out << "Candidates: " << report.candidatesConsumed << "/" << report.candidatesTotal
        << " consumed" << '\n';
    out << "Existing:   " << report.existingCodes << " codes" << '\n';
    out << "Seed:       " << report.seed << '\n';
    out << "Status:     "
        << (report.complete() ? "COMPLETE" : (report.exhausted ? "EXHAUSTED" : "INCOMPLETE"))
        << '\n';
    out << "==========================" << std::endl;
}

}  // namespace pgen::commands
