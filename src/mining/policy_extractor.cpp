// File: src/mining/policy_extractor.cpp
#include "mining/policy_extractor.hpp"
#include "mining/value_coercion.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

namespace policyminer {

namespace {

// A rule that passed all thresholds, before ids are assigned
struct ScoredRule {
    RuleKey rule;
    double support;
    double confidence;
    double lift;
    double rounded_confidence;
};

std::string FormatPolicyId(size_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "policy_%04zu", index);
    return buffer;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

PolicyExtractor::PolicyExtractor()
    : PolicyExtractor(Config())
{
}

PolicyExtractor::PolicyExtractor(const Config& config)
    : config_(config)
{
}

// ============================================================================
// Counting Pass
// ============================================================================

FrequencyTables PolicyExtractor::CountFrequencies(
    const std::vector<BehaviorLog>& logs,
    size_t num_threads
) {
    FrequencyTables tables;

    num_threads = std::min(num_threads, kMaxThreads);
    if (num_threads <= 1 || logs.size() <= num_threads) {
        tables.RecordRange(logs.begin(), logs.end());
        return tables;
    }

    // Contiguous slices, merged in slice order to keep discovery order
    std::vector<FrequencyTables> partials(num_threads);
    std::vector<std::exception_ptr> errors(num_threads);
    std::vector<std::thread> workers;
    workers.reserve(num_threads);

    size_t slice_size = (logs.size() + num_threads - 1) / num_threads;

    try {
        for (size_t i = 0; i < num_threads; ++i) {
            size_t begin = std::min(logs.size(), i * slice_size);
            size_t end = std::min(logs.size(), begin + slice_size);

            workers.emplace_back([&logs, &partials, &errors, i, begin, end]() {
                try {
                    partials[i].RecordRange(logs.begin() + static_cast<std::ptrdiff_t>(begin),
                                            logs.begin() + static_cast<std::ptrdiff_t>(end));
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Thread creation failed: joinable threads must not be destroyed
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    for (const auto& partial : partials) {
        tables.Merge(partial);
    }

    return tables;
}

// ============================================================================
// Extraction
// ============================================================================

PolicySet PolicyExtractor::Extract(
    const std::vector<BehaviorLog>& logs,
    const std::string& name
) const {
    if (logs.empty()) {
        return PolicySet(name, 0);
    }

    FrequencyTables tables = CountFrequencies(logs, config_.num_threads);
    const double total = static_cast<double>(tables.GetTotalRecords());

    // Score and filter in discovery order
    std::vector<ScoredRule> kept;
    for (const auto& rule : tables.GetObservedRules()) {
        uint64_t co_count = tables.GetCoOccurrenceCount(rule);

        double support = static_cast<double>(co_count) / total;
        if (support < config_.min_support) {
            continue;
        }

        uint64_t antecedent_count = tables.GetAntecedentCount(rule.key, rule.value);
        double confidence = antecedent_count > 0
            ? static_cast<double>(co_count) / static_cast<double>(antecedent_count)
            : 0.0;
        if (confidence < config_.min_confidence) {
            continue;
        }

        // Baseline frequency of the consequent; lift is 0 when it is 0
        double action_freq = static_cast<double>(tables.GetActionCount(rule.action)) / total;
        double lift = action_freq > 0.0 ? confidence / action_freq : 0.0;
        if (lift < config_.min_lift) {
            continue;
        }

        kept.push_back(ScoredRule{rule, support, confidence, lift, RoundMetric(confidence)});
    }

    // Sort by stored (rounded) confidence, ties keep discovery order
    std::stable_sort(kept.begin(), kept.end(),
        [](const ScoredRule& a, const ScoredRule& b) {
            return a.rounded_confidence > b.rounded_confidence;
        });

    std::vector<MinedPolicy> policies;
    policies.reserve(kept.size());

    for (size_t i = 0; i < kept.size(); ++i) {
        const ScoredRule& scored = kept[i];
        policies.emplace_back(
            FormatPolicyId(i + 1),
            Antecedent{scored.rule.key, scored.rule.value},
            scored.rule.action,
            RoundMetric(scored.support),
            scored.rounded_confidence,
            RoundMetric(scored.lift),
            Describe(scored.rule, scored.support, scored.confidence, scored.lift));
    }

    return PolicySet(name, tables.GetTotalRecords(), std::move(policies));
}

// ============================================================================
// Helpers
// ============================================================================

std::string PolicyExtractor::Describe(const RuleKey& rule,
                                      double support,
                                      double confidence,
                                      double lift) {
    std::ostringstream oss;
    oss << std::fixed
        << "When " << rule.key << "=" << ReprQuote(rule.value)
        << ", agents perform '" << rule.action << "'"
        << " with " << std::setprecision(1) << confidence * 100.0 << "% confidence"
        << " (support=" << support * 100.0 << "%"
        << ", lift=" << std::setprecision(2) << lift << ")";
    return oss.str();
}

double PolicyExtractor::RoundMetric(double value) {
    // printf rounding is exact on the binary value, halves go to even
    char buffer[512];
    std::snprintf(buffer, sizeof(buffer), "%.6f", value);
    return std::strtod(buffer, nullptr);
}

} // namespace policyminer
