// File: src/mining/policy_extractor.hpp
#pragma once

#include "core/behavior_log.hpp"
#include "core/policy_set.hpp"
#include "mining/frequency_tables.hpp"
#include <string>
#include <vector>

namespace policyminer {

/// PolicyExtractor: Governance policy mining by association rules
///
/// For every (context key, value) antecedent and action consequent observed
/// together in the logs:
///   support    = count(antecedent AND consequent) / total_logs
///   confidence = count(antecedent AND consequent) / count(antecedent)
///   lift       = confidence / (count(consequent) / total_logs)
///
/// A rule is kept only when support >= min_support, confidence >=
/// min_confidence and lift >= min_lift. Kept rules are sorted by confidence
/// (descending, stable over discovery order) and numbered policy_0001, ...
///
/// Extract() is a pure function of its input and configuration; all counting
/// state is local to the call, so one extractor may serve several threads.
class PolicyExtractor {
public:
    /// Upper bound on counting threads; larger requests are capped
    static constexpr size_t kMaxThreads = 256;

    /// Configuration for policy extraction
    ///
    /// Thresholds are not clamped. An out-of-range value simply filters out
    /// every rule.
    struct Config {
        Config() = default;
        /// Minimum support fraction
        double min_support{0.05};
        /// Minimum confidence fraction
        double min_confidence{0.6};
        /// Minimum lift (1.0 keeps rules at or above baseline)
        double min_lift{1.0};
        /// Worker threads for the counting pass (0 is treated as 1, values
        /// above kMaxThreads as kMaxThreads)
        size_t num_threads{1};
    };

    PolicyExtractor();
    explicit PolicyExtractor(const Config& config);

    /// Mine association rules from a batch of behavior logs
    /// @param logs Logs to analyse
    /// @param name Name for the resulting PolicySet
    /// @return PolicySet with source_logs = logs.size()
    PolicySet Extract(const std::vector<BehaviorLog>& logs,
                      const std::string& name = PolicySet::kDefaultName) const;

    /// Run the counting pass only
    /// @param num_threads Number of contiguous slices counted in parallel
    /// @throws std::system_error if a worker thread cannot be started; threads
    ///         already started are joined first
    static FrequencyTables CountFrequencies(const std::vector<BehaviorLog>& logs,
                                            size_t num_threads = 1);

    /// Build the description sentence for a rule from unrounded metrics
    static std::string Describe(const RuleKey& rule,
                                double support,
                                double confidence,
                                double lift);

    /// Round to 6 decimal digits, the precision stored in a MinedPolicy
    static double RoundMetric(double value);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace policyminer
