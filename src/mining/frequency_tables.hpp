// File: src/mining/frequency_tables.hpp
#pragma once

#include "core/behavior_log.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace policyminer {

// AntecedentKey: (context key, coerced value) pair
struct AntecedentKey {
    std::string key;
    std::string value;

    bool operator==(const AntecedentKey& other) const {
        return key == other.key && value == other.value;
    }
};

// RuleKey: (context key, coerced value, action) triple
struct RuleKey {
    std::string key;
    std::string value;
    std::string action;

    bool operator==(const RuleKey& other) const {
        return key == other.key && value == other.value && action == other.action;
    }
};

// Hash functions for the composite keys
struct AntecedentKeyHash {
    size_t operator()(const AntecedentKey& k) const {
        size_t h1 = std::hash<std::string>()(k.key);
        size_t h2 = std::hash<std::string>()(k.value);
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

struct RuleKeyHash {
    size_t operator()(const RuleKey& k) const {
        size_t h = AntecedentKeyHash()(AntecedentKey{k.key, k.value});
        size_t h3 = std::hash<std::string>()(k.action);
        return h ^ (h3 + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

/// FrequencyTables: Counting pass of policy extraction
///
/// Tracks, over a batch of behavior logs:
/// - How often each action occurs
/// - How many records carry each (key, value) antecedent
/// - How many records carry each (key, value) antecedent AND an action
///
/// Triples are also remembered in first-seen order, which is the canonical
/// discovery order used to keep extraction output deterministic.
///
/// Thread-safety: Not thread-safe. Each counting thread owns its own table
/// and the partial tables are combined with Merge().
class FrequencyTables {
public:
    FrequencyTables() = default;

    // ========================================================================
    // Recording
    // ========================================================================

    /// Count one record
    void Record(const BehaviorLog& log);

    /// Count a contiguous slice [begin, end) of records
    void RecordRange(std::vector<BehaviorLog>::const_iterator begin,
                     std::vector<BehaviorLog>::const_iterator end);

    /// Add the counts of a table built over a later slice of the same input
    ///
    /// Triples not yet known are appended in the other table's discovery
    /// order, so merging slice tables in input order reproduces the
    /// discovery order of a single sequential scan.
    void Merge(const FrequencyTables& other);

    /// Clear all counts
    void Clear();

    // ========================================================================
    // Querying
    // ========================================================================

    uint64_t GetTotalRecords() const { return total_records_; }

    uint64_t GetActionCount(const std::string& action) const;

    uint64_t GetAntecedentCount(const std::string& key, const std::string& value) const;

    uint64_t GetCoOccurrenceCount(const RuleKey& rule) const;

    /// All observed (key, value, action) triples in discovery order
    const std::vector<RuleKey>& GetObservedRules() const { return discovery_order_; }

    // ========================================================================
    // Statistics
    // ========================================================================

    size_t GetUniqueActionCount() const { return action_counts_.size(); }
    size_t GetAntecedentPairCount() const { return antecedent_counts_.size(); }
    size_t GetCoOccurrenceTripleCount() const { return co_occurrence_counts_.size(); }

private:
    uint64_t total_records_{0};

    std::unordered_map<std::string, uint64_t> action_counts_;
    std::unordered_map<AntecedentKey, uint64_t, AntecedentKeyHash> antecedent_counts_;
    std::unordered_map<RuleKey, uint64_t, RuleKeyHash> co_occurrence_counts_;

    // First-seen order of the keys of co_occurrence_counts_
    std::vector<RuleKey> discovery_order_;

    /// Add count to a triple, appending it to the discovery order if new
    void AddCoOccurrence(const RuleKey& rule, uint64_t count);
};

} // namespace policyminer
