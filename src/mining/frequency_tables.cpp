// File: src/mining/frequency_tables.cpp
#include "mining/frequency_tables.hpp"
#include "mining/value_coercion.hpp"

namespace policyminer {

// ============================================================================
// Recording
// ============================================================================

void FrequencyTables::Record(const BehaviorLog& log) {
    total_records_++;
    action_counts_[log.GetAction()]++;

    for (const auto& [key, value] : log.GetContext().items()) {
        std::string coerced = ToAntecedentValue(value);

        antecedent_counts_[AntecedentKey{key, coerced}]++;
        AddCoOccurrence(RuleKey{key, coerced, log.GetAction()}, 1);
    }
}

void FrequencyTables::RecordRange(
    std::vector<BehaviorLog>::const_iterator begin,
    std::vector<BehaviorLog>::const_iterator end
) {
    for (auto it = begin; it != end; ++it) {
        Record(*it);
    }
}

void FrequencyTables::Merge(const FrequencyTables& other) {
    total_records_ += other.total_records_;

    for (const auto& [action, count] : other.action_counts_) {
        action_counts_[action] += count;
    }

    for (const auto& [antecedent, count] : other.antecedent_counts_) {
        antecedent_counts_[antecedent] += count;
    }

    // Walk the other table in its discovery order, not hash order
    for (const auto& rule : other.discovery_order_) {
        AddCoOccurrence(rule, other.GetCoOccurrenceCount(rule));
    }
}

void FrequencyTables::Clear() {
    total_records_ = 0;
    action_counts_.clear();
    antecedent_counts_.clear();
    co_occurrence_counts_.clear();
    discovery_order_.clear();
}

void FrequencyTables::AddCoOccurrence(const RuleKey& rule, uint64_t count) {
    auto [it, inserted] = co_occurrence_counts_.try_emplace(rule, 0);
    if (inserted) {
        discovery_order_.push_back(rule);
    }
    it->second += count;
}

// ============================================================================
// Querying
// ============================================================================

uint64_t FrequencyTables::GetActionCount(const std::string& action) const {
    auto it = action_counts_.find(action);
    return it != action_counts_.end() ? it->second : 0;
}

uint64_t FrequencyTables::GetAntecedentCount(const std::string& key,
                                             const std::string& value) const {
    auto it = antecedent_counts_.find(AntecedentKey{key, value});
    return it != antecedent_counts_.end() ? it->second : 0;
}

uint64_t FrequencyTables::GetCoOccurrenceCount(const RuleKey& rule) const {
    auto it = co_occurrence_counts_.find(rule);
    return it != co_occurrence_counts_.end() ? it->second : 0;
}

} // namespace policyminer
