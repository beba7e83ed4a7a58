// File: src/core/policy_set.cpp
#include "core/policy_set.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

namespace policyminer {

PolicySet::PolicySet()
    : PolicySet(kDefaultName)
{
}

PolicySet::PolicySet(std::string name,
                     uint64_t source_logs,
                     std::vector<MinedPolicy> policies,
                     std::optional<std::string> generated_at)
    : name_(std::move(name)),
      source_logs_(source_logs),
      policies_(std::move(policies)),
      generated_at_(generated_at ? std::move(*generated_at) : Timestamp::Now().ToIsoString())
{
}

std::vector<MinedPolicy> PolicySet::TopPolicies(size_t n) const {
    std::vector<MinedPolicy> sorted = policies_;

    std::stable_sort(sorted.begin(), sorted.end(),
        [](const MinedPolicy& a, const MinedPolicy& b) {
            return a.GetConfidence() > b.GetConfidence();
        });

    if (sorted.size() > n) {
        sorted.erase(sorted.begin() + static_cast<std::ptrdiff_t>(n), sorted.end());
    }

    return sorted;
}

bool PolicySet::operator==(const PolicySet& other) const {
    return name_ == other.name_ &&
           source_logs_ == other.source_logs_ &&
           policies_ == other.policies_ &&
           generated_at_ == other.generated_at_;
}

} // namespace policyminer
