// File: src/core/policy_set.hpp
#pragma once

#include "core/mined_policy.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace policyminer {

/// PolicySet: Ranked output of one extraction run plus its run metadata
///
/// Policies keep the order they were constructed with. Read-only views such as
/// TopPolicies() return new sequences and never reorder the stored one.
class PolicySet {
public:
    static constexpr const char* kDefaultName = "Mined Policy Set";

    PolicySet();

    /// @param generated_at ISO-8601 creation time (defaults to now)
    explicit PolicySet(std::string name,
                       uint64_t source_logs = 0,
                       std::vector<MinedPolicy> policies = {},
                       std::optional<std::string> generated_at = std::nullopt);

    const std::string& GetName() const { return name_; }
    uint64_t GetSourceLogs() const { return source_logs_; }
    const std::vector<MinedPolicy>& GetPolicies() const { return policies_; }
    const std::string& GetGeneratedAt() const { return generated_at_; }

    size_t Size() const { return policies_.size(); }
    bool IsEmpty() const { return policies_.empty(); }

    /// Get the n highest-confidence policies
    ///
    /// Re-sorts a copy of the stored policies by confidence (descending,
    /// stable) rather than trusting the stored order, which may come from an
    /// external document.
    /// @param n Maximum number of policies to return
    /// @return min(n, Size()) policies
    std::vector<MinedPolicy> TopPolicies(size_t n = 10) const;

    bool operator==(const PolicySet& other) const;
    bool operator!=(const PolicySet& other) const { return !(*this == other); }

private:
    std::string name_;
    uint64_t source_logs_;
    std::vector<MinedPolicy> policies_;
    std::string generated_at_;
};

} // namespace policyminer
