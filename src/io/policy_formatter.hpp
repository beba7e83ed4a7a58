// File: src/io/policy_formatter.hpp
#pragma once

#include "core/policy_set.hpp"
#include <string>

namespace policyminer {

/// PolicyFormatter: Render a PolicySet as a plain-text report or Markdown table
///
/// Policies are rendered in stored order, truncated to max_policies.
class PolicyFormatter {
public:
    static constexpr size_t kDefaultMaxPolicies = 50;

    std::string ToText(const PolicySet& policy_set,
                       size_t max_policies = kDefaultMaxPolicies) const;

    std::string ToMarkdown(const PolicySet& policy_set,
                           size_t max_policies = kDefaultMaxPolicies) const;
};

} // namespace policyminer
