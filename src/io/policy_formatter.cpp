// File: src/io/policy_formatter.cpp
#include "io/policy_formatter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace policyminer {

namespace {

std::string Metric(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

} // namespace

std::string PolicyFormatter::ToText(const PolicySet& policy_set, size_t max_policies) const {
    const auto& policies = policy_set.GetPolicies();
    size_t shown = std::min(max_policies, policies.size());

    std::ostringstream oss;
    oss << "Policy Set: " << policy_set.GetName() << "\n"
        << "Source logs: " << policy_set.GetSourceLogs() << "\n"
        << "Generated at: " << policy_set.GetGeneratedAt() << "\n"
        << "Total policies: " << policies.size() << "\n"
        << std::string(60, '-');

    for (size_t i = 0; i < shown; ++i) {
        const MinedPolicy& policy = policies[i];
        oss << "\n[" << policy.GetPolicyId() << "] " << policy.GetDescription()
            << "\n  support=" << Metric(policy.GetSupport())
            << " confidence=" << Metric(policy.GetConfidence())
            << " lift=" << Metric(policy.GetLift());
    }

    return oss.str();
}

std::string PolicyFormatter::ToMarkdown(const PolicySet& policy_set, size_t max_policies) const {
    const auto& policies = policy_set.GetPolicies();
    size_t shown = std::min(max_policies, policies.size());

    std::ostringstream oss;
    oss << "# " << policy_set.GetName() << "\n"
        << "\n"
        << "- **Source logs:** " << policy_set.GetSourceLogs() << "\n"
        << "- **Generated at:** " << policy_set.GetGeneratedAt() << "\n"
        << "- **Total policies:** " << policies.size() << "\n"
        << "\n"
        << "| ID | Antecedent | Consequent | Support | Confidence | Lift |\n"
        << "|----|-----------|-----------|---------|------------|------|";

    for (size_t i = 0; i < shown; ++i) {
        const MinedPolicy& policy = policies[i];
        const Antecedent& antecedent = policy.GetAntecedent();
        oss << "\n| " << policy.GetPolicyId()
            << " | " << antecedent.key << "=" << antecedent.value
            << " | " << policy.GetConsequent()
            << " | " << Metric(policy.GetSupport())
            << " | " << Metric(policy.GetConfidence())
            << " | " << Metric(policy.GetLift()) << " |";
    }

    return oss.str();
}

} // namespace policyminer
