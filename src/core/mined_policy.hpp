// File: src/core/mined_policy.hpp
#pragma once

#include <string>

namespace policyminer {

// Antecedent: The single context attribute and coerced value triggering a rule
struct Antecedent {
    std::string key;
    std::string value;

    bool operator==(const Antecedent& other) const {
        return key == other.key && value == other.value;
    }
    bool operator!=(const Antecedent& other) const { return !(*this == other); }
};

/// MinedPolicy: A governance policy extracted from behavioral patterns
///
/// Invariants (checked on construction):
/// - support in [0, 1]
/// - confidence in [0, 1]
/// - lift >= 0
class MinedPolicy {
public:
    /// @throws ValidationError naming the first out-of-range field
    MinedPolicy(std::string policy_id,
                Antecedent antecedent,
                std::string consequent,
                double support,
                double confidence,
                double lift = 1.0,
                std::string description = "");

    const std::string& GetPolicyId() const { return policy_id_; }
    const Antecedent& GetAntecedent() const { return antecedent_; }
    const std::string& GetConsequent() const { return consequent_; }
    double GetSupport() const { return support_; }
    double GetConfidence() const { return confidence_; }
    double GetLift() const { return lift_; }
    const std::string& GetDescription() const { return description_; }

    bool operator==(const MinedPolicy& other) const;
    bool operator!=(const MinedPolicy& other) const { return !(*this == other); }

private:
    std::string policy_id_;
    Antecedent antecedent_;
    std::string consequent_;
    double support_;
    double confidence_;
    double lift_;
    std::string description_;
};

} // namespace policyminer
