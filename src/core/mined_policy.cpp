// File: src/core/mined_policy.cpp
#include "core/mined_policy.hpp"
#include "core/types.hpp"
#include <utility>

namespace policyminer {

namespace {

// Written as a negated range test so that NaN is rejected too
double RequireFraction(const char* field, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ValidationError(field, "must be between 0.0 and 1.0");
    }
    return value;
}

double RequireNonNegative(const char* field, double value) {
    if (!(value >= 0.0)) {
        throw ValidationError(field, "must be greater than or equal to 0.0");
    }
    return value;
}

} // namespace

MinedPolicy::MinedPolicy(std::string policy_id,
                         Antecedent antecedent,
                         std::string consequent,
                         double support,
                         double confidence,
                         double lift,
                         std::string description)
    : policy_id_(std::move(policy_id)),
      antecedent_(std::move(antecedent)),
      consequent_(std::move(consequent)),
      support_(RequireFraction("support", support)),
      confidence_(RequireFraction("confidence", confidence)),
      lift_(RequireNonNegative("lift", lift)),
      description_(std::move(description))
{
}

bool MinedPolicy::operator==(const MinedPolicy& other) const {
    return policy_id_ == other.policy_id_ &&
           antecedent_ == other.antecedent_ &&
           consequent_ == other.consequent_ &&
           support_ == other.support_ &&
           confidence_ == other.confidence_ &&
           lift_ == other.lift_ &&
           description_ == other.description_;
}

} // namespace policyminer
