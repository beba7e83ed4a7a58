// File: tests/core/mined_policy_test.cpp
#include "core/mined_policy.hpp"
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace policyminer {
namespace {

MinedPolicy MakePolicy(double support, double confidence, double lift) {
    return MinedPolicy("policy_0001", Antecedent{"role", "admin"}, "read_file",
                       support, confidence, lift, "desc");
}

TEST(MinedPolicyTest, StoresFields) {
    MinedPolicy policy = MakePolicy(0.7, 1.0, 1.428571);

    EXPECT_EQ("policy_0001", policy.GetPolicyId());
    EXPECT_EQ("role", policy.GetAntecedent().key);
    EXPECT_EQ("admin", policy.GetAntecedent().value);
    EXPECT_EQ("read_file", policy.GetConsequent());
    EXPECT_DOUBLE_EQ(0.7, policy.GetSupport());
    EXPECT_DOUBLE_EQ(1.0, policy.GetConfidence());
    EXPECT_DOUBLE_EQ(1.428571, policy.GetLift());
    EXPECT_EQ("desc", policy.GetDescription());
}

TEST(MinedPolicyTest, DefaultLiftAndDescription) {
    MinedPolicy policy("p", Antecedent{"k", "v"}, "act", 0.5, 0.5);

    EXPECT_DOUBLE_EQ(1.0, policy.GetLift());
    EXPECT_TRUE(policy.GetDescription().empty());
}

TEST(MinedPolicyTest, BoundaryValuesAccepted) {
    EXPECT_NO_THROW(MakePolicy(0.0, 0.0, 0.0));
    EXPECT_NO_THROW(MakePolicy(1.0, 1.0, 1000.0));
}

TEST(MinedPolicyTest, SupportOutOfRangeRejected) {
    try {
        MakePolicy(1.5, 0.5, 1.0);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("support", e.field());
    }
    EXPECT_THROW(MakePolicy(-0.1, 0.5, 1.0), ValidationError);
}

TEST(MinedPolicyTest, ConfidenceOutOfRangeRejected) {
    try {
        MakePolicy(0.5, 1.01, 1.0);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("confidence", e.field());
    }
}

TEST(MinedPolicyTest, NegativeLiftRejected) {
    try {
        MakePolicy(0.5, 0.5, -1.0);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("lift", e.field());
    }
}

TEST(MinedPolicyTest, NaNRejected) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(MakePolicy(nan, 0.5, 1.0), ValidationError);
    EXPECT_THROW(MakePolicy(0.5, nan, 1.0), ValidationError);
    EXPECT_THROW(MakePolicy(0.5, 0.5, nan), ValidationError);
}

TEST(MinedPolicyTest, Equality) {
    EXPECT_EQ(MakePolicy(0.5, 0.5, 1.0), MakePolicy(0.5, 0.5, 1.0));
    EXPECT_NE(MakePolicy(0.5, 0.5, 1.0), MakePolicy(0.5, 0.6, 1.0));
}

} // namespace
} // namespace policyminer
