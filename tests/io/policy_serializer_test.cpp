// File: tests/io/policy_serializer_test.cpp
//
// Tests for PolicySet JSON persistence

#include "io/policy_serializer.hpp"
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace policyminer {
namespace {

class PolicySerializerTest : public ::testing::Test {
protected:
    std::string temp_path = "/tmp/policyminer_serializer_test.json";

    void TearDown() override {
        std::filesystem::remove(temp_path);
    }

    static PolicySet SampleSet() {
        return PolicySet("Quarterly", 42, {
            MinedPolicy("policy_0001", Antecedent{"role", "admin"}, "read_file",
                        0.7, 1.0, 1.428571, "When role='admin', ..."),
            MinedPolicy("policy_0002", Antecedent{"env", "it's \"prod\""}, "deploy",
                        0.1, 0.6, 0.5, ""),
        }, "2024-05-01T12:00:00.250000");
    }

    static std::string ValidPolicyJson() {
        return R"({"policy_id": "p", "antecedent": {"k": "v"}, "consequent": "c",
                   "support": 0.5, "confidence": 0.5})";
    }
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(PolicySerializerTest, FieldOrder) {
    auto doc = PolicySerializer::ToJson(SampleSet());

    std::vector<std::string> keys;
    for (const auto& item : doc.items()) {
        keys.push_back(item.key());
    }
    EXPECT_EQ((std::vector<std::string>{"name", "source_logs", "policies", "generated_at"}), keys);

    std::vector<std::string> policy_keys;
    for (const auto& item : doc["policies"][0].items()) {
        policy_keys.push_back(item.key());
    }
    EXPECT_EQ((std::vector<std::string>{"policy_id", "antecedent", "consequent", "support",
                                        "confidence", "lift", "description"}), policy_keys);
}

TEST_F(PolicySerializerTest, EncodesValues) {
    auto doc = PolicySerializer::ToJson(SampleSet());

    EXPECT_EQ("Quarterly", doc["name"].get<std::string>());
    EXPECT_EQ(42u, doc["source_logs"].get<uint64_t>());
    EXPECT_EQ("2024-05-01T12:00:00.250000", doc["generated_at"].get<std::string>());
    EXPECT_EQ("admin", doc["policies"][0]["antecedent"]["role"].get<std::string>());
    EXPECT_DOUBLE_EQ(1.428571, doc["policies"][0]["lift"].get<double>());
}

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(PolicySerializerTest, StringRoundTrip) {
    PolicySet original = SampleSet();
    EXPECT_EQ(original, PolicySerializer::FromJsonString(PolicySerializer::ToJsonString(original)));
}

TEST_F(PolicySerializerTest, EmptySetRoundTrip) {
    PolicySet original("empty", 0, {}, "ts");
    EXPECT_EQ(original, PolicySerializer::FromJsonString(PolicySerializer::ToJsonString(original, -1)));
}

TEST_F(PolicySerializerTest, FileRoundTrip) {
    PolicySet original = SampleSet();
    PolicySerializer::SaveToFile(original, temp_path);

    EXPECT_EQ(original, PolicySerializer::LoadFromFile(temp_path));
}

TEST_F(PolicySerializerTest, LoadMissingFile) {
    EXPECT_THROW(PolicySerializer::LoadFromFile("/nonexistent/policyminer/p.json"), std::runtime_error);
}

TEST_F(PolicySerializerTest, SaveToUnwritablePath) {
    EXPECT_THROW(PolicySerializer::SaveToFile(SampleSet(), "/nonexistent/policyminer/p.json"),
                 std::runtime_error);
}

// ============================================================================
// Decoding Defaults
// ============================================================================

TEST_F(PolicySerializerTest, DecodeAppliesDefaults) {
    PolicySet set = PolicySerializer::FromJsonString("{\"policies\": [" + ValidPolicyJson() + "]}");

    EXPECT_EQ(PolicySet::kDefaultName, set.GetName());
    EXPECT_EQ(0u, set.GetSourceLogs());
    EXPECT_FALSE(set.GetGeneratedAt().empty());
    ASSERT_EQ(1u, set.Size());
    EXPECT_DOUBLE_EQ(1.0, set.GetPolicies()[0].GetLift());
    EXPECT_EQ("", set.GetPolicies()[0].GetDescription());
}

TEST_F(PolicySerializerTest, DecodeEmptyObject) {
    PolicySet set = PolicySerializer::FromJsonString("{}");
    EXPECT_TRUE(set.IsEmpty());
}

// ============================================================================
// Malformed Documents
// ============================================================================

TEST_F(PolicySerializerTest, RejectsInvalidJson) {
    EXPECT_THROW(PolicySerializer::FromJsonString("{not json"), ValidationError);
    EXPECT_THROW(PolicySerializer::FromJsonString("[]"), ValidationError);
}

TEST_F(PolicySerializerTest, RejectsNegativeSourceLogs) {
    try {
        PolicySerializer::FromJsonString(R"({"source_logs": -1})");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("source_logs", e.field());
    }
}

TEST_F(PolicySerializerTest, RejectsOutOfRangeSupport) {
    std::string doc = R"({"policies": [{"policy_id": "p", "antecedent": {"k": "v"},
        "consequent": "c", "support": 1.5, "confidence": 0.5}]})";
    try {
        PolicySerializer::FromJsonString(doc);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("policies[0].support", e.field());
    }
}

TEST_F(PolicySerializerTest, RejectsNegativeLift) {
    std::string doc = R"({"policies": [{"policy_id": "p", "antecedent": {"k": "v"},
        "consequent": "c", "support": 0.5, "confidence": 0.5, "lift": -0.1}]})";
    EXPECT_THROW(PolicySerializer::FromJsonString(doc), ValidationError);
}

TEST_F(PolicySerializerTest, RejectsMultiEntryAntecedent) {
    std::string doc = R"({"policies": [{"policy_id": "p", "antecedent": {"a": "1", "b": "2"},
        "consequent": "c", "support": 0.5, "confidence": 0.5}]})";
    try {
        PolicySerializer::FromJsonString(doc);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("policies[0].antecedent", e.field());
    }
}

TEST_F(PolicySerializerTest, RejectsEmptyAntecedent) {
    std::string doc = R"({"policies": [{"policy_id": "p", "antecedent": {},
        "consequent": "c", "support": 0.5, "confidence": 0.5}]})";
    EXPECT_THROW(PolicySerializer::FromJsonString(doc), ValidationError);
}

TEST_F(PolicySerializerTest, RejectsMissingPolicyField) {
    std::string doc = "{\"policies\": [" + ValidPolicyJson() +
        R"(, {"policy_id": "q", "antecedent": {"k": "v"}, "support": 0.5, "confidence": 0.5}]})";
    try {
        PolicySerializer::FromJsonString(doc);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ("policies[1].consequent", e.field());
    }
}

TEST_F(PolicySerializerTest, RejectsWrongTypes) {
    EXPECT_THROW(PolicySerializer::FromJsonString(R"({"name": 5})"), ValidationError);
    EXPECT_THROW(PolicySerializer::FromJsonString(R"({"policies": {}})"), ValidationError);
    EXPECT_THROW(PolicySerializer::FromJsonString(R"({"source_logs": "many"})"), ValidationError);
    EXPECT_THROW(PolicySerializer::FromJsonString(R"({"policies": [{"policy_id": "p",
        "antecedent": {"k": "v"}, "consequent": "c", "support": "high", "confidence": 0.5}]})"),
        ValidationError);
}

} // namespace
} // namespace policyminer
