// File: src/io/policy_serializer.cpp
#include "io/policy_serializer.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace policyminer {

namespace {

using Document = PolicySerializer::Document;

const Document& RequireField(const Document& object, const std::string& path, const char* field) {
    auto it = object.find(field);
    if (it == object.end()) {
        throw ValidationError(path + field, "Field required.");
    }
    return *it;
}

std::string ReadString(const Document& value, const std::string& path) {
    if (!value.is_string()) {
        throw ValidationError(path, "Input should be a valid string.");
    }
    return value.get<std::string>();
}

double ReadNumber(const Document& value, const std::string& path) {
    if (!value.is_number()) {
        throw ValidationError(path, "Input should be a valid number.");
    }
    return value.get<double>();
}

uint64_t ReadCount(const Document& value, const std::string& path) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        throw ValidationError(path, "Input should be greater than or equal to 0.");
    }
    throw ValidationError(path, "Input should be a valid integer.");
}

Document PolicyToJson(const MinedPolicy& policy) {
    Document antecedent = Document::object();
    antecedent[policy.GetAntecedent().key] = policy.GetAntecedent().value;

    Document out = Document::object();
    out["policy_id"] = policy.GetPolicyId();
    out["antecedent"] = std::move(antecedent);
    out["consequent"] = policy.GetConsequent();
    out["support"] = policy.GetSupport();
    out["confidence"] = policy.GetConfidence();
    out["lift"] = policy.GetLift();
    out["description"] = policy.GetDescription();
    return out;
}

MinedPolicy PolicyFromJson(const Document& object, const std::string& path) {
    if (!object.is_object()) {
        throw ValidationError(path, "Input should be a valid object.");
    }

    std::string policy_id = ReadString(RequireField(object, path, "policy_id"), path + "policy_id");

    const Document& antecedent_json = RequireField(object, path, "antecedent");
    if (!antecedent_json.is_object() || antecedent_json.size() != 1) {
        throw ValidationError(path + "antecedent", "must be an object with exactly one entry.");
    }
    auto entry = antecedent_json.begin();
    Antecedent antecedent{entry.key(), ReadString(entry.value(), path + "antecedent." + entry.key())};

    std::string consequent = ReadString(RequireField(object, path, "consequent"), path + "consequent");
    double support = ReadNumber(RequireField(object, path, "support"), path + "support");
    double confidence = ReadNumber(RequireField(object, path, "confidence"), path + "confidence");

    double lift = 1.0;
    auto lift_it = object.find("lift");
    if (lift_it != object.end()) {
        lift = ReadNumber(*lift_it, path + "lift");
    }

    std::string description;
    auto description_it = object.find("description");
    if (description_it != object.end()) {
        description = ReadString(*description_it, path + "description");
    }

    // Range checks live in MinedPolicy; re-anchor the field to this document
    try {
        return MinedPolicy(std::move(policy_id), std::move(antecedent), std::move(consequent),
                           support, confidence, lift, std::move(description));
    } catch (const ValidationError& e) {
        throw ValidationError(path + e.field(), e.message());
    }
}

} // namespace

Document PolicySerializer::ToJson(const PolicySet& policy_set) {
    Document policies = Document::array();
    for (const auto& policy : policy_set.GetPolicies()) {
        policies.push_back(PolicyToJson(policy));
    }

    Document out = Document::object();
    out["name"] = policy_set.GetName();
    out["source_logs"] = policy_set.GetSourceLogs();
    out["policies"] = std::move(policies);
    out["generated_at"] = policy_set.GetGeneratedAt();
    return out;
}

PolicySet PolicySerializer::FromJson(const Document& document) {
    if (!document.is_object()) {
        throw ValidationError("document", "Input should be a valid object.");
    }

    std::string name = PolicySet::kDefaultName;
    auto name_it = document.find("name");
    if (name_it != document.end()) {
        name = ReadString(*name_it, "name");
    }

    uint64_t source_logs = 0;
    auto source_it = document.find("source_logs");
    if (source_it != document.end()) {
        source_logs = ReadCount(*source_it, "source_logs");
    }

    std::vector<MinedPolicy> policies;
    auto policies_it = document.find("policies");
    if (policies_it != document.end()) {
        if (!policies_it->is_array()) {
            throw ValidationError("policies", "Input should be a valid list.");
        }
        policies.reserve(policies_it->size());
        for (size_t i = 0; i < policies_it->size(); ++i) {
            std::string path = "policies[" + std::to_string(i) + "].";
            policies.push_back(PolicyFromJson((*policies_it)[i], path));
        }
    }

    std::optional<std::string> generated_at;
    auto generated_it = document.find("generated_at");
    if (generated_it != document.end()) {
        generated_at = ReadString(*generated_it, "generated_at");
    }

    return PolicySet(std::move(name), source_logs, std::move(policies), std::move(generated_at));
}

std::string PolicySerializer::ToJsonString(const PolicySet& policy_set, int indent) {
    return ToJson(policy_set).dump(indent);
}

PolicySet PolicySerializer::FromJsonString(const std::string& text) {
    Document document;
    try {
        document = Document::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("document", e.what());
    }
    return FromJson(document);
}

void PolicySerializer::SaveToFile(const PolicySet& policy_set, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    file << ToJsonString(policy_set);
    if (!file) {
        throw std::runtime_error("Failed to write policy set: " + path);
    }
}

PolicySet PolicySerializer::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open policy file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return FromJsonString(buffer.str());
}

} // namespace policyminer
