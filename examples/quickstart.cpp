// File: examples/quickstart.cpp
//
// Quickstart for the PolicyMiner library.
// Demonstrates:
// - Parsing behavior logs from decoded JSON records
// - Mining policies with default and strict thresholds
// - Rendering policies as text and Markdown
// - Saving and reloading a policy set

#include "io/log_parser.hpp"
#include "io/policy_formatter.hpp"
#include "io/policy_serializer.hpp"
#include "mining/policy_extractor.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace policyminer;

/// Generate synthetic records with baked-in role -> action tendencies
std::vector<nlohmann::ordered_json> GenerateSyntheticLogs(size_t n, unsigned seed) {
    std::mt19937 rng(seed);

    const std::vector<std::string> roles = {"admin", "viewer", "editor", "analyst"};
    std::discrete_distribution<size_t> role_dist({0.2, 0.4, 0.25, 0.15});

    const std::vector<std::string> envs = {"prod", "staging", "dev"};
    std::discrete_distribution<size_t> env_dist({0.5, 0.3, 0.2});

    const std::vector<std::vector<std::string>> actions_by_role = {
        {"delete_record", "write_file", "read_file", "audit_log", "approve"},
        {"read_file", "read_file", "read_file", "audit_log", "send_email"},
        {"write_file", "write_file", "read_file", "audit_log", "send_email"},
        {"read_file", "audit_log", "export_data", "send_email", "read_file"},
    };
    std::uniform_int_distribution<size_t> action_dist(0, 4);
    std::uniform_int_distribution<int> agent_dist(0, 4);

    std::vector<nlohmann::ordered_json> records;
    records.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        size_t role = role_dist(rng);
        char log_id[16];
        std::snprintf(log_id, sizeof(log_id), "log_%04zu", i);

        records.push_back({
            {"log_id", log_id},
            {"agent_id", std::string("agent_") + static_cast<char>('A' + agent_dist(rng))},
            {"action", actions_by_role[role][action_dist(rng)]},
            {"context", {{"role", roles[role]}, {"env", envs[env_dist(rng)]}}},
        });
    }

    return records;
}

int main() {
    std::cout << "=== PolicyMiner Quickstart ===\n\n";

    // Step 1: Parse
    std::cout << "Step 1: Parsing behavior logs...\n";
    LogParser parser;
    auto logs = parser.ParseList(GenerateSyntheticLogs(300, 42));
    std::cout << "  Parsed " << logs.size() << " valid log entries.\n\n";

    // Step 2: Mine with defaults
    std::cout << "Step 2: Mining policies (default thresholds)...\n";
    PolicyExtractor extractor;
    PolicySet policy_set = extractor.Extract(logs, "Quickstart Policies");

    PolicyFormatter formatter;
    std::cout << formatter.ToText(policy_set, 5) << "\n\n";

    // Step 3: Strict thresholds
    std::cout << "Step 3: Mining policies (strict thresholds)...\n";
    PolicyExtractor::Config strict;
    strict.min_support = 0.1;
    strict.min_confidence = 0.5;
    strict.min_lift = 1.5;
    PolicySet strict_set = PolicyExtractor(strict).Extract(logs, "Strict Policies");
    std::cout << "  " << strict_set.Size() << " policies survive strict thresholds.\n\n";
    std::cout << formatter.ToMarkdown(strict_set) << "\n\n";

    // Step 4: Save and reload
    std::cout << "Step 4: Saving and reloading...\n";
    auto path = std::filesystem::temp_directory_path() / "policyminer_quickstart.json";
    PolicySerializer::SaveToFile(policy_set, path.string());
    PolicySet reloaded = PolicySerializer::LoadFromFile(path.string());
    std::cout << "  Round trip " << (reloaded == policy_set ? "preserved" : "CHANGED")
              << " " << reloaded.Size() << " policies.\n";
    std::filesystem::remove(path);

    std::cout << "\nTop 3 by confidence:\n";
    for (const auto& policy : reloaded.TopPolicies(3)) {
        std::cout << "  [" << policy.GetPolicyId() << "] " << policy.GetDescription() << "\n";
    }

    return 0;
}
