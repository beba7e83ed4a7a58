// File: src/io/policy_serializer.hpp
#pragma once

#include "core/policy_set.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace policyminer {

/// PolicySerializer: Lossless JSON encoding of a PolicySet
///
/// Document shape (field order preserved on output):
///   {
///     "name": "...",
///     "source_logs": 42,
///     "policies": [
///       {"policy_id": "policy_0001", "antecedent": {"role": "admin"},
///        "consequent": "read_file", "support": 0.7, "confidence": 1.0,
///        "lift": 1.428571, "description": "..."}
///     ],
///     "generated_at": "2026-01-01T00:00:00.000000"
///   }
///
/// Decoding never recovers partially: any missing required field, wrong type
/// or out-of-range number throws ValidationError.
class PolicySerializer {
public:
    using Document = nlohmann::ordered_json;

    static Document ToJson(const PolicySet& policy_set);
    static PolicySet FromJson(const Document& document);

    static std::string ToJsonString(const PolicySet& policy_set, int indent = 2);
    static PolicySet FromJsonString(const std::string& text);

    /// @throws std::runtime_error on I/O failure
    static void SaveToFile(const PolicySet& policy_set, const std::string& path);

    /// @throws std::runtime_error on I/O failure, ValidationError on bad content
    static PolicySet LoadFromFile(const std::string& path);
};

} // namespace policyminer
