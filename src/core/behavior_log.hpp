// File: src/core/behavior_log.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace policyminer {

/// Arbitrary scalar or structured context attribute value
/// Nested objects keep their members in insertion order.
using ContextValue = nlohmann::ordered_json;

/// Situational context of one action
///
/// Always a JSON object. Members iterate (via items()) in the order they
/// were supplied, which fixes the discovery order of antecedents.
using Context = nlohmann::ordered_json;

/// BehaviorLog: A single recorded agent action in context
///
/// Immutable once constructed. log_id, agent_id and action are trimmed and
/// must be non-blank; the timestamp defaults to the current UTC time and the
/// outcome to "success". Neither timestamp nor outcome is consulted during
/// policy extraction.
class BehaviorLog {
public:
    static constexpr const char* kDefaultOutcome = "success";

    /// A null context is stored as an empty object
    /// @throws ValidationError if log_id, agent_id or action is blank, or if
    ///         context is neither null nor an object
    BehaviorLog(const std::string& log_id,
                const std::string& agent_id,
                const std::string& action,
                Context context = {},
                std::string outcome = kDefaultOutcome,
                std::optional<std::string> timestamp = std::nullopt);

    const std::string& GetLogId() const { return log_id_; }
    const std::string& GetAgentId() const { return agent_id_; }
    const std::string& GetTimestamp() const { return timestamp_; }
    const std::string& GetAction() const { return action_; }
    const Context& GetContext() const { return context_; }
    const std::string& GetOutcome() const { return outcome_; }

    bool operator==(const BehaviorLog& other) const;
    bool operator!=(const BehaviorLog& other) const { return !(*this == other); }

private:
    std::string log_id_;
    std::string agent_id_;
    std::string timestamp_;
    std::string action_;
    Context context_;
    std::string outcome_;
};

} // namespace policyminer
