// File: src/core/behavior_log.cpp
#include "core/behavior_log.hpp"
#include "core/types.hpp"
#include <utility>

namespace policyminer {

namespace {

std::string RequireNonBlank(const std::string& field, const std::string& value) {
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        throw ValidationError(field, "Field must not be blank.");
    }
    return trimmed;
}

Context RequireObject(Context context) {
    if (context.is_null()) {
        return Context::object();
    }
    if (!context.is_object()) {
        throw ValidationError("context", "Input should be a valid dictionary.");
    }
    return context;
}

} // namespace

BehaviorLog::BehaviorLog(const std::string& log_id,
                         const std::string& agent_id,
                         const std::string& action,
                         Context context,
                         std::string outcome,
                         std::optional<std::string> timestamp)
    : log_id_(RequireNonBlank("log_id", log_id)),
      agent_id_(RequireNonBlank("agent_id", agent_id)),
      timestamp_(timestamp ? std::move(*timestamp) : Timestamp::Now().ToIsoString()),
      action_(RequireNonBlank("action", action)),
      context_(RequireObject(std::move(context))),
      outcome_(std::move(outcome))
{
}

bool BehaviorLog::operator==(const BehaviorLog& other) const {
    return log_id_ == other.log_id_ &&
           agent_id_ == other.agent_id_ &&
           timestamp_ == other.timestamp_ &&
           action_ == other.action_ &&
           context_ == other.context_ &&
           outcome_ == other.outcome_;
}

} // namespace policyminer
