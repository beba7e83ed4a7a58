// File: src/io/log_parser.cpp
#include "io/log_parser.hpp"
#include "core/types.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace policyminer {

namespace {

std::string RequireString(const nlohmann::ordered_json& record, const char* field) {
    auto it = record.find(field);
    if (it == record.end()) {
        throw ValidationError(field, "Field required.");
    }
    if (!it->is_string()) {
        throw ValidationError(field, "Input should be a valid string.");
    }
    return it->get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::ordered_json& record, const char* field) {
    auto it = record.find(field);
    if (it == record.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(field, "Input should be a valid string.");
    }
    return it->get<std::string>();
}

} // namespace

LogParser::LogParser()
    : LogParser(Config())
{
}

LogParser::LogParser(const Config& config)
    : config_(config)
{
}

std::vector<BehaviorLog> LogParser::ParseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + path);
    }
    return ParseStream(file);
}

std::vector<BehaviorLog> LogParser::ParseStream(std::istream& in) {
    std::vector<BehaviorLog> logs;
    skipped_ = 0;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        line_number++;

        std::string trimmed = Trim(line);
        if (trimmed.empty()) {
            continue;
        }

        try {
            logs.push_back(ParseRecord(nlohmann::ordered_json::parse(trimmed)));
        } catch (const nlohmann::json::exception& e) {
            skipped_++;
            ReportSkip("line " + std::to_string(line_number), e.what());
        } catch (const ValidationError& e) {
            skipped_++;
            ReportSkip("line " + std::to_string(line_number), e.what());
        }
    }

    return logs;
}

std::vector<BehaviorLog> LogParser::ParseList(const std::vector<nlohmann::ordered_json>& records) {
    std::vector<BehaviorLog> logs;
    logs.reserve(records.size());
    skipped_ = 0;

    for (size_t i = 0; i < records.size(); ++i) {
        try {
            logs.push_back(ParseRecord(records[i]));
        } catch (const ValidationError& e) {
            skipped_++;
            ReportSkip("record " + std::to_string(i), e.what());
        }
    }

    return logs;
}

BehaviorLog LogParser::ParseRecord(const nlohmann::ordered_json& record) {
    if (!record.is_object()) {
        throw ValidationError("record", "Input should be a valid object.");
    }

    std::string log_id = RequireString(record, "log_id");
    std::string agent_id = RequireString(record, "agent_id");
    std::string action = RequireString(record, "action");
    std::optional<std::string> timestamp = OptionalString(record, "timestamp");
    std::string outcome = OptionalString(record, "outcome").value_or(BehaviorLog::kDefaultOutcome);

    Context context = Context::object();
    auto it = record.find("context");
    if (it != record.end()) {
        if (!it->is_object()) {
            throw ValidationError("context", "Input should be a valid dictionary.");
        }
        context = *it;
    }

    return BehaviorLog(log_id, agent_id, action, std::move(context),
                       std::move(outcome), std::move(timestamp));
}

void LogParser::ReportSkip(const std::string& where, const std::string& reason) const {
    if (config_.verbose) {
        std::cerr << "Skipping " << where << ": " << reason << std::endl;
    }
}

} // namespace policyminer
