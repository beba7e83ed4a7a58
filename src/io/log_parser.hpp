// File: src/io/log_parser.hpp
#pragma once

#include "core/behavior_log.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <string>
#include <vector>

namespace policyminer {

/// LogParser: Load and validate JSONL behavior logs
///
/// Each non-blank line must hold one JSON object shaped like a BehaviorLog:
///   {"log_id": "...", "agent_id": "...", "action": "...",
///    "timestamp": "...", "context": {...}, "outcome": "..."}
/// Malformed or invalid lines are skipped and counted. Records are decoded
/// as ordered_json so context members keep their order from the input.
///
/// Thread-safety: Not thread-safe (skip counter is per instance).
class LogParser {
public:
    struct Config {
        Config() = default;
        /// Print the reason for each skipped record to stderr
        bool verbose{false};
    };

    LogParser();
    explicit LogParser(const Config& config);

    /// Parse a JSONL file
    /// @throws std::runtime_error if the file cannot be opened
    std::vector<BehaviorLog> ParseFile(const std::string& path);

    /// Parse JSONL from a stream
    std::vector<BehaviorLog> ParseStream(std::istream& in);

    /// Parse already-decoded JSON records
    std::vector<BehaviorLog> ParseList(const std::vector<nlohmann::ordered_json>& records);

    /// Validate a single decoded record
    /// @throws ValidationError on missing, blank or ill-typed fields
    static BehaviorLog ParseRecord(const nlohmann::ordered_json& record);

    /// Number of records skipped by the most recent parse call
    size_t GetSkippedCount() const { return skipped_; }

private:
    Config config_;
    size_t skipped_{0};

    void ReportSkip(const std::string& where, const std::string& reason) const;
};

} // namespace policyminer
