// File: tests/mining/frequency_tables_test.cpp
#include "mining/frequency_tables.hpp"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace policyminer {
namespace {

BehaviorLog MakeLog(const std::string& id, const std::string& action, Context context) {
    return BehaviorLog(id, "agent", action, std::move(context), "success", "t");
}

std::vector<BehaviorLog> SampleLogs() {
    return {
        MakeLog("1", "read", {{"env", "prod"}, {"role", "admin"}}),
        MakeLog("2", "read", {{"env", "prod"}, {"role", "admin"}}),
        MakeLog("3", "write", {{"env", "dev"}, {"role", "viewer"}}),
        MakeLog("4", "read", {{"env", "dev"}, {"role", "viewer"}}),
    };
}

// ============================================================================
// Counting Tests
// ============================================================================

TEST(FrequencyTablesTest, EmptyTables) {
    FrequencyTables tables;

    EXPECT_EQ(0u, tables.GetTotalRecords());
    EXPECT_EQ(0u, tables.GetUniqueActionCount());
    EXPECT_EQ(0u, tables.GetActionCount("read"));
    EXPECT_EQ(0u, tables.GetAntecedentCount("role", "admin"));
    EXPECT_TRUE(tables.GetObservedRules().empty());
}

TEST(FrequencyTablesTest, CountsActionsAntecedentsAndTriples) {
    auto logs = SampleLogs();
    FrequencyTables tables;
    tables.RecordRange(logs.begin(), logs.end());

    EXPECT_EQ(4u, tables.GetTotalRecords());
    EXPECT_EQ(3u, tables.GetActionCount("read"));
    EXPECT_EQ(1u, tables.GetActionCount("write"));

    EXPECT_EQ(2u, tables.GetAntecedentCount("env", "prod"));
    EXPECT_EQ(2u, tables.GetAntecedentCount("role", "viewer"));

    EXPECT_EQ(2u, tables.GetCoOccurrenceCount(RuleKey{"role", "admin", "read"}));
    EXPECT_EQ(1u, tables.GetCoOccurrenceCount(RuleKey{"env", "dev", "write"}));
    EXPECT_EQ(0u, tables.GetCoOccurrenceCount(RuleKey{"role", "admin", "write"}));

    EXPECT_EQ(2u, tables.GetUniqueActionCount());
    EXPECT_EQ(4u, tables.GetAntecedentPairCount());
    EXPECT_EQ(6u, tables.GetCoOccurrenceTripleCount());
}

TEST(FrequencyTablesTest, RecordsWithoutContextOnlyCountActions) {
    FrequencyTables tables;
    tables.Record(MakeLog("1", "read", {}));

    EXPECT_EQ(1u, tables.GetTotalRecords());
    EXPECT_EQ(1u, tables.GetActionCount("read"));
    EXPECT_EQ(0u, tables.GetAntecedentPairCount());
    EXPECT_TRUE(tables.GetObservedRules().empty());
}

TEST(FrequencyTablesTest, DuplicateRecordsCountedIndependently) {
    FrequencyTables tables;
    tables.Record(MakeLog("dup", "read", {{"role", "admin"}}));
    tables.Record(MakeLog("dup", "read", {{"role", "admin"}}));

    EXPECT_EQ(2u, tables.GetTotalRecords());
    EXPECT_EQ(2u, tables.GetCoOccurrenceCount(RuleKey{"role", "admin", "read"}));
}

TEST(FrequencyTablesTest, CoercedValuesCollapse) {
    FrequencyTables tables;
    tables.Record(MakeLog("1", "x", {{"n", 1}}));
    tables.Record(MakeLog("2", "x", {{"n", "1"}}));

    EXPECT_EQ(2u, tables.GetAntecedentCount("n", "1"));
    EXPECT_EQ(1u, tables.GetAntecedentPairCount());
}

// ============================================================================
// Discovery Order Tests
// ============================================================================

TEST(FrequencyTablesTest, DiscoveryOrderIsFirstSeen) {
    auto logs = SampleLogs();
    FrequencyTables tables;
    tables.RecordRange(logs.begin(), logs.end());

    const auto& rules = tables.GetObservedRules();
    ASSERT_EQ(6u, rules.size());
    EXPECT_EQ((RuleKey{"env", "prod", "read"}), rules[0]);
    EXPECT_EQ((RuleKey{"role", "admin", "read"}), rules[1]);
    EXPECT_EQ((RuleKey{"env", "dev", "write"}), rules[2]);
    EXPECT_EQ((RuleKey{"role", "viewer", "write"}), rules[3]);
    EXPECT_EQ((RuleKey{"env", "dev", "read"}), rules[4]);
    EXPECT_EQ((RuleKey{"role", "viewer", "read"}), rules[5]);
}

TEST(FrequencyTablesTest, DiscoveryOrderFollowsContextInsertionOrder) {
    FrequencyTables tables;
    tables.Record(MakeLog("1", "read", {{"role", "admin"}, {"dept", "eng"}}));

    const auto& rules = tables.GetObservedRules();
    ASSERT_EQ(2u, rules.size());
    EXPECT_EQ((RuleKey{"role", "admin", "read"}), rules[0]);
    EXPECT_EQ((RuleKey{"dept", "eng", "read"}), rules[1]);
}

// ============================================================================
// Merge Tests
// ============================================================================

TEST(FrequencyTablesTest, MergeOfSlicesMatchesSequentialScan) {
    auto logs = SampleLogs();

    FrequencyTables sequential;
    sequential.RecordRange(logs.begin(), logs.end());

    FrequencyTables first;
    FrequencyTables second;
    first.RecordRange(logs.begin(), logs.begin() + 3);
    second.RecordRange(logs.begin() + 3, logs.end());

    FrequencyTables merged;
    merged.Merge(first);
    merged.Merge(second);

    EXPECT_EQ(sequential.GetTotalRecords(), merged.GetTotalRecords());
    EXPECT_EQ(sequential.GetObservedRules(), merged.GetObservedRules());
    for (const auto& rule : sequential.GetObservedRules()) {
        EXPECT_EQ(sequential.GetCoOccurrenceCount(rule), merged.GetCoOccurrenceCount(rule));
        EXPECT_EQ(sequential.GetAntecedentCount(rule.key, rule.value),
                  merged.GetAntecedentCount(rule.key, rule.value));
        EXPECT_EQ(sequential.GetActionCount(rule.action), merged.GetActionCount(rule.action));
    }
}

TEST(FrequencyTablesTest, Clear) {
    auto logs = SampleLogs();
    FrequencyTables tables;
    tables.RecordRange(logs.begin(), logs.end());

    tables.Clear();

    EXPECT_EQ(0u, tables.GetTotalRecords());
    EXPECT_EQ(0u, tables.GetCoOccurrenceTripleCount());
    EXPECT_TRUE(tables.GetObservedRules().empty());
}

} // namespace
} // namespace policyminer
