// File: tests/benchmarks/extraction_benchmarks.cpp
//
// Performance benchmarks for the mining and io modules

#include <gtest/gtest.h>
#include <chrono>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "io/log_parser.hpp"
#include "io/policy_serializer.hpp"
#include "mining/policy_extractor.hpp"

using namespace policyminer;
using namespace std::chrono;

// ============================================================================
// Benchmark Helper Functions
// ============================================================================

struct BenchmarkTimer {
    using TimePoint = high_resolution_clock::time_point;

    TimePoint start;

    BenchmarkTimer() : start(high_resolution_clock::now()) {}

    double ElapsedMs() const {
        auto end = high_resolution_clock::now();
        return duration_cast<duration<double, std::milli>>(end - start).count();
    }
};

std::vector<BehaviorLog> GenerateLogs(size_t count, size_t attributes = 4) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> value_dist(0, 9);
    std::uniform_int_distribution<int> action_dist(0, 19);

    std::vector<BehaviorLog> logs;
    logs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Context context;
        for (size_t a = 0; a < attributes; ++a) {
            context.emplace("attr_" + std::to_string(a), "v" + std::to_string(value_dist(gen)));
        }
        logs.emplace_back("log_" + std::to_string(i), "agent",
                          "action_" + std::to_string(action_dist(gen)),
                          std::move(context), "success", "2024-01-01T00:00:00");
    }
    return logs;
}

// ============================================================================
// FrequencyTables Benchmarks
// ============================================================================

TEST(FrequencyTablesBenchmark, Count_100000) {
    auto logs = GenerateLogs(100000);

    BenchmarkTimer timer;
    FrequencyTables tables = PolicyExtractor::CountFrequencies(logs);
    double elapsed = timer.ElapsedMs();

    double logs_per_sec = (100000.0 / elapsed) * 1000.0;
    std::cout << "CountFrequencies (100000): " << elapsed << "ms, "
              << logs_per_sec << " logs/sec" << std::endl;

    EXPECT_EQ(100000u, tables.GetTotalRecords());
    EXPECT_LT(elapsed, 5000.0); // Should complete in < 5s
}

TEST(FrequencyTablesBenchmark, ParallelCount_100000) {
    auto logs = GenerateLogs(100000);

    BenchmarkTimer timer;
    FrequencyTables tables = PolicyExtractor::CountFrequencies(logs, 4);
    double elapsed = timer.ElapsedMs();

    std::cout << "CountFrequencies x4 (100000): " << elapsed << "ms" << std::endl;

    EXPECT_EQ(100000u, tables.GetTotalRecords());
    EXPECT_LT(elapsed, 5000.0);
}

// ============================================================================
// PolicyExtractor Benchmarks
// ============================================================================

TEST(PolicyExtractorBenchmark, Extract_50000_WideContext) {
    auto logs = GenerateLogs(50000, 12);

    PolicyExtractor::Config config;
    config.min_support = 0.0;
    config.min_confidence = 0.0;
    config.min_lift = 0.0;
    PolicyExtractor extractor(config);

    BenchmarkTimer timer;
    PolicySet result = extractor.Extract(logs);
    double elapsed = timer.ElapsedMs();

    std::cout << "Extract (50000 logs, 12 attributes): " << elapsed << "ms, "
              << result.Size() << " policies" << std::endl;

    // 12 attributes x 10 values x 20 actions
    EXPECT_EQ(2400u, result.Size());
    EXPECT_LT(elapsed, 5000.0);
}

// ============================================================================
// IO Benchmarks
// ============================================================================

TEST(LogParserBenchmark, ParseStream_20000) {
    std::ostringstream ss;
    for (size_t i = 0; i < 20000; ++i) {
        ss << R"({"log_id": "l)" << i
           << R"(", "agent_id": "a", "action": "read", "context": {"role": "admin", "env": "prod"}})"
           << "\n";
    }
    std::istringstream in(ss.str());

    LogParser parser;
    BenchmarkTimer timer;
    auto logs = parser.ParseStream(in);
    double elapsed = timer.ElapsedMs();

    std::cout << "ParseStream (20000): " << elapsed << "ms" << std::endl;

    EXPECT_EQ(20000u, logs.size());
    EXPECT_LT(elapsed, 5000.0);
}

TEST(PolicySerializerBenchmark, RoundTrip_2400) {
    PolicyExtractor::Config config;
    config.min_support = 0.0;
    config.min_confidence = 0.0;
    config.min_lift = 0.0;
    PolicySet policy_set = PolicyExtractor(config).Extract(GenerateLogs(5000, 12));

    BenchmarkTimer timer;
    PolicySet reloaded = PolicySerializer::FromJsonString(PolicySerializer::ToJsonString(policy_set));
    double elapsed = timer.ElapsedMs();

    std::cout << "Serializer round trip (" << policy_set.Size() << " policies): "
              << elapsed << "ms" << std::endl;

    EXPECT_EQ(policy_set, reloaded);
    EXPECT_LT(elapsed, 2000.0);
}
