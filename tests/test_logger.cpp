// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires du Logger NDJSON

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

using namespace ARL;
using nlohmann::json;

namespace {

std::vector<json> readLines(const std::string& path) {
    std::vector<json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) lines.push_back(json::parse(line));
    }
    return lines;
}

} // namespace

// EN: Test fixture routing the logger to a scratch file
// FR: Fixture de test dirigeant le logger vers un fichier temporaire
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = "test_logger_output.ndjson";
        std::remove(log_path_.c_str());
        ASSERT_TRUE(logger().setOutputFile(log_path_));
        logger().setLogLevel(LogLevel::DEBUG);
        logger().setCorrelationId("");
    }

    void TearDown() override {
        logger().setLogLevel(LogLevel::ERROR);
        logger().setConsoleSink(LogSink::NONE);
        std::remove(log_path_.c_str());
    }

    Logger& logger() { return Logger::getInstance(); }

    std::string log_path_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("area_test", "Area \"berlin\" audited\nwith a newline");
    logger().flush();

    std::vector<json> lines = readLines(log_path_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["level"], "INFO");
    EXPECT_EQ(lines[0]["module"], "area_test");
    EXPECT_EQ(lines[0]["message"], "Area \"berlin\" audited\nwith a newline");
    EXPECT_TRUE(lines[0].contains("timestamp"));
    EXPECT_TRUE(lines[0].contains("thread_id"));
    EXPECT_FALSE(lines[0].contains("correlation_id"));
}

TEST_F(LoggerTest, LevelFiltersLowerEntries) {
    logger().setLogLevel(LogLevel::WARN);
    LOG_DEBUG("level_test", "hidden");
    LOG_INFO("level_test", "hidden");
    LOG_WARN("level_test", "shown");
    LOG_ERROR("level_test", "shown");
    logger().flush();

    std::vector<json> lines = readLines(log_path_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"], "WARN");
    EXPECT_EQ(lines[1]["level"], "ERROR");
    EXPECT_EQ(logger().getLogLevel(), LogLevel::WARN);
}

TEST_F(LoggerTest, MetadataNeverOverridesFixedFields) {
    logger().setCorrelationId("run-1");
    logger().addGlobalMetadata("ruleset_version", "1");
    LOG_INFO_META("meta_test", "Lint complete", (std::unordered_map<std::string, std::string>{
        {"area_id", "berlin"}, {"level", "bogus"}}));
    logger().flush();

    std::vector<json> lines = readLines(log_path_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["correlation_id"], "run-1");
    EXPECT_EQ(lines[0]["area_id"], "berlin");
    EXPECT_EQ(lines[0]["ruleset_version"], "1");
    EXPECT_EQ(lines[0]["level"], "INFO");
}

TEST_F(LoggerTest, ConcurrentWritersKeepLinesIntact) {
    const int thread_count = 4;
    const int per_thread = 25;
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([i] {
            for (int j = 0; j < per_thread; ++j) {
                LOG_DEBUG("thread_test", "worker " + std::to_string(i) + " entry " + std::to_string(j));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    logger().flush();

    std::vector<json> lines = readLines(log_path_);
    EXPECT_EQ(lines.size(), static_cast<size_t>(thread_count * per_thread));
}

TEST_F(LoggerTest, UnwritableFileIsReported) {
    EXPECT_FALSE(logger().setOutputFile("/nonexistent-directory/arealint.log"));
}

TEST(LoggerUtilsTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LoggerUtilsTest, CorrelationIdsLookLikeUuids) {
    const std::string id = Logger::getInstance().generateCorrelationId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_NE(id, Logger::getInstance().generateCorrelationId());
}

// EN: Main test runner
// FR: Lanceur de test principal
int main(int argc, char** argv) {
    ARL::Logger::getInstance().setLogLevel(ARL::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
