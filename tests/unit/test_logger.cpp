/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and the log sinks.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace node_order;
using namespace node_order::testing;

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    MemorySink sink;
    Logger logger(std::make_unique<CaptureSink>(sink), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("also shown");

    EXPECT_EQ(sink.lines().size(), 2u);
    EXPECT_FALSE(sink.contains("hidden"));
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    EXPECT_TRUE(logger.enabled(LogLevel::Error));
}

TEST(LoggerTest, EmitsJsonLine) {
    MemorySink sink;
    Logger logger(std::make_unique<CaptureSink>(sink), LogLevel::Debug);

    logger.warn(R"(node "n1" missing)");

    ASSERT_EQ(sink.lines().size(), 1u);
    const auto& line = sink.lines().front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(line.find(R"(node \"n1\" missing)"), std::string::npos);
}

TEST(LoggerTest, SetLevelAtRuntime) {
    MemorySink sink;
    Logger logger(std::make_unique<CaptureSink>(sink), LogLevel::Error);
    logger.info("before");
    logger.set_level(LogLevel::Info);
    logger.info("after");

    EXPECT_EQ(logger.level(), LogLevel::Info);
    EXPECT_EQ(sink.count_containing("before"), 0u);
    EXPECT_EQ(sink.count_containing("after"), 1u);

    sink.clear();
    EXPECT_TRUE(sink.lines().empty());
}

TEST(JsonFileSinkTest, AppendsLines) {
    auto dir = std::filesystem::temp_directory_path() / "nodeorder_test_logs";
    std::filesystem::remove_all(dir);
    {
        JsonFileSink sink(dir, "unit");
        ASSERT_TRUE(sink.is_open());
        sink.write(R"({"msg":"one"})");
        sink.write(R"({"msg":"two"})");
        sink.flush();
    }

    std::ifstream in(dir / "unit.ndjson");
    std::string line;
    int count = 0;
    while (std::getline(in, line)) ++count;
    EXPECT_EQ(count, 2);
    std::filesystem::remove_all(dir);
}
