// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires pour le Logger NDJSON

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace ConCat;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        logger.resetOutput();
        logger.setConsoleStream(&captured_);
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setCorrelationId("");
        logger.clearGlobalMetadata();
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.resetOutput();
        logger.setLogLevel(LogLevel::ERROR);
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        std::istringstream in(captured_.str());
        std::string line;
        while (std::getline(in, line)) {
            out.push_back(line);
        }
        return out;
    }

    std::ostringstream captured_;
};

TEST_F(LoggerTest, EmitsOneJsonObjectPerLine) {
    LOG_INFO("merger", "first");
    LOG_WARN("merger", "second");

    auto out = lines();
    ASSERT_EQ(out.size(), 2u);
    for (const auto& line : out) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
    EXPECT_NE(out[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(out[0].find("\"module\":\"merger\""), std::string::npos);
    EXPECT_NE(out[0].find("\"message\":\"first\""), std::string::npos);
    EXPECT_NE(out[1].find("\"level\":\"WARN\""), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowThreshold) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);

    LOG_DEBUG("sniffer", "hidden");
    LOG_INFO("sniffer", "hidden");
    LOG_WARN("sniffer", "shown");
    LOG_ERROR("sniffer", "shown");

    EXPECT_EQ(lines().size(), 2u);
    EXPECT_EQ(captured_.str().find("hidden"), std::string::npos);
}

TEST_F(LoggerTest, CorrelationIdAndMetadataAreIncluded) {
    auto& logger = Logger::getInstance();
    std::string id = logger.generateCorrelationId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(std::count(id.begin(), id.end(), '-'), 4);

    logger.setCorrelationId(id);
    logger.addGlobalMetadata("run", "nightly");
    LOG_INFO_META("combine", "done", (std::unordered_map<std::string, std::string>{{"rows", "42"}}));

    std::string line = captured_.str();
    EXPECT_NE(line.find("\"correlation_id\":\"" + id + "\""), std::string::npos);
    EXPECT_NE(line.find("\"rows\":\"42\""), std::string::npos);
    EXPECT_NE(line.find("\"run\":\"nightly\""), std::string::npos);
}

TEST_F(LoggerTest, EscapesJsonStrings) {
    EXPECT_EQ(Logger::escapeJson("a\"b"), "a\\\"b");
    EXPECT_EQ(Logger::escapeJson("tab\there"), "tab\\there");
    EXPECT_EQ(Logger::escapeJson("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(Logger::escapeJson("back\\slash"), "back\\\\slash");
    EXPECT_EQ(Logger::escapeJson(std::string(1, '\x01')), "\\u0001");

    LOG_INFO("dry_run", "path \"C:\\x\"");
    EXPECT_NE(captured_.str().find("path \\\"C:\\\\x\\\""), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
    EXPECT_THROW(Logger::parseLevel("loud"), std::invalid_argument);
}

TEST_F(LoggerTest, FileOutputAppendsAndSilencesConsole) {
    auto path = std::filesystem::temp_directory_path() / "concat_logger_test.log";
    std::filesystem::remove(path);

    auto& logger = Logger::getInstance();
    ASSERT_TRUE(logger.setOutputFile(path.string()));
    LOG_INFO("file", "one");
    LOG_INFO("file", "two");
    logger.flush();
    logger.resetOutput();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("\"message\":\"one\""), std::string::npos);
    EXPECT_NE(content.find("\"message\":\"two\""), std::string::npos);
    EXPECT_TRUE(captured_.str().empty());
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, UnwritableFileKeepsConsole) {
    auto& logger = Logger::getInstance();
    EXPECT_FALSE(logger.setOutputFile("/nonexistent_dir_concat/x.log"));
    LOG_INFO("file", "still on console");
    EXPECT_NE(captured_.str().find("still on console"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("normalizer", "worker " + std::to_string(t) + " entry " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto out = lines();
    ASSERT_EQ(out.size(), 200u);
    for (const auto& line : out) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
}
