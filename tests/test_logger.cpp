// EN: Unit tests for the NDJSON logger.
// FR: Tests unitaires pour le logger NDJSON.

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/test_helpers.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace HVC;

namespace {

std::vector<nlohmann::json> parseLines(const std::string& text) {
    std::vector<nlohmann::json> entries;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            entries.push_back(nlohmann::json::parse(line));
        }
    }
    return entries;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.setOutputStream(&stream_);
        logger_.setLogLevel(LogLevel::DEBUG);
    }

    std::vector<nlohmann::json> entries() const { return parseLines(stream_.str()); }

    std::ostringstream stream_;
    Logger logger_;
};

TEST_F(LoggerTest, Entry_ShouldBeOneJsonObjectPerLine) {
    logger_.info("probe", "Inventory captured");
    logger_.warn("probe", "Section unavailable");

    const auto logged = entries();
    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[0]["level"], "INFO");
    EXPECT_EQ(logged[0]["module"], "probe");
    EXPECT_EQ(logged[0]["message"], "Inventory captured");
    EXPECT_EQ(logged[1]["level"], "WARN");
}

TEST_F(LoggerTest, Timestamp_ShouldBeIso8601Utc) {
    logger_.info("test", "timestamp");

    const auto logged = entries();
    ASSERT_EQ(logged.size(), 1u);
    const std::string timestamp = logged[0]["timestamp"];
    ASSERT_EQ(timestamp.size(), 24u);
    EXPECT_EQ(timestamp[10], 'T');
    EXPECT_EQ(timestamp[19], '.');
    EXPECT_EQ(timestamp.back(), 'Z');
}

TEST_F(LoggerTest, LogLevel_ShouldFilterLowerLevels) {
    logger_.setLogLevel(LogLevel::WARN);

    HVC_LOG_DEBUG(logger_, "level", "hidden");
    HVC_LOG_INFO(logger_, "level", "hidden");
    HVC_LOG_WARN(logger_, "level", "shown");
    HVC_LOG_ERROR(logger_, "level", "shown");

    const auto logged = entries();
    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[0]["level"], "WARN");
    EXPECT_EQ(logged[1]["level"], "ERROR");
    EXPECT_EQ(logger_.getLogLevel(), LogLevel::WARN);
}

TEST_F(LoggerTest, CorrelationId_ShouldBeAttachedToEntries) {
    const std::string run_id = Logger::generateCorrelationId();
    EXPECT_EQ(run_id.size(), 36u);
    EXPECT_EQ(run_id[8], '-');
    EXPECT_NE(run_id, Logger::generateCorrelationId());

    logger_.setCorrelationId(run_id);
    logger_.info("run", "started");

    EXPECT_EQ(logger_.getCorrelationId(), run_id);
    EXPECT_EQ(entries().at(0)["correlation_id"], run_id);
}

TEST_F(LoggerTest, Metadata_ShouldMergeGlobalAndEntryValues) {
    logger_.addGlobalMetadata("command", "clean-devices");
    logger_.addGlobalMetadata("host", "global-host");

    HVC_LOG_INFO_META(logger_, "executor", "Step completed",
                      (std::unordered_map<std::string, std::string>{{"step", "remove-device:1"},
                                                                    {"host", "entry-host"}}));

    const auto entry = entries().at(0);
    EXPECT_EQ(entry["command"], "clean-devices");
    EXPECT_EQ(entry["step"], "remove-device:1");
    EXPECT_EQ(entry["host"], "entry-host");
}

TEST_F(LoggerTest, Metadata_ShouldNotOverrideReservedFields) {
    logger_.error("backup", "Backup failed", {{"message", "spoofed"}, {"level", "DEBUG"}});

    const auto entry = entries().at(0);
    EXPECT_EQ(entry["message"], "Backup failed");
    EXPECT_EQ(entry["level"], "ERROR");
}

TEST_F(LoggerTest, Message_ShouldBeEscaped) {
    logger_.info("windows", "path C:\\Temp\\\"quoted\"\nnext line");

    const auto entry = entries().at(0);
    EXPECT_EQ(entry["message"], "path C:\\Temp\\\"quoted\"\nnext line");
}

TEST(LoggerFileTest, OutputFile_ShouldAppendEntries) {
    Testing::ScratchDir dir("hvc-logger");
    const auto path = dir.path() / "run.ndjson";

    {
        Logger logger;
        ASSERT_TRUE(logger.setOutputFile(path.string()));
        logger.info("test", "first");
        logger.info("test", "second");
        logger.flush();
    }

    const auto logged = parseLines(Testing::readFile(path));
    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[1]["message"], "second");
}

TEST(LoggerFileTest, OutputFile_ShouldFailForMissingDirectory) {
    Logger logger;
    logger.setConsoleOutput(false);
    EXPECT_FALSE(logger.setOutputFile("/nonexistent-hvc-dir/sub/run.ndjson"));
}

TEST(LoggerLevelTest, LevelNames_ShouldParseCaseInsensitively) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARN"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
}
