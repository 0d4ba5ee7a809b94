/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger front-end and the file sinks.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace lan_beacon;

namespace {

/// Captures lines in memory; shared so the test keeps access after the move.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override { ++flushes; }

    int flushes = 0;

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

}  // namespace

// ═══════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════

TEST(LoggerTest, WritesNdjsonRecord) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.info("Host online");
    ASSERT_EQ(lines->size(), 1u);

    const auto& line = lines->front();
    EXPECT_TRUE(line.starts_with(R"({"level":"info","ts":")"));
    EXPECT_TRUE(line.ends_with(R"("msg":"Host online"})"));
    EXPECT_NE(line.find("Z\""), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines->size(), 2u);
    EXPECT_FALSE(logger.enabled(LogLevel::Info));

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(lines->size(), 3u);
}

TEST(LoggerTest, EscapesMessage) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.warn("quote \" backslash \\ newline \n");
    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE(lines->front().find(R"(quote \" backslash \\ newline \n)"), std::string::npos);
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("a\tb"), "a\\tb");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_escape("plain"), "plain");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "lb_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(temp_dir_, "lanbeacon");
        sink.write(R"({"n":1})");
        sink.write(R"({"n":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), temp_dir_ / "lanbeacon.ndjson");
    }
    EXPECT_EQ(count_lines(temp_dir_ / "lanbeacon.ndjson"), 2u);

    {
        JsonFileSink reopened(temp_dir_, "lanbeacon");
        reopened.write(R"({"n":3})");
    }
    EXPECT_EQ(count_lines(temp_dir_ / "lanbeacon.ndjson"), 3u);
}

TEST_F(JsonFileSinkTest, RotatesAndCapsFileCount) {
    JsonFileSink sink(temp_dir_, "events", 1, 2);
    sink.set_max_file_size_bytes(20);

    // Each line is 16 bytes with its newline, so every write rotates
    for (int i = 0; i < 5; ++i) {
        sink.write(R"({"event":"x12"})");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
    EXPECT_EQ(count_lines(sink.current_path()), 1u);
}
