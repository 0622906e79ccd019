#include <gtest/gtest.h>

#include <barrace/logger.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace barrace;

namespace
{

// Captures entries for the lifetime of a test and restores the logger after.
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.clear_sinks();
        logger.add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

}  // namespace

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    Logger::instance().set_level(LogLevel::Debug);
    BARRACE_LOG_INFO("data", "Loaded {} rows x {} series", 12, 3);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Loaded 12 rows x 3 series");
    EXPECT_EQ(entries_[0].category, "data");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, SubstitutedTextIsNotReformatted)
{
    Logger::instance().set_level(LogLevel::Debug);
    BARRACE_LOG_WARN("assets", "Path {} missing, using {}", std::string("a{}b"), "fallback");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Path a{}b missing, using fallback");
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities)
{
    Logger::instance().set_level(LogLevel::Warning);
    BARRACE_LOG_DEBUG("anim", "hidden");
    BARRACE_LOG_INFO("anim", "hidden");
    BARRACE_LOG_ERROR("export", "shown");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    Logger::instance().set_level(LogLevel::Info);
    BARRACE_LOG_INFO("cli", "{} and {}", 1);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "1 and {}");
}

TEST(LoggerLevels, ParseLevelNames)
{
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(Logger::parse_level("WARN", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(Logger::parse_level("Error", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_FALSE(Logger::parse_level("loud", level));
    EXPECT_FALSE(Logger::parse_level("trace", level));
    EXPECT_EQ(level, LogLevel::Error);
}

TEST(LoggerLevels, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Info), "INFO");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Error), "ERROR");
}

TEST(LoggerLevels, NothingIsEnabledWithoutSinks)
{
    auto&    logger = Logger::instance();
    LogLevel saved  = logger.get_level();
    logger.clear_sinks();
    logger.set_level(LogLevel::Debug);
    EXPECT_FALSE(logger.is_enabled(LogLevel::Error));
    logger.set_level(saved);
}

TEST(LoggerLines, FormatLineCarriesLevelCategoryAndMessage)
{
    Logger::LogEntry entry{std::chrono::system_clock::now(), LogLevel::Warning, "assets", "font missing"};
    std::string      line = Logger::format_line(entry);

    // "YYYY-MM-DD HH:MM:SS.mmm " prefix
    ASSERT_GT(line.size(), 24u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[19], '.');
    EXPECT_EQ(line.substr(24), "WARN [assets] font missing");
}

TEST(LoggerSinks, FileSinkAppendsLines)
{
    namespace fs  = std::filesystem;
    fs::path path = fs::temp_directory_path() / "barrace_logger_sink.log";
    fs::remove(path);

    Logger::LogSink sink = sinks::file_sink(path.string());
    sink({std::chrono::system_clock::now(), LogLevel::Info, "cli", "first"});
    sink({std::chrono::system_clock::now(), LogLevel::Error, "cli", "second"});

    std::ifstream            in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("INFO [cli] first"), std::string::npos);
    EXPECT_NE(lines[1].find("ERROR [cli] second"), std::string::npos);
    fs::remove(path);
}

TEST(LoggerSinks, FileSinkRejectsUnopenablePath)
{
    EXPECT_THROW(sinks::file_sink("/nonexistent_barrace_dir/x.log"), std::runtime_error);
}
