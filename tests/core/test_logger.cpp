#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "backsim/core/logger.hpp"

using namespace backsim;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reset logger first to close any existing file handles
        Logger::reset_for_tests();
        Logger::register_component("");

        // Redirect cout to capture console output
        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);

        // Reset logger BEFORE directory cleanup
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "backsim_test_logs";
};

TEST_F(LoggerTest, FileHandlesClosedAfterReset) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));

    Logger::reset_for_tests();

    std::error_code ec;
    std::filesystem::remove_all(test_log_dir, ec);
    EXPECT_FALSE(ec) << "Failed to delete directory: " << ec.message();
}

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "File message\n");
    EXPECT_EQ(files[0].filename().string().rfind("backsim_", 0), 0u);
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, MacrosRespectLevel) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.min_level = LogLevel::INFO;
    Logger::instance().initialize(config);

    int candles = 3;
    DEBUG("hidden " << candles);
    INFO("processed " << candles << " candles");

    EXPECT_EQ(cout_buffer.str(), "processed 3 candles\n");
}

TEST_F(LoggerTest, MessageFormatting) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.include_timestamp = true;
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Formatted");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[INFO]"), std::string::npos);
    EXPECT_NE(content.find("Formatted"), std::string::npos);
    EXPECT_GE(content.size(), 20u);
}

TEST_F(LoggerTest, ComponentTagIsThreadLocal) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::register_component("BacktestRunner");
    Logger::instance().log(LogLevel::INFO, "tagged");

    EXPECT_EQ(cout_buffer.str(), "[BacktestRunner] tagged\n");
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;  // 10 bytes
    config.max_files = 2;
    Logger::instance().initialize(config);

    // Each message is 9 bytes ("12345678\n")
    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");  // Triggers rotation

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;  // Rotate every message
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationSilent) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, LevelFromString) {
    EXPECT_EQ(level_from_string("DEBUG", LogLevel::INFO), LogLevel::DEBUG);
    EXPECT_EQ(level_from_string("WARNING", LogLevel::INFO), LogLevel::WARNING);
    EXPECT_EQ(level_from_string("nonsense", LogLevel::ERR), LogLevel::ERR);
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "bt_replay";
    config.max_files = 3;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "bt_replay");
    EXPECT_EQ(loaded.max_files, 3u);
}
