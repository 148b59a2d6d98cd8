#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <thread>
#include "stratlab/core/logger.hpp"

using namespace stratlab;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout_ = std::cout.rdbuf(captured_.rdbuf());

        log_dir_ = std::filesystem::temp_directory_path() / "stratlab_logger_test";
        std::filesystem::remove_all(log_dir_);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout_);
        Logger::register_component("");
        // Close the file handle before removing the directory
        Logger::reset_for_tests();
        std::filesystem::remove_all(log_dir_);
    }

    LoggerConfig console_config(LogLevel min_level = LogLevel::INFO) {
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = min_level;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    size_t log_file_count() const {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(log_dir_)) {
            if (entry.path().extension() == ".log") {
                ++count;
            }
        }
        return count;
    }

    std::streambuf* original_cout_{nullptr};
    std::stringstream captured_;
    std::filesystem::path log_dir_;
};

TEST_F(LoggerTest, ComponentTagPrefixesMessages) {
    auto config = console_config();
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("BacktestEngine");
    INFO("Running " << 3 << " bars");

    EXPECT_EQ(captured_.str(), "[INFO] [BacktestEngine] Running 3 bars\n");
}

TEST_F(LoggerTest, ComponentTagBelongsToItsThread) {
    Logger::instance().initialize(console_config());

    std::thread worker([] {
        Logger::register_component("BacktestRunner");
        INFO("from worker");
    });
    worker.join();
    INFO("from main");

    EXPECT_EQ(captured_.str(), "[BacktestRunner] from worker\nfrom main\n");
}

TEST_F(LoggerTest, MacroSkipsFilteredLevels) {
    Logger::instance().initialize(console_config(LogLevel::ERR));

    int formatted = 0;
    DEBUG("hidden " << ++formatted);
    WARN("hidden " << ++formatted);
    ERROR("shown");

    EXPECT_EQ(formatted, 0);
    EXPECT_EQ(captured_.str(), "shown\n");
}

TEST_F(LoggerTest, RotationKeepsAtMostMaxFiles) {
    LoggerConfig config = console_config();
    config.destination = LogDestination::FILE;
    config.log_directory = log_dir_.string();
    config.filename_prefix = "rotation";
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 5; ++i) {
        INFO("bar " << i);
    }

    EXPECT_TRUE(captured_.str().empty());
    EXPECT_EQ(log_file_count(), 2u);
}

TEST_F(LoggerTest, ConfigRoundTripsThroughJson) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "bt";
    config.max_files = 3;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "bt");
    EXPECT_EQ(loaded.max_files, 3u);
}
