/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace wires;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                  / ("wires_test_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.repository.dir_name, ".wires");
    EXPECT_EQ(config.repository.db_name, "wires.db");
    EXPECT_EQ(config.store.busy_timeout_ms, 5000u);
    EXPECT_EQ(config.store.journal_mode, "WAL");
    EXPECT_EQ(config.ids.max_attempts, 8u);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_TRUE(config.logging.file.empty());
    EXPECT_EQ(config.output.format, "auto");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [repository]
        dir_name = ".tasks"
        db_name = "tasks.db"

        [store]
        busy_timeout_ms = 250
        journal_mode = "DELETE"
        synchronous = "FULL"

        [ids]
        max_attempts = 3

        [logging]
        level = "debug"
        file = "logs/wires.ndjson"
        max_file_size_kb = 64
        rotate_count = 5

        [output]
        format = "json"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.repository.dir_name, ".tasks");
    EXPECT_EQ(config.repository.db_name, "tasks.db");
    EXPECT_EQ(config.store.busy_timeout_ms, 250u);
    EXPECT_EQ(config.store.journal_mode, "DELETE");
    EXPECT_EQ(config.store.synchronous, "FULL");
    EXPECT_EQ(config.ids.max_attempts, 3u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, std::filesystem::path{"logs/wires.ndjson"});
    EXPECT_EQ(config.logging.max_file_size_kb, 64u);
    EXPECT_EQ(config.logging.rotate_count, 5u);
    EXPECT_EQ(config.output.format, "json");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [ids]
        max_attempts = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->ids.max_attempts, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->repository.dir_name, ".wires");
    EXPECT_EQ(result->store.journal_mode, "WAL");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, RejectsUnknownJournalMode) {
    auto path = write_toml(R"(
        [store]
        journal_mode = "MEMORY"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, RejectsZeroIdAttempts) {
    auto path = write_toml(R"(
        [ids]
        max_attempts = 0
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    auto path = write_toml(R"(
        [logging]
        level = "chatty"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, RejectsUnknownOutputFormat) {
    auto path = write_toml(R"(
        [output]
        format = "yaml"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, RejectsNegativeIdAttempts) {
    auto path = write_toml(R"(
        [ids]
        max_attempts = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_NE(result.error().message.find("ids.max_attempts"), std::string::npos);
}

TEST_F(ConfigTest, RejectsBusyTimeoutBeyondInt32) {
    auto path = write_toml(R"(
        [store]
        busy_timeout_ms = 4294967296
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, RejectsNonIntegerLogSize) {
    auto path = write_toml(R"(
        [logging]
        max_file_size_kb = "big"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, IntegerBounds) {
    auto path = write_toml(R"(
        [store]
        busy_timeout_ms = 0

        [ids]
        max_attempts = 2147483647

        [logging]
        rotate_count = 0
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->store.busy_timeout_ms, 0u);
    EXPECT_EQ(result->ids.max_attempts, 2147483647u);
    EXPECT_EQ(result->logging.rotate_count, 0u);
}
