/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace lineproto_csv;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "lpcsv_test_config";
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
    EXPECT_EQ(config.input.dir.string(), "./input");
    EXPECT_EQ(config.output.dir.string(), "./output");
    EXPECT_EQ(config.output.extension, ".csv");
    EXPECT_EQ(config.executor.thread_count, 1u);
    EXPECT_EQ(config.limits.max_input_bytes, 256ULL * 1024 * 1024);
    EXPECT_TRUE(config.telemetry.log_dir.empty());
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_FALSE(config.telemetry.metrics);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [input]
        dir = "/data/lp"

        [output]
        dir = "/data/csv"
        extension = ".tsv.csv"

        [limits]
        max_input_bytes = 1024

        [executor]
        thread_count = 4

        [telemetry]
        log_dir = "/tmp/lpcsv_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 3
        metrics = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.input.dir.string(), "/data/lp");
    EXPECT_EQ(config.output.dir.string(), "/data/csv");
    EXPECT_EQ(config.output.extension, ".tsv.csv");
    EXPECT_EQ(config.limits.max_input_bytes, 1024u);
    EXPECT_EQ(config.executor.thread_count, 4u);
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/lpcsv_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_TRUE(config.telemetry.metrics);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [output]
        dir = "converted"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->output.dir.string(), "converted");
    // Defaults for everything else
    EXPECT_EQ(result->output.extension, ".csv");
    EXPECT_EQ(result->input.dir.string(), "./input");
    EXPECT_EQ(result->executor.thread_count, 1u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("TOML parse error"), std::string::npos);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml(R"(
        [telemetry]
        log_level = "verbose"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NegativeLimitRejected) {
    auto path = write_toml(R"(
        [limits]
        max_input_bytes = -1
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NegativeRotateCountRejected) {
    auto path = write_toml(R"(
        [telemetry]
        rotate_count = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("rotate_count"), std::string::npos);
}

TEST_F(ConfigTest, NegativeFileSizeRejected) {
    auto path = write_toml(R"(
        [telemetry]
        max_file_size_mb = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("max_file_size_mb"), std::string::npos);
}

TEST_F(ConfigTest, ThreadCountAboveUint32Rejected) {
    auto path = write_toml(R"(
        [executor]
        thread_count = 4294967296
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("thread_count"), std::string::npos);
}

TEST_F(ConfigTest, Uint32BoundaryAccepted) {
    auto path = write_toml(R"(
        [telemetry]
        rotate_count = 4294967295
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->telemetry.rotate_count, 4294967295u);
}
