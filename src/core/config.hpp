/**
 * @file config.hpp
 * @brief Converter configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace lineproto_csv {

struct InputConfig {
    std::filesystem::path dir = "./input";
};

struct OutputConfig {
    std::filesystem::path dir = "./output";
    std::string extension = ".csv";
};

struct LimitsConfig {
    uint64_t max_input_bytes = 256ULL * 1024 * 1024;   ///< 0 = unlimited
};

struct ExecutorConfig {
    uint32_t thread_count = 1;          ///< 0 = hardware_concurrency
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stderr
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    bool metrics = false;
};

/**
 * @brief Top-level converter configuration.
 */
struct Config {
    InputConfig input;
    OutputConfig output;
    LimitsConfig limits;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys missing from the file keep their defaults. An unknown log level or a
 * negative size is reported as an error.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace lineproto_csv
