/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>

namespace lineproto_csv {

namespace {

template <typename Node>
Result<uint64_t> read_unsigned(Node node, std::string_view key, uint64_t fallback,
                               uint64_t max = std::numeric_limits<int64_t>::max()) {
    auto value = node[key].value_or(static_cast<int64_t>(fallback));
    if (value < 0) {
        return make_error<uint64_t>("'" + std::string{key} + "' must not be negative");
    }
    if (static_cast<uint64_t>(value) > max) {
        return make_error<uint64_t>("'" + std::string{key} + "' must not exceed "
                                    + std::to_string(max));
    }
    return static_cast<uint64_t>(value);
}

constexpr uint64_t kMaxU32 = std::numeric_limits<uint32_t>::max();

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [input]
        if (auto input = tbl["input"]; input.is_table()) {
            config.input.dir = input["dir"].value_or(std::string{"./input"});
        }

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            config.output.dir = output["dir"].value_or(std::string{"./output"});
            config.output.extension = output["extension"].value_or(std::string{".csv"});
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto max_bytes = read_unsigned(limits, "max_input_bytes",
                                           config.limits.max_input_bytes);
            if (!max_bytes) return max_bytes.error();
            config.limits.max_input_bytes = *max_bytes;
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            auto threads = read_unsigned(executor, "thread_count", 1, kMaxU32);
            if (!threads) return threads.error();
            config.executor.thread_count = static_cast<uint32_t>(*threads);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});

            auto max_mb = read_unsigned(telemetry, "max_file_size_mb", 50, kMaxU32);
            if (!max_mb) return max_mb.error();
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(*max_mb);

            auto rotate = read_unsigned(telemetry, "rotate_count", 5, kMaxU32);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = static_cast<uint32_t>(*rotate);

            config.telemetry.metrics = telemetry["metrics"].value_or(false);
        }

        if (!parse_log_level(config.telemetry.log_level)) {
            return Error{"Unknown log level: " + config.telemetry.log_level};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace lineproto_csv
