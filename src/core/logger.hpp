/**
 * @file logger.hpp
 * @brief Structured NDJSON logging with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end. Every log call becomes
 * one JSON object per line; diagnostics attach key/value context such as the
 * offending line and its number.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lineproto_csv {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Accepts "debug", "info", "warn"/"warning", "error" (case-sensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escapes a string for inclusion between JSON double quotes.
[[nodiscard]] std::string json_escape(std::string_view text);

/// One structured key/value pair attached to a log line.
struct LogField {
    std::string_view key;
    std::string_view value;
};

using LogFields = std::initializer_list<LogField>;

// ─────────────────────────────────────────────
// ILogSink (virtual, chosen at runtime)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 *
 * Implementations need not be thread-safe; Logger serializes calls.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Shared by every conversion running in a batch, so writes to the sink are
 * serialized under a mutex.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, LogFields fields = {});
    void info(std::string_view message, LogFields fields = {});
    void warn(std::string_view message, LogFields fields = {});
    void error(std::string_view message, LogFields fields = {});

    void log(LogLevel level, std::string_view message, LogFields fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex mutex_;
};

}  // namespace lineproto_csv
