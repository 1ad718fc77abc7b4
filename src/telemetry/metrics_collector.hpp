/**
 * @file metrics_collector.hpp
 * @brief Structured conversion events for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace lineproto_csv {

/**
 * @brief Collects and writes conversion events as NDJSON.
 *
 * Safe to share between batch workers.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_document(const FileReport& report);
    void record_batch(const BatchSummary& summary, std::chrono::milliseconds elapsed);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace lineproto_csv
