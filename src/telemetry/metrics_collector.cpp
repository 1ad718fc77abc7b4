/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace lineproto_csv {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_document(const FileReport& report) {
    const auto& stats = report.stats;
    std::ostringstream oss;
    oss << R"({"event":"document_converted")"
        << R"(,"input":")" << json_escape(report.input.string()) << "\""
        << R"(,"output":")" << json_escape(report.output.string()) << "\""
        << R"(,"outcome":")" << to_string(report.outcome) << "\""
        << R"(,"lines":)" << stats.total_lines
        << R"(,"skipped_lines":)" << stats.skipped_lines
        << R"(,"records":)" << stats.records
        << R"(,"malformed_lines":)" << stats.malformed_lines
        << R"(,"dropped_fragments":)" << stats.dropped_fragments
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_batch(const BatchSummary& summary,
                                    std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"batch_summary")"
        << R"(,"processed":)" << summary.processed
        << R"(,"skipped":)" << summary.skipped
        << R"(,"ignored_entries":)" << summary.ignored_entries
        << R"(,"elapsed_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace lineproto_csv
