/**
 * @file directory_converter.cpp
 * @brief Directory walking and file I/O around the document converter.
 */

#include "batch/directory_converter.hpp"
#include "convert/converter.hpp"
#include "executor/thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iterator>
#include <system_error>
#include <vector>

namespace lineproto_csv {

namespace fs = std::filesystem;

BatchOptions BatchOptions::from_config(const Config& config) {
    BatchOptions options;
    options.input_dir = config.input.dir;
    options.output_dir = config.output.dir;
    options.output_extension = config.output.extension;
    options.max_input_bytes = config.limits.max_input_bytes;
    options.thread_count = config.executor.thread_count;
    return options;
}

Result<std::string> read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error<std::string>("Failed to open file: " + path.string());
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return make_error<std::string>("Failed to read file: " + path.string());
    }
    return content;
}

Result<void> write_text_file(const fs::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return make_error<void>("Failed to open output file: " + path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return make_error<void>("Failed to write output file: " + path.string());
    }
    return {};
}

fs::path output_path_for(const fs::path& input, const fs::path& output_dir,
                         std::string_view extension) {
    return output_dir / (input.stem().string() + std::string{extension});
}

FileReport convert_file(const fs::path& input, const BatchOptions& options, Logger& logger) {
    FileReport report;
    report.input = input;
    const auto name = input.filename().string();

    logger.info("Processing file", {{"file", name}});

    if (options.max_input_bytes != 0) {
        std::error_code ec;
        const auto size = fs::file_size(input, ec);
        if (!ec && size > options.max_input_bytes) {
            report.outcome = FileOutcome::TooLarge;
            logger.error("Skipping file above size limit",
                         {{"file", name}, {"bytes", std::to_string(size)},
                          {"limit", std::to_string(options.max_input_bytes)}});
            return report;
        }
    }

    auto content = read_text_file(input);
    if (!content) {
        report.outcome = FileOutcome::ReadFailed;
        logger.error("Error processing file", {{"file", name}, {"error", content.error().message}});
        return report;
    }

    auto conversion = convert(*content, logger);
    report.stats = conversion.stats;
    if (!conversion.has_data()) {
        report.outcome = FileOutcome::NoData;
        logger.info("No valid line protocol data found", {{"file", name}});
        return report;
    }

    const auto target = output_path_for(input, options.output_dir, options.output_extension);
    auto written = write_text_file(target, *conversion.csv);
    if (!written) {
        report.outcome = FileOutcome::WriteFailed;
        logger.error("Error processing file", {{"file", name}, {"error", written.error().message}});
        return report;
    }

    report.outcome = FileOutcome::Converted;
    report.output = target;
    logger.info("Converted file",
                {{"file", name}, {"output", target.filename().string()},
                 {"records", std::to_string(report.stats.records)}});
    return report;
}

Result<BatchSummary> convert_directory(const BatchOptions& options,
                                       Logger& logger,
                                       MetricsCollector* metrics) {
    const auto started = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_directory(options.input_dir, ec)) {
        return make_error<BatchSummary>("Input directory not found: " + options.input_dir.string());
    }

    fs::create_directories(options.output_dir, ec);
    if (ec) {
        return make_error<BatchSummary>("Cannot create output directory "
                                        + options.output_dir.string() + ": " + ec.message());
    }
    logger.info("Output directory ready", {{"dir", options.output_dir.string()}});

    BatchSummary summary;
    std::vector<fs::path> files;
    std::vector<fs::directory_entry> entries;
    try {
        for (const auto& entry : fs::directory_iterator(options.input_dir)) {
            entries.push_back(entry);
        }
    } catch (const fs::filesystem_error& err) {
        return make_error<BatchSummary>("Error listing files in "
                                        + options.input_dir.string() + ": " + err.what());
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    logger.info("Found entries in input directory",
                {{"dir", options.input_dir.string()}, {"entries", std::to_string(entries.size())}});

    for (const auto& entry : entries) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        } else {
            ++summary.ignored_entries;
            logger.info("Skipping non-file entry", {{"entry", entry.path().filename().string()}});
        }
    }

    if (options.thread_count == 1 || files.size() < 2) {
        for (const auto& file : files) {
            summary.files.push_back(convert_file(file, options, logger));
        }
    } else {
        ThreadPool pool(options.thread_count);
        std::vector<std::future<FileReport>> pending;
        pending.reserve(files.size());
        for (const auto& file : files) {
            pending.push_back(pool.submit([&options, &logger, file] {
                return convert_file(file, options, logger);
            }));
        }
        for (auto& report : pending) {
            summary.files.push_back(report.get());
        }
    }

    for (const auto& report : summary.files) {
        if (report.outcome == FileOutcome::Converted) {
            ++summary.processed;
        } else {
            ++summary.skipped;
        }
        if (metrics) metrics->record_document(report);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (metrics) {
        metrics->record_batch(summary, elapsed);
        metrics->flush();
    }

    logger.info("Conversion summary",
                {{"processed", std::to_string(summary.processed)},
                 {"skipped", std::to_string(summary.skipped)},
                 {"ignored_entries", std::to_string(summary.ignored_entries)}});
    return summary;
}

void write_summary(std::ostream& os, const BatchSummary& summary) {
    os << "\n--- Conversion Summary ---\n"
       << "Total files processed: " << summary.processed << "\n"
       << "Total files/entries skipped: " << summary.skipped << "\n"
       << "------------------------\n";
}

}  // namespace lineproto_csv
