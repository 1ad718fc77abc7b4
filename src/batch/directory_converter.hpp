/**
 * @file directory_converter.hpp
 * @brief Converts every line protocol file in a directory into CSV files.
 *
 * Each regular file in the input directory is read whole, converted, and
 * written to <output_dir>/<stem><extension>. Files without a single valid
 * record produce no output. Subdirectories and other non-regular entries
 * are ignored. Files are visited in file-name order.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "telemetry/metrics_collector.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace lineproto_csv {

struct BatchOptions {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::string output_extension = ".csv";
    uint64_t max_input_bytes = 0;       ///< 0 = unlimited
    uint32_t thread_count = 1;          ///< 0 = hardware_concurrency

    [[nodiscard]] static BatchOptions from_config(const Config& config);
};

/// Reads a whole file as text.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

/// Creates or truncates @p path and writes @p content verbatim.
[[nodiscard]] Result<void> write_text_file(const std::filesystem::path& path,
                                           std::string_view content);

/// <output_dir>/<input stem><extension>
[[nodiscard]] std::filesystem::path output_path_for(const std::filesystem::path& input,
                                                    const std::filesystem::path& output_dir,
                                                    std::string_view extension);

/**
 * @brief Convert one file. Failures are reported in the outcome, never thrown.
 */
[[nodiscard]] FileReport convert_file(const std::filesystem::path& input,
                                      const BatchOptions& options,
                                      Logger& logger);

/**
 * @brief Convert a whole directory.
 *
 * Fails only when the input directory is missing or unreadable, or the
 * output directory cannot be created. Per-file problems are counted as
 * skipped in the summary.
 */
[[nodiscard]] Result<BatchSummary> convert_directory(const BatchOptions& options,
                                                     Logger& logger,
                                                     MetricsCollector* metrics = nullptr);

/**
 * @brief Human-readable summary block printed after a directory run.
 *
 * The skipped total counts files only; ignored non-file entries are not
 * included.
 */
void write_summary(std::ostream& os, const BatchSummary& summary);

}  // namespace lineproto_csv
