/**
 * @file types.hpp
 * @brief Fundamental types used throughout lineproto_csv.
 *
 * Defines Record, Schema and the per-document / per-batch counters shared
 * by the parser, the converter and the batch layer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lineproto_csv {

// ─────────────────────────────────────────────
// Record
// ─────────────────────────────────────────────

using TagMap = std::unordered_map<std::string, std::string>;
using FieldMap = std::unordered_map<std::string, std::string>;

/**
 * @brief One parsed line-protocol record.
 *
 * All strings are held in unescaped form. The timestamp is kept as the
 * digit text it was written with; an absent timestamp stays absent.
 */
struct Record {
    std::string measurement;
    TagMap tags;
    FieldMap fields;
    std::optional<std::string> timestamp;

    bool operator==(const Record&) const = default;
};

// ─────────────────────────────────────────────
// Schema
// ─────────────────────────────────────────────

/**
 * @brief Column layout shared by every row of one document.
 *
 * Both key lists are sorted lexicographically and free of duplicates.
 */
struct Schema {
    std::vector<std::string> tag_keys;
    std::vector<std::string> field_keys;

    /// measurement, tag keys, field keys, timestamp.
    [[nodiscard]] std::vector<std::string> header() const;

    [[nodiscard]] size_t column_count() const noexcept {
        return tag_keys.size() + field_keys.size() + 2;
    }
};

// ─────────────────────────────────────────────
// Counters
// ─────────────────────────────────────────────

struct DocumentStats {
    size_t total_lines = 0;
    size_t skipped_lines = 0;       ///< blank or comment
    size_t records = 0;
    size_t malformed_lines = 0;
    size_t dropped_fragments = 0;   ///< tag/field fragments without '='
};

enum class FileOutcome : uint8_t {
    Converted,
    NoData,
    TooLarge,
    ReadFailed,
    WriteFailed
};

[[nodiscard]] constexpr const char* to_string(FileOutcome outcome) noexcept {
    switch (outcome) {
        case FileOutcome::Converted:   return "converted";
        case FileOutcome::NoData:      return "no_data";
        case FileOutcome::TooLarge:    return "too_large";
        case FileOutcome::ReadFailed:  return "read_failed";
        case FileOutcome::WriteFailed: return "write_failed";
    }
    return "unknown";
}

struct FileReport {
    std::filesystem::path input;
    std::filesystem::path output;   ///< empty unless Converted
    FileOutcome outcome = FileOutcome::NoData;
    DocumentStats stats;
};

struct BatchSummary {
    size_t processed = 0;
    size_t skipped = 0;
    size_t ignored_entries = 0;     ///< directories, sockets, ...
    std::vector<FileReport> files;
};

}  // namespace lineproto_csv
