/**
 * @file converter.hpp
 * @brief Schema unification and CSV emission for one line protocol document.
 *
 * Conversion runs in two explicit phases. collect_records() parses every
 * line and accumulates the union of tag and field keys; emit_csv() then
 * writes the fixed header and one aligned row per record. The header has to
 * be known before the first row, so nothing is streamed.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "parser/line_parser.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lineproto_csv {

/**
 * @brief Parsed records of one document plus the columns they span.
 */
struct RecordBatch {
    std::vector<Record> records;
    Schema schema;
};

/**
 * @brief Outcome of converting one document.
 *
 * An empty @c csv is the "no data" result: nothing should be written.
 */
struct Conversion {
    std::optional<std::string> csv;
    DocumentStats stats;

    [[nodiscard]] bool has_data() const noexcept { return csv.has_value(); }
};

/// Splits on '\n'. A final terminator does not start an extra empty line.
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view document);

/**
 * @brief Phase one: parse all lines in order and unify their keys.
 *
 * Blank and comment lines are counted and skipped without a diagnostic.
 * Malformed lines are logged as warnings and skipped.
 */
[[nodiscard]] RecordBatch collect_records(std::string_view document,
                                          LineParser& parser,
                                          Logger& logger,
                                          DocumentStats& stats);

/// Phase two: header row followed by one row per record, in input order.
[[nodiscard]] std::string emit_csv(const RecordBatch& batch);

/**
 * @brief Convert a whole document. Never throws on malformed input.
 */
[[nodiscard]] Conversion convert(std::string_view document, Logger& logger);

}  // namespace lineproto_csv
