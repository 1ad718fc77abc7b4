/**
 * @file converter.cpp
 * @brief Two-phase document conversion.
 */

#include "convert/converter.hpp"
#include "csv/csv_writer.hpp"

#include <set>

namespace lineproto_csv {

namespace {

template <typename Map>
const std::string& lookup_or_empty(const Map& map, const std::string& key) {
    static const std::string kEmpty;
    auto it = map.find(key);
    return it == map.end() ? kEmpty : it->second;
}

}  // namespace

std::vector<std::string_view> split_lines(std::string_view document) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < document.size()) {
        const size_t newline = document.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.push_back(document.substr(start));
            break;
        }
        lines.push_back(document.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

RecordBatch collect_records(std::string_view document,
                            LineParser& parser,
                            Logger& logger,
                            DocumentStats& stats) {
    RecordBatch batch;
    std::set<std::string> tag_keys;
    std::set<std::string> field_keys;
    const size_t dropped_before = parser.dropped_fragments();

    const auto lines = split_lines(document);
    stats.total_lines += lines.size();

    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t line_no = i + 1;
        auto parsed = parser.parse(lines[i], line_no);
        if (!parsed) {
            const auto& err = parsed.error();
            if (err.is_skip()) {
                ++stats.skipped_lines;
                continue;
            }
            ++stats.malformed_lines;
            const auto line_no_text = std::to_string(line_no);
            logger.warn("Skipping malformed line",
                        {{"kind", to_string(err.kind)}, {"reason", err.reason},
                         {"line_no", line_no_text}, {"line", err.line}});
            continue;
        }

        for (const auto& [key, value] : parsed->tags) tag_keys.insert(key);
        for (const auto& [key, value] : parsed->fields) field_keys.insert(key);
        batch.records.push_back(std::move(parsed).value());
    }

    batch.schema.tag_keys.assign(tag_keys.begin(), tag_keys.end());
    batch.schema.field_keys.assign(field_keys.begin(), field_keys.end());
    stats.records += batch.records.size();
    stats.dropped_fragments += parser.dropped_fragments() - dropped_before;
    return batch;
}

std::string emit_csv(const RecordBatch& batch) {
    const auto& schema = batch.schema;
    std::string out;
    append_row(out, schema.header());

    std::vector<std::string> row;
    row.reserve(schema.column_count());
    for (const auto& record : batch.records) {
        row.clear();
        row.push_back(record.measurement);
        for (const auto& key : schema.tag_keys) row.push_back(lookup_or_empty(record.tags, key));
        for (const auto& key : schema.field_keys) row.push_back(lookup_or_empty(record.fields, key));
        row.push_back(record.timestamp.value_or(std::string{}));
        append_row(out, row);
    }
    return out;
}

Conversion convert(std::string_view document, Logger& logger) {
    Conversion conversion;
    LineParser parser(logger);

    auto batch = collect_records(document, parser, logger, conversion.stats);
    if (batch.records.empty()) {
        logger.debug("Document holds no valid records",
                     {{"lines", std::to_string(conversion.stats.total_lines)}});
        return conversion;
    }

    conversion.csv = emit_csv(batch);
    return conversion;
}

}  // namespace lineproto_csv
