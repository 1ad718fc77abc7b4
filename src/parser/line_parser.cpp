/**
 * @file line_parser.cpp
 * @brief LineParser implementation.
 */

#include "parser/line_parser.hpp"
#include "parser/escape.hpp"

#include <cctype>

namespace lineproto_csv {

namespace {

ParseError malformed_line(std::string_view reason, std::string_view line) {
    return ParseError{ParseErrorKind::MalformedLine, std::string{reason}, std::string{line}};
}

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

bool is_blank_or_comment(std::string_view line) noexcept {
    auto trimmed = trim(line);
    return trimmed.empty() || trimmed.front() == '#';
}

std::pair<std::string_view, std::optional<std::string_view>>
split_timestamp(std::string_view text) noexcept {
    size_t digits_begin = text.size();
    while (digits_begin > 0 && is_digit(text[digits_begin - 1])) --digits_begin;

    // Need at least one digit and a separating whitespace in front of it.
    if (digits_begin == text.size() || digits_begin == 0) return {text, std::nullopt};

    const size_t gap = digits_begin - 1;
    if (!is_space(text[gap]) || is_escaped_at(text, gap)) return {text, std::nullopt};

    return {trim_trailing_unescaped(text.substr(0, gap)), text.substr(digits_begin)};
}

LineParser::LineParser(Logger& logger) : logger_(logger) {}

Result<Record, ParseError> LineParser::parse(std::string_view line, size_t line_no) {
    if (is_blank_or_comment(line)) {
        return ParseError{ParseErrorKind::NotARecord, "blank or comment line", std::string{line}};
    }

    const auto trimmed = trim(line);

    const size_t separator = find_unescaped(trimmed, ' ');
    if (separator == std::string_view::npos) {
        return malformed_line("missing field separator", trimmed);
    }

    const auto head = trimmed.substr(0, separator);
    const auto tail = trim_leading(trimmed.substr(separator + 1));

    std::string_view measurement_text = head;
    std::string_view tag_text;
    if (const size_t comma = find_unescaped(head, ','); comma != std::string_view::npos) {
        measurement_text = head.substr(0, comma);
        tag_text = head.substr(comma + 1);
    }

    const auto [field_text, timestamp] = split_timestamp(tail);

    Record record;
    record.tags = parse_key_values(tag_text, line_no);
    record.fields = parse_key_values(field_text, line_no);
    record.measurement = unescape(measurement_text, kMeasurementEscapes);

    if (record.measurement.empty() || record.fields.empty()) {
        return malformed_line("missing measurement or fields", trimmed);
    }

    if (timestamp) record.timestamp = std::string{*timestamp};
    return record;
}

KeyValueMap LineParser::parse_key_values(std::string_view text, size_t line_no) {
    KeyValueMap pairs;
    for (const auto fragment : split_unescaped(text, ',')) {
        if (fragment.empty()) continue;

        const size_t eq = find_unescaped(fragment, '=');
        if (eq == std::string_view::npos) {
            report_fragment("missing '='", fragment, line_no);
            continue;
        }
        if (eq == 0) {
            report_fragment("empty key", fragment, line_no);
            continue;
        }

        pairs.insert_or_assign(unescape(fragment.substr(0, eq), kKeyValueEscapes),
                               unescape(fragment.substr(eq + 1), kKeyValueEscapes));
    }
    return pairs;
}

void LineParser::report_fragment(std::string_view reason, std::string_view fragment,
                                 size_t line_no) {
    ++dropped_fragments_;
    const auto kind = to_string(ParseErrorKind::MalformedKeyValue);
    if (line_no == 0) {
        logger_.warn("Dropping malformed key-value fragment",
                     {{"kind", kind}, {"reason", reason}, {"fragment", fragment}});
        return;
    }
    const auto line_no_text = std::to_string(line_no);
    logger_.warn("Dropping malformed key-value fragment",
                 {{"kind", kind}, {"reason", reason}, {"fragment", fragment},
                  {"line_no", line_no_text}});
}

}  // namespace lineproto_csv
