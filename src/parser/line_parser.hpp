/**
 * @file line_parser.hpp
 * @brief Line protocol tokenizer: one text line to one Record.
 *
 * Grammar accepted:
 *   line        := measurement ("," tagset)? SP fieldset (SP timestamp)?
 *   tagset      := kv ("," kv)*
 *   fieldset    := kv ("," kv)*
 *   kv          := key "=" value
 *   timestamp   := digit+
 *
 * Malformed key-value fragments are dropped with a warning and do not fail
 * the line. A line fails only when it has no field separator, no
 * measurement, or no surviving field.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace lineproto_csv {

enum class ParseErrorKind : uint8_t {
    NotARecord,         ///< blank or comment line, skipped silently
    MalformedLine,
    MalformedKeyValue
};

[[nodiscard]] constexpr std::string_view to_string(ParseErrorKind kind) noexcept {
    switch (kind) {
        case ParseErrorKind::NotARecord:        return "not_a_record";
        case ParseErrorKind::MalformedLine:     return "malformed_line";
        case ParseErrorKind::MalformedKeyValue: return "malformed_key_value";
    }
    return "unknown";
}

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::MalformedLine;
    std::string reason;
    std::string line;   ///< offending text as given

    [[nodiscard]] bool is_skip() const noexcept { return kind == ParseErrorKind::NotARecord; }
};

using KeyValueMap = std::unordered_map<std::string, std::string>;

/// True for lines that carry no record: blank or '#'-prefixed after trimming.
[[nodiscard]] bool is_blank_or_comment(std::string_view line) noexcept;

/**
 * @brief Splits "fields [timestamp]" text into the raw field set and the
 *        trailing timestamp digits, if any.
 *
 * The timestamp is the final run of digits, preceded by unescaped whitespace
 * and reaching the end of @p text.
 */
[[nodiscard]] std::pair<std::string_view, std::optional<std::string_view>>
split_timestamp(std::string_view text) noexcept;

/**
 * @brief Parses line protocol text, reporting diagnostics to a Logger.
 *
 * Holds no state between lines besides the dropped-fragment counter, so a
 * single instance serves a whole document.
 */
class LineParser {
public:
    explicit LineParser(Logger& logger);

    /**
     * @brief Parse one line.
     * @param line     Raw line text, surrounding whitespace allowed.
     * @param line_no  1-based line number for diagnostics; 0 if unknown.
     */
    [[nodiscard]] Result<Record, ParseError> parse(std::string_view line, size_t line_no = 0);

    /**
     * @brief Tokenize "k=v,k=v" text into an unescaped map.
     *
     * Empty fragments are ignored; fragments without an unescaped '=' or
     * with an empty key are dropped and logged. Later duplicates win.
     */
    [[nodiscard]] KeyValueMap parse_key_values(std::string_view text, size_t line_no = 0);

    [[nodiscard]] size_t dropped_fragments() const noexcept { return dropped_fragments_; }

private:
    void report_fragment(std::string_view reason, std::string_view fragment, size_t line_no);

    Logger& logger_;
    size_t dropped_fragments_ = 0;
};

}  // namespace lineproto_csv
