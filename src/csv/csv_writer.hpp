/**
 * @file csv_writer.hpp
 * @brief Minimal-quoting CSV serialization.
 *
 * Cells holding a comma, double quote, CR or LF are wrapped in double quotes
 * with inner quotes doubled; every other cell is written verbatim. Rows end
 * with a single '\n'.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lineproto_csv {

[[nodiscard]] bool needs_quoting(std::string_view cell) noexcept;

[[nodiscard]] std::string quote_cell(std::string_view cell);

/// Appends @p cells joined by ',' and terminated by '\n' to @p out.
void append_row(std::string& out, const std::vector<std::string>& cells);

}  // namespace lineproto_csv
