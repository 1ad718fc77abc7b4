/**
 * @file csv_writer.cpp
 * @brief CSV cell quoting and row assembly.
 */

#include "csv/csv_writer.hpp"

namespace lineproto_csv {

bool needs_quoting(std::string_view cell) noexcept {
    return cell.find_first_of(",\"\r\n") != std::string_view::npos;
}

std::string quote_cell(std::string_view cell) {
    if (!needs_quoting(cell)) return std::string{cell};

    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted += '"';
    for (const char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void append_row(std::string& out, const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out += ',';
        if (needs_quoting(cells[i])) {
            out += quote_cell(cells[i]);
        } else {
            out += cells[i];
        }
    }
    out += '\n';
}

}  // namespace lineproto_csv
