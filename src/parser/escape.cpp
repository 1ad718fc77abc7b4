/**
 * @file escape.cpp
 * @brief Escape-aware scanning primitives.
 */

#include "parser/escape.hpp"

#include <cctype>

namespace lineproto_csv {

size_t find_unescaped(std::string_view text, char delim, size_t from) noexcept {
    ScanState state = ScanState::Normal;
    for (size_t i = from; i < text.size(); ++i) {
        const char c = text[i];
        if (state == ScanState::Escaping) {
            state = ScanState::Normal;
            continue;
        }
        if (c == '\\') {
            state = ScanState::Escaping;
            continue;
        }
        if (c == delim) return i;
    }
    return std::string_view::npos;
}

bool is_escaped_at(std::string_view text, size_t pos) noexcept {
    ScanState state = ScanState::Normal;
    for (size_t i = 0; i < pos && i < text.size(); ++i) {
        if (state == ScanState::Escaping) {
            state = ScanState::Normal;
        } else if (text[i] == '\\') {
            state = ScanState::Escaping;
        }
    }
    return state == ScanState::Escaping;
}

std::vector<std::string_view> split_unescaped(std::string_view text, char delim) {
    std::vector<std::string_view> pieces;
    size_t start = 0;
    while (true) {
        const size_t pos = find_unescaped(text, delim, start);
        if (pos == std::string_view::npos) {
            pieces.push_back(text.substr(start));
            break;
        }
        pieces.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return pieces;
}

std::string unescape(std::string_view text, std::string_view escapable) {
    std::string out;
    out.reserve(text.size());

    ScanState state = ScanState::Normal;
    for (const char c : text) {
        if (state == ScanState::Escaping) {
            if (escapable.find(c) == std::string_view::npos) out += '\\';
            out += c;
            state = ScanState::Normal;
            continue;
        }
        if (c == '\\') {
            state = ScanState::Escaping;
            continue;
        }
        out += c;
    }
    if (state == ScanState::Escaping) out += '\\';
    return out;
}

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim_leading(std::string_view text) noexcept {
    size_t start = 0;
    while (start < text.size() && is_space(text[start])) ++start;
    return text.substr(start);
}

std::string_view trim(std::string_view text) noexcept {
    text = trim_leading(text);
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) --end;
    return text.substr(0, end);
}

std::string_view trim_trailing_unescaped(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.back())
           && !is_escaped_at(text, text.size() - 1)) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace lineproto_csv
