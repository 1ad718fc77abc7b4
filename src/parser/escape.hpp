/**
 * @file escape.hpp
 * @brief Backslash-escape aware scanning primitives for line protocol.
 *
 * Every scan runs the same two-state machine: a backslash in the Normal
 * state switches to Escaping, and the next character (whatever it is) is
 * consumed literally and returns the machine to Normal. A delimiter counts
 * only when it is seen in the Normal state, so "\\," ends in an unescaped
 * comma while "\," does not.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lineproto_csv {

enum class ScanState : uint8_t {
    Normal,
    Escaping
};

/// Characters unescaped in a measurement name.
inline constexpr std::string_view kMeasurementEscapes = ", ";
/// Characters unescaped in tag/field keys and values.
inline constexpr std::string_view kKeyValueEscapes = ",= ";

/**
 * @brief Position of the first @p delim at or after @p from that is not
 *        escaped, or std::string_view::npos.
 *
 * @p from must be a position the machine reaches in the Normal state
 * (0, or one past a previously found delimiter).
 */
[[nodiscard]] size_t find_unescaped(std::string_view text, char delim, size_t from = 0) noexcept;

/// True when the character at @p pos is consumed in the Escaping state.
[[nodiscard]] bool is_escaped_at(std::string_view text, size_t pos) noexcept;

/// Splits on unescaped @p delim. Empty pieces are kept; views alias @p text.
[[nodiscard]] std::vector<std::string_view> split_unescaped(std::string_view text, char delim);

/**
 * @brief Resolves "\c" to "c" for every c in @p escapable.
 *
 * Any other escape pair, "\\" included, is copied through unchanged, and so
 * is a dangling trailing backslash. Applying it to its own output is a no-op.
 */
[[nodiscard]] std::string unescape(std::string_view text, std::string_view escapable);

[[nodiscard]] bool is_space(char c) noexcept;

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::string_view trim_leading(std::string_view text) noexcept;

/// Trims trailing whitespace but stops at an escaped space.
[[nodiscard]] std::string_view trim_trailing_unescaped(std::string_view text) noexcept;

}  // namespace lineproto_csv
