/**
 * @file types.cpp
 * @brief Schema helpers.
 */

#include "core/types.hpp"

namespace lineproto_csv {

std::vector<std::string> Schema::header() const {
    std::vector<std::string> columns;
    columns.reserve(column_count());
    columns.emplace_back("measurement");
    columns.insert(columns.end(), tag_keys.begin(), tag_keys.end());
    columns.insert(columns.end(), field_keys.begin(), field_keys.end());
    columns.emplace_back("timestamp");
    return columns;
}

}  // namespace lineproto_csv
