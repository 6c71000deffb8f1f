#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace restricted_renamer {
    std::string json_escape(const std::string& input);

    bool is_valid_utf8(std::string_view input);
    std::size_t utf8_length(std::string_view input);
    std::string utf8_prefix(std::string_view input, std::size_t code_points);
    std::string encode_utf8(char32_t code_point);

    std::string format_iso8601_utc(std::chrono::system_clock::time_point value);
    std::string format_compact_utc(std::chrono::system_clock::time_point value);
}
