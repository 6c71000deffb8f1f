#include <ctime>
#include <iomanip>
#include <sstream>
#include "restricted_renamer/utils.hpp"

namespace restricted_renamer {

    namespace {
        std::tm to_utc(std::chrono::system_clock::time_point value) {
            const std::time_t seconds = std::chrono::system_clock::to_time_t(value);
            std::tm tm_snapshot {};
            gmtime_r(&seconds, &tm_snapshot);
            return tm_snapshot;
        }

        std::size_t sequence_length(unsigned char lead) {
            if (lead < 0x80) return 1;
            if ((lead & 0xE0) == 0xC0) return 2;
            if ((lead & 0xF0) == 0xE0) return 3;
            if ((lead & 0xF8) == 0xF0) return 4;
            return 0;
        }
    }

    std::string json_escape(const std::string& input) {
        std::ostringstream oss;
        for (unsigned char c : input) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        oss << "\\u"
                            << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c)
                            << std::dec << std::nouppercase;
                    } else {
                        // UTF-8 multi-byte sequences are valid JSON as-is.
                        oss << static_cast<char>(c);
                    }
            }
        }
        return oss.str();
    }

    bool is_valid_utf8(std::string_view input) {
        std::size_t index = 0;
        while (index < input.size()) {
            const auto lead = static_cast<unsigned char>(input[index]);
            const std::size_t length = sequence_length(lead);
            if (length == 0 || index + length > input.size()) {
                return false;
            }

            char32_t code_point = length == 1 ? lead : lead & (0xFF >> (length + 1));
            for (std::size_t offset = 1; offset < length; ++offset) {
                const auto next = static_cast<unsigned char>(input[index + offset]);
                if ((next & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }

            const bool overlong = (length == 2 && code_point < 0x80) ||
                (length == 3 && code_point < 0x800) ||
                (length == 4 && code_point < 0x10000);
            if (overlong || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            index += length;
        }
        return true;
    }

    std::size_t utf8_length(std::string_view input) {
        std::size_t count = 0;
        for (unsigned char c : input) {
            if ((c & 0xC0) != 0x80) {
                ++count;
            }
        }
        return count;
    }

    std::string utf8_prefix(std::string_view input, std::size_t code_points) {
        std::size_t seen = 0;
        for (std::size_t index = 0; index < input.size(); ++index) {
            const auto c = static_cast<unsigned char>(input[index]);
            if ((c & 0xC0) != 0x80) {
                if (seen == code_points) {
                    return std::string(input.substr(0, index));
                }
                ++seen;
            }
        }
        return std::string(input);
    }

    std::string encode_utf8(char32_t code_point) {
        std::string out;
        if (code_point < 0x80) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
        return out;
    }

    std::string format_iso8601_utc(std::chrono::system_clock::time_point value) {
        const std::tm tm_snapshot = to_utc(value);
        std::ostringstream oss;
        oss << std::put_time(&tm_snapshot, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string format_compact_utc(std::chrono::system_clock::time_point value) {
        const std::tm tm_snapshot = to_utc(value);
        std::ostringstream oss;
        oss << std::put_time(&tm_snapshot, "%Y%m%d_%H%M%S");
        return oss.str();
    }
}
