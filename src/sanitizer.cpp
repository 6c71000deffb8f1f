#include <set>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <iterator>
#include <algorithm>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/sanitizer.hpp"

namespace restricted_renamer {

    namespace {
        constexpr int kMaxSettlePasses = 4;

        std::string replacement_for(char c) {
            for (const auto& entry : kForbiddenCharMap) {
                if (entry.ascii == c) {
                    return encode_utf8(entry.replacement);
                }
            }
            return encode_utf8(kControlPictureBase + static_cast<unsigned char>(c));
        }

        std::string quote_char(char c) {
            if (c == '\'' || c == '\\') {
                return std::string("'\\") + c + "'";
            }
            return std::string("'") + c + "'";
        }

        std::string hex_code(char c) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(c));
            return oss.str();
        }

        std::string describe_replaced(const std::string& name) {
            std::set<unsigned char> forbidden;
            std::set<unsigned char> control;
            for (char c : name) {
                if (is_forbidden_char(c)) {
                    forbidden.insert(static_cast<unsigned char>(c));
                } else if (is_control_char(c)) {
                    control.insert(static_cast<unsigned char>(c));
                }
            }

            std::ostringstream oss;
            oss << "Replaced ";
            if (!forbidden.empty()) {
                oss << "forbidden characters [";
                bool first = true;
                for (unsigned char c : forbidden) {
                    oss << (first ? "" : ", ") << quote_char(static_cast<char>(c));
                    first = false;
                }
                oss << "]";
            }
            if (!control.empty()) {
                oss << (forbidden.empty() ? "" : ", ") << "control characters [";
                bool first = true;
                for (unsigned char c : control) {
                    oss << (first ? "" : ", ") << hex_code(static_cast<char>(c));
                    first = false;
                }
                oss << "]";
            }
            return oss.str();
        }

        std::string visible_trailing(const std::string& trailing) {
            return "'" + trailing + "'";
        }

        std::string_view first_dot_stem(std::string_view name) {
            const auto dot = name.find('.');
            return dot == std::string_view::npos ? name : name.substr(0, dot);
        }

        void append_issues(std::vector<std::string>& target, std::vector<std::string>&& issues) {
            target.insert(target.end(),
                          std::make_move_iterator(issues.begin()),
                          std::make_move_iterator(issues.end()));
        }
    }

    bool is_forbidden_char(char c) {
        return kForbiddenChars.find(c) != std::string_view::npos;
    }

    bool is_control_char(char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20;
    }

    bool is_restricted_char(char c) {
        return is_forbidden_char(c) || is_control_char(c);
    }

    const std::array<char, 32>& control_chars() {
        static const std::array<char, 32> kControlChars = [] {
            std::array<char, 32> chars {};
            for (std::size_t i = 0; i < chars.size(); ++i) {
                chars[i] = static_cast<char>(i);
            }
            return chars;
        }();
        return kControlChars;
    }

    const std::array<char, 41>& restricted_chars() {
        static const std::array<char, 41> kRestrictedChars = [] {
            std::array<char, 41> chars {};
            const auto& controls = control_chars();
            auto out = std::copy(controls.begin(), controls.end(), chars.begin());
            std::copy(kForbiddenChars.begin(), kForbiddenChars.end(), out);
            return chars;
        }();
        return kRestrictedChars;
    }

    const std::vector<std::pair<char, std::string>>& unicode_char_map() {
        static const std::vector<std::pair<char, std::string>> kUnicodeCharMap = [] {
            std::vector<std::pair<char, std::string>> map;
            for (char c : restricted_chars()) {
                map.emplace_back(c, replacement_for(c));
            }
            return map;
        }();
        return kUnicodeCharMap;
    }

    std::optional<std::string> validate_replace_char(const std::string& replace_char) {
        if (replace_char.empty()) {
            return "Replacement character must not be empty.";
        }
        if (!is_valid_utf8(replace_char)) {
            return "Replacement character is not valid UTF-8.";
        }
        if (utf8_length(replace_char) != 1) {
            return "Replacement character must be a single character.";
        }
        if (replace_char.size() == 1) {
            const char c = replace_char.front();
            if (is_restricted_char(c)) {
                return "Replacement character '" + replace_char + "' is itself a restricted character.";
            }
            if (c == '.' || c == ' ' || c == 0x7F) {
                return "Replacement character must not be a dot, a space or DEL.";
            }
        }
        return std::nullopt;
    }

    SanitizeResult replace_forbidden_chars(const std::string& name, const std::optional<std::string>& replace_char) {
        std::vector<std::string> issues;
        std::string result;
        result.reserve(name.size());

        bool replaced = false;
        for (char c : name) {
            if (!is_restricted_char(c)) {
                result.push_back(c);
                continue;
            }
            replaced = true;
            result += replace_char ? *replace_char : replacement_for(c);
        }

        if (replaced) {
            issues.push_back(describe_replaced(name));
        }
        return {result, issues};
    }

    SanitizeResult strip_trailing_dots_spaces(const std::string& name, const std::optional<std::string>& replace_char) {
        std::vector<std::string> issues;
        const auto keep = name.find_last_not_of(". ");
        const std::size_t run_start = keep == std::string::npos ? 0 : keep + 1;
        if (run_start == name.size()) {
            return {name, issues};
        }

        const std::string trailing = name.substr(run_start);
        std::string result = name.substr(0, run_start);
        for (char c : trailing) {
            if (replace_char) {
                result += *replace_char;
            } else {
                result += encode_utf8(c == '.' ? kUnicodeDotReplacement : kUnicodeSpaceReplacement);
            }
        }

        issues.push_back("Replaced trailing dot/space characters: " + visible_trailing(trailing));
        return {result, issues};
    }

    bool is_reserved_stem(std::string_view stem) {
        return std::any_of(kReservedNames.begin(), kReservedNames.end(), [&](std::string_view reserved) {
            return reserved.size() == stem.size() &&
                std::equal(reserved.begin(), reserved.end(), stem.begin(), [](char a, char b) {
                    return a == std::toupper(static_cast<unsigned char>(b));
                });
        });
    }

    SanitizeResult handle_reserved_names(const std::string& name, const std::string& prefix) {
        std::vector<std::string> issues;
        const std::string_view stem = first_dot_stem(name);
        if (!is_reserved_stem(stem)) {
            return {name, issues};
        }

        issues.push_back("Reserved Windows device name: '" + std::string(stem) + "'");
        return {prefix + name, issues};
    }

    SanitizeResult truncate_name(const std::string& name, std::size_t max_length) {
        std::vector<std::string> issues;
        const std::size_t length = utf8_length(name);
        if (length <= max_length) {
            return {name, issues};
        }

        std::string result;
        const auto dot = name.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            result = utf8_prefix(name, max_length);
        } else {
            const std::string_view view(name);
            const std::string_view stem = view.substr(0, dot);
            const std::string_view extension = view.substr(dot);
            const std::size_t extension_length = utf8_length(extension);
            if (extension_length >= max_length) {
                result = utf8_prefix(name, max_length);
            } else {
                result = utf8_prefix(stem, max_length - extension_length);
                result.append(extension);
            }
        }

        std::ostringstream oss;
        oss << "Name length " << length << " exceeds limit " << max_length
            << "; truncated " << (length - utf8_length(result)) << " characters";
        issues.push_back(oss.str());
        return {result, issues};
    }

    SanitizeResult sanitize_name(const std::string& name,
                                 const std::optional<std::string>& replace_char,
                                 std::size_t max_length) {
        std::vector<std::string> all_issues;

        auto [current, issues] = replace_forbidden_chars(name, replace_char);
        append_issues(all_issues, std::move(issues));

        // Truncation may expose a trailing dot or shorten a stem into a device
        // name, so the last three stages run until nothing changes.
        for (int pass = 0; pass < kMaxSettlePasses; ++pass) {
            const std::string before = current;

            auto trailing = strip_trailing_dots_spaces(current, replace_char);
            append_issues(all_issues, std::move(trailing.second));

            auto reserved = handle_reserved_names(trailing.first);
            append_issues(all_issues, std::move(reserved.second));

            auto truncated = truncate_name(reserved.first, max_length);
            append_issues(all_issues, std::move(truncated.second));

            current = std::move(truncated.first);
            if (current == before) {
                break;
            }
        }

        return {current, all_issues};
    }

    bool is_name_safe(const std::string& name, std::size_t max_length) {
        return sanitize_name(name, std::nullopt, max_length).first == name;
    }
}
