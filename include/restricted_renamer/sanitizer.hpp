#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restricted_renamer {
    using SanitizeResult = std::pair<std::string, std::vector<std::string>>;

    struct CharReplacement {
        char ascii;
        char32_t replacement;
    };

    constexpr std::size_t kDefaultMaxNameLength = 255;
    constexpr std::size_t kWindowsMaxPath = 260;

    constexpr std::string_view kForbiddenChars = "\\/:*?\"<>|";
    constexpr char32_t kUnicodeDotReplacement = U'\uFF0E';
    constexpr char32_t kUnicodeSpaceReplacement = U'\u2420';
    constexpr char32_t kControlPictureBase = U'\u2400';

    // Fullwidth look-alikes for the Windows-forbidden punctuation.
    constexpr std::array<CharReplacement, 9> kForbiddenCharMap = {{
        {'\\', U'\uFF3C'},
        {'/', U'\uFF0F'},
        {':', U'\uFF1A'},
        {'*', U'\uFF0A'},
        {'?', U'\uFF1F'},
        {'"', U'\uFF02'},
        {'<', U'\uFF1C'},
        {'>', U'\uFF1E'},
        {'|', U'\uFF5C'},
    }};

    constexpr std::array<std::string_view, 24> kReservedNames = {
        "CON", "PRN", "AUX", "NUL",
        "COM0", "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT0", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

    bool is_forbidden_char(char c);
    bool is_control_char(char c);
    bool is_restricted_char(char c);

    const std::array<char, 32>& control_chars();
    const std::array<char, 41>& restricted_chars();
    // Every restricted character with its UTF-8 encoded look-alike.
    const std::vector<std::pair<char, std::string>>& unicode_char_map();

    std::optional<std::string> validate_replace_char(const std::string& replace_char);

    SanitizeResult replace_forbidden_chars(const std::string& name,
                                           const std::optional<std::string>& replace_char = std::nullopt);
    SanitizeResult strip_trailing_dots_spaces(const std::string& name,
                                              const std::optional<std::string>& replace_char = std::nullopt);
    SanitizeResult handle_reserved_names(const std::string& name, const std::string& prefix = "_");
    SanitizeResult truncate_name(const std::string& name, std::size_t max_length = kDefaultMaxNameLength);

    SanitizeResult sanitize_name(const std::string& name,
                                 const std::optional<std::string>& replace_char = std::nullopt,
                                 std::size_t max_length = kDefaultMaxNameLength);
    bool is_name_safe(const std::string& name, std::size_t max_length = kDefaultMaxNameLength);

    bool is_reserved_stem(std::string_view stem);
}
