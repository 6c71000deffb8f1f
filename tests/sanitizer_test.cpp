#include <set>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/sanitizer.hpp"

namespace restricted_renamer {
    namespace {
        bool any_issue_contains(const std::vector<std::string>& issues, const std::string& needle) {
            for (const auto& issue : issues) {
                if (issue.find(needle) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }

        std::vector<std::string> tricky_names() {
            std::vector<std::string> names = {
                "",
                "normal.txt",
                ".gitignore",
                "CON",
                "con.txt",
                "CON.",
                "CONSOLE.txt",
                "COM1.log.bak",
                "file:name*.txt",
                "readme.",
                "trailing   ",
                ". . .",
                "...",
                "a .bcdefgh",
                "ab   cd",
                "LPT9 ",
                "name\twith\ncontrols",
                "\x01\x02\x1F",
                "\xC3\xA9t\xC3\xA9:\xE2\x82\xAC.md",
                std::string(300, 'x') + ".tar.gz",
                std::string(300, '.'),
                std::string(40, ' ') + "CON" + std::string(40, '.'),
            };
            names.push_back(std::string("nul\0byte", 8));
            return names;
        }
    }

    TEST(ReplaceForbiddenChars, MapsEachForbiddenCharToFullwidth) {
        EXPECT_EQ(replace_forbidden_chars("file\\name").first, "file＼name");
        EXPECT_EQ(replace_forbidden_chars("file/name").first, "file／name");
        EXPECT_EQ(replace_forbidden_chars("file:name").first, "file：name");
        EXPECT_EQ(replace_forbidden_chars("file*name").first, "file＊name");
        EXPECT_EQ(replace_forbidden_chars("file?name").first, "file？name");
        EXPECT_EQ(replace_forbidden_chars("file\"name").first, "file＂name");
        EXPECT_EQ(replace_forbidden_chars("file<name").first, "file＜name");
        EXPECT_EQ(replace_forbidden_chars("file>name").first, "file＞name");
        EXPECT_EQ(replace_forbidden_chars("file|name").first, "file｜name");
    }

    TEST(ReplaceForbiddenChars, MapsControlCharsToControlPictures) {
        auto [result, issues] = replace_forbidden_chars(std::string("file\0name", 9));
        EXPECT_EQ(result, "file␀name");
        ASSERT_EQ(issues.size(), 1u);
        EXPECT_NE(issues[0].find("0x00"), std::string::npos);

        EXPECT_EQ(replace_forbidden_chars("file\tname").first, "file␉name");
        EXPECT_EQ(replace_forbidden_chars("file\nname").first, "file␊name");
        EXPECT_EQ(replace_forbidden_chars("file\x1Fname").first, "file␟name");
    }

    TEST(ReplaceForbiddenChars, ReportsMixedCharsInOneIssue) {
        auto [result, issues] = replace_forbidden_chars("a\x01:b:");
        EXPECT_EQ(result, "a␁：b：");
        ASSERT_EQ(issues.size(), 1u);
        EXPECT_NE(issues[0].find("forbidden characters [':']"), std::string::npos);
        EXPECT_NE(issues[0].find("control characters [0x01]"), std::string::npos);
    }

    TEST(ReplaceForbiddenChars, NamesControlCharsInUppercaseHex) {
        const auto issues = replace_forbidden_chars("a\x1F\x0A\x1B").second;
        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0], "Replaced control characters [0x0A, 0x1B, 0x1F]");
    }

    TEST(ReplaceForbiddenChars, UsesReplaceCharForEveryMatch) {
        EXPECT_EQ(replace_forbidden_chars("a:b", std::string("-")).first, "a-b");
        EXPECT_EQ(replace_forbidden_chars("\\/:*?\"<>|", std::string("_")).first, "_________");
        EXPECT_EQ(replace_forbidden_chars("a\tb", std::string("\xC3\xA9")).first, "a\xC3\xA9" "b");
    }

    TEST(ReplaceForbiddenChars, LeavesSafeNamesAlone) {
        auto [result, issues] = replace_forbidden_chars("safe_file.txt");
        EXPECT_EQ(result, "safe_file.txt");
        EXPECT_TRUE(issues.empty());
    }

    TEST(StripTrailingDotsSpaces, ReplacesOnlyTheTrailingRun) {
        EXPECT_EQ(strip_trailing_dots_spaces("file.").first, "file．");
        EXPECT_EQ(strip_trailing_dots_spaces("file...").first, "file．．．");
        EXPECT_EQ(strip_trailing_dots_spaces("file ").first, "file␠");
        EXPECT_EQ(strip_trailing_dots_spaces("file. .").first, "file．␠．");
        EXPECT_EQ(strip_trailing_dots_spaces("my file.txt.").first, "my file.txt．");
    }

    TEST(StripTrailingDotsSpaces, ReplacesWholeNameWhenOnlyDotsOrSpaces) {
        EXPECT_EQ(strip_trailing_dots_spaces("...").first, "．．．");
        EXPECT_EQ(strip_trailing_dots_spaces("   ").first, "␠␠␠");
        EXPECT_EQ(strip_trailing_dots_spaces(". ", std::string("_")).first, "__");
    }

    TEST(StripTrailingDotsSpaces, UsesReplaceCharWhenGiven) {
        auto [result, issues] = strip_trailing_dots_spaces("file. ", std::string("_"));
        EXPECT_EQ(result, "file__");
        EXPECT_EQ(issues.size(), 1u);
    }

    TEST(StripTrailingDotsSpaces, KeepsLeadingAndEmbeddedDots) {
        auto [dotfile, dotfile_issues] = strip_trailing_dots_spaces(".gitignore");
        EXPECT_EQ(dotfile, ".gitignore");
        EXPECT_TRUE(dotfile_issues.empty());
        EXPECT_EQ(strip_trailing_dots_spaces("a. b.txt").first, "a. b.txt");
    }

    TEST(HandleReservedNames, PrefixesDeviceNames) {
        for (const char* name : {"CON", "PRN", "AUX", "NUL", "COM0", "COM1", "COM9", "LPT0", "LPT9"}) {
            auto [result, issues] = handle_reserved_names(name);
            EXPECT_EQ(result, std::string("_") + name);
            EXPECT_EQ(issues.size(), 1u);
        }
    }

    TEST(HandleReservedNames, MatchesStemCaseInsensitively) {
        EXPECT_EQ(handle_reserved_names("con").first, "_con");
        EXPECT_EQ(handle_reserved_names("Con").first, "_Con");
        EXPECT_EQ(handle_reserved_names("CON.log.bak").first, "_CON.log.bak");
        EXPECT_EQ(handle_reserved_names("aux.h", "#").first, "#aux.h");
    }

    TEST(HandleReservedNames, IgnoresLookAlikes) {
        for (const char* name : {"CONX", "COM10", "LPT", "CO", "xCON", "readme.md"}) {
            auto [result, issues] = handle_reserved_names(name);
            EXPECT_EQ(result, name);
            EXPECT_TRUE(issues.empty());
        }
    }

    TEST(TruncateName, KeepsExtension) {
        const std::string name = std::string(296, 'a') + ".txt";
        auto [result, issues] = truncate_name(name, 255);
        EXPECT_EQ(result.size(), 255u);
        EXPECT_EQ(result.substr(251), ".txt");
        ASSERT_EQ(issues.size(), 1u);
        EXPECT_NE(issues[0].find("truncated 45"), std::string::npos);
    }

    TEST(TruncateName, CutsNamesWithoutExtension) {
        EXPECT_EQ(truncate_name(std::string(300, 'a'), 255).first, std::string(255, 'a'));
        EXPECT_EQ(truncate_name(".bashrc_with_long_name", 7).first, ".bashrc");
    }

    TEST(TruncateName, CutsExtensionWhenItAloneExceedsLimit) {
        EXPECT_EQ(truncate_name("a.verylongextension", 5).first, "a.ver");
    }

    TEST(TruncateName, CountsCodePointsAndKeepsSequencesWhole) {
        std::string name;
        for (int i = 0; i < 300; ++i) {
            name += "\xC3\xA9";
        }
        auto [result, issues] = truncate_name(name, 255);
        EXPECT_EQ(utf8_length(result), 255u);
        EXPECT_TRUE(is_valid_utf8(result));
        EXPECT_EQ(issues.size(), 1u);
    }

    TEST(TruncateName, LeavesShortNamesAlone) {
        auto [result, issues] = truncate_name("short.txt", 255);
        EXPECT_EQ(result, "short.txt");
        EXPECT_TRUE(issues.empty());
    }

    TEST(SanitizeName, ReservedNameWithExtension) {
        auto [result, issues] = sanitize_name("CON.txt");
        EXPECT_EQ(result, "_CON.txt");
        EXPECT_TRUE(any_issue_contains(issues, "Reserved"));
        EXPECT_TRUE(any_issue_contains(issues, "CON"));
    }

    TEST(SanitizeName, TrailingDot) {
        auto [result, issues] = sanitize_name("readme.");
        EXPECT_EQ(result, "readme．");
        EXPECT_TRUE(any_issue_contains(issues, "trailing dot"));
    }

    TEST(SanitizeName, ForbiddenCharsInBothModes) {
        EXPECT_EQ(sanitize_name("file:name*.txt").first, "file：name＊.txt");
        EXPECT_EQ(sanitize_name("file:name*.txt", std::string("_")).first, "file_name_.txt");
    }

    TEST(SanitizeName, LongNameTruncatedToExactLimit) {
        const std::string name = std::string(296, 'b') + ".dat";
        auto [result, issues] = sanitize_name(name, std::nullopt, 255);
        EXPECT_EQ(utf8_length(result), 255u);
        EXPECT_EQ(result.substr(result.size() - 4), ".dat");
        EXPECT_EQ(result.substr(0, 251), std::string(251, 'b'));
    }

    TEST(SanitizeName, AccumulatesIssuesAcrossStages) {
        auto [result, issues] = sanitize_name("nul:.", std::string("_"));
        EXPECT_EQ(result, "nul__");
        EXPECT_EQ(issues.size(), 2u);
    }

    TEST(SanitizeName, TruncationNeverLeavesReservedStem) {
        auto [result, issues] = sanitize_name("CONSOLE.txt", std::nullopt, 7);
        EXPECT_EQ(result, "_CO.txt");
        EXPECT_TRUE(any_issue_contains(issues, "Reserved"));
    }

    TEST(SanitizeName, TruncationNeverLeavesTrailingSpace) {
        EXPECT_EQ(sanitize_name("ab   cd", std::nullopt, 3).first, "ab␠");
        EXPECT_EQ(sanitize_name("ab   cd", std::string("_"), 3).first, "ab_");
    }

    TEST(SanitizeName, IsIdempotent) {
        const std::vector<std::optional<std::string>> modes = {std::nullopt, std::string("_"), std::string("1")};
        for (const auto& name : tricky_names()) {
            for (const auto& mode : modes) {
                for (std::size_t max_length : {1u, 2u, 3u, 4u, 5u, 7u, 8u, 12u, 255u}) {
                    const auto once = sanitize_name(name, mode, max_length);
                    const auto twice = sanitize_name(once.first, mode, max_length);
                    EXPECT_EQ(twice.first, once.first) << "name=" << name << " max=" << max_length;
                    EXPECT_TRUE(twice.second.empty()) << "name=" << name << " max=" << max_length;
                }
            }
        }
    }

    TEST(SanitizeName, IsTotal) {
        EXPECT_EQ(sanitize_name("").first, "");

        std::string controls;
        for (char c : control_chars()) {
            controls.push_back(c);
        }
        auto [pictures, issues] = sanitize_name(controls);
        EXPECT_EQ(utf8_length(pictures), 32u);
        EXPECT_EQ(issues.size(), 1u);

        const std::string huge(1000000, 'z');
        EXPECT_EQ(sanitize_name(huge + ".bin").first, std::string(251, 'z') + ".bin");
    }

    TEST(SanitizeName, OutputIsAlwaysValidUtf8ForValidInput) {
        for (const auto& name : tricky_names()) {
            for (std::size_t max_length : {1u, 3u, 10u, 255u}) {
                EXPECT_TRUE(is_valid_utf8(sanitize_name(name, std::nullopt, max_length).first));
            }
        }
    }

    TEST(UnicodeCharMap, IsABijection) {
        const auto& map = unicode_char_map();
        ASSERT_EQ(map.size(), 41u);

        std::set<char> inputs;
        std::set<std::string> outputs;
        for (const auto& [ascii, replacement] : map) {
            inputs.insert(ascii);
            outputs.insert(replacement);
            EXPECT_TRUE(is_restricted_char(ascii));
            EXPECT_EQ(utf8_length(replacement), 1u);
            EXPECT_GT(replacement.size(), 1u);
        }
        EXPECT_EQ(inputs.size(), 41u);
        EXPECT_EQ(outputs.size(), 41u);
    }

    TEST(UnicodeCharMap, ConstantSetsHaveExpectedSizes) {
        EXPECT_EQ(kForbiddenChars.size(), 9u);
        EXPECT_EQ(control_chars().size(), 32u);
        EXPECT_EQ(restricted_chars().size(), 41u);
        EXPECT_EQ(kDefaultMaxNameLength, 255u);
        EXPECT_EQ(kWindowsMaxPath, 260u);
    }

    TEST(IsNameSafe, ReportsWhetherSanitizingChangesTheName) {
        EXPECT_TRUE(is_name_safe("normal.txt"));
        EXPECT_TRUE(is_name_safe(".gitignore"));
        EXPECT_FALSE(is_name_safe("a:b"));
        EXPECT_FALSE(is_name_safe("PRN"));
        EXPECT_FALSE(is_name_safe("end."));
        EXPECT_FALSE(is_name_safe(std::string(256, 'a')));
        EXPECT_FALSE(is_name_safe("abcdef", 3));
    }

    TEST(ValidateReplaceChar, RejectsUnusableCharacters) {
        for (const std::string bad : {"", "ab", ":", "*", "\t", ".", " ", "\xFF"}) {
            EXPECT_TRUE(validate_replace_char(bad).has_value()) << bad;
        }
        for (const std::string good : {"_", "-", "~", "\xC3\xA9", "␠"}) {
            EXPECT_FALSE(validate_replace_char(good).has_value()) << good;
        }
    }
}
