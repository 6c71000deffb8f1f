#include <vector>
#include <cctype>
#include <string>
#include <optional>
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include "restricted_renamer/cli.hpp"
#include "restricted_renamer/sanitizer.hpp"

namespace restricted_renamer {

    namespace {
        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " [options] <path>\n"
                << "\n"
                << "Recursively rename files and directories so their names are portable\n"
                << "across UNIX, Windows and macOS:\n"
                << "  - Forbidden characters \\ / : * ? \" < > | and control characters\n"
                << "    become Unicode look-alikes (or --replace-char)\n"
                << "  - Trailing dots and spaces are replaced\n"
                << "  - Windows device names (CON, PRN, AUX, NUL, COM0-9, LPT0-9) get a '_' prefix\n"
                << "  - Names longer than --max-length are truncated, keeping the extension\n"
                << "\n"
                << "Without --write only a dry-run plan is shown.\n"
                << "\n"
                << "Options:\n"
                << "  -h, -help, --help      Show this help message and exit\n"
                << "  --write                Perform the renames\n"
                << "  -y, --yes              Skip the confirmation prompt when --write is used\n"
                << "  --replace-char C       Replace restricted characters with C instead of Unicode look-alikes\n"
                << "  --max-length N         Maximum name length before truncation (default: " << kDefaultMaxNameLength << ")\n"
                << "  --follow-symlinks      Descend into symlinked directories\n"
                << "  --log-file PATH        JSON rename log (default: rename_log_<timestamp>.json)\n"
                << "  -v, --verbose          Show every issue found for each entry\n"
                << "\n"
                << "Exit codes: 0 success or nothing to do, 1 errors, 2 cancelled.\n";
        }

        bool parse_length(const std::string& text, std::size_t& value) {
            if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            try {
                value = static_cast<std::size_t>(std::stoull(text));
            } catch (const std::out_of_range&) {
                return false;
            }
            return value > 0;
        }

        // Accepts both "--option value" and "--option=value".
        bool take_value(const std::string& argument, const std::string& option, int argc, char* argv[],
                        int& index, std::optional<std::string>& value, CliParseResult& result) {
            if (argument == option) {
                if (index + 1 >= argc) {
                    result.valid = false;
                    result.error_message = "Missing value for " + option;
                    return true;
                }
                value = argv[++index];
                return true;
            }
            const std::string prefix = option + "=";
            if (argument.compare(0, prefix.size(), prefix) == 0) {
                value = argument.substr(prefix.size());
                return true;
            }
            return false;
        }
    }

    void print_help(const std::string& program_name) {
        append_usage(std::cout, program_name);
    }

    CliParseResult parse_cli(int argc, char* argv[]) {
        CliParseResult result;
        bool literal_mode = false;
        std::vector<std::string> positional;

        for (int index = 1; index < argc && result.valid; ++index) {
            std::string argument = argv[index];
            if (!literal_mode) {
                if (argument == "--") {
                    literal_mode = true;
                    continue;
                }
                if (argument == "-h" || argument == "--help" || argument == "-help") {
                    result.show_help = true;
                    continue;
                }
                if (argument == "--write") {
                    result.write = true;
                    continue;
                }
                if (argument == "-y" || argument == "--yes") {
                    result.assume_yes = true;
                    continue;
                }
                if (argument == "--follow-symlinks") {
                    result.follow_symlinks = true;
                    continue;
                }
                if (argument == "-v" || argument == "--verbose") {
                    result.verbose = true;
                    continue;
                }

                std::optional<std::string> value;
                if (take_value(argument, "--replace-char", argc, argv, index, value, result)) {
                    if (!result.valid) {
                        break;
                    }
                    if (auto error = validate_replace_char(*value)) {
                        result.valid = false;
                        result.error_message = *error;
                        break;
                    }
                    result.replace_char = value;
                    continue;
                }
                if (take_value(argument, "--max-length", argc, argv, index, value, result)) {
                    if (!result.valid) {
                        break;
                    }
                    if (!parse_length(*value, result.max_length)) {
                        result.valid = false;
                        result.error_message = "Invalid --max-length: " + *value;
                        break;
                    }
                    continue;
                }
                if (take_value(argument, "--log-file", argc, argv, index, value, result)) {
                    if (!result.valid) {
                        break;
                    }
                    result.log_file = value;
                    continue;
                }

                if (!argument.empty() && argument.front() == '-') {
                    result.valid = false;
                    result.error_message = "Unknown option: " + argument;
                    return result;
                }
            }
            positional.push_back(argument);
        }

        if (!result.valid) {
            return result;
        }

        if (!result.show_help) {
            if (positional.empty()) {
                result.valid = false;
                result.error_message = "Missing path argument.";
            } else if (positional.size() > 1) {
                result.valid = false;
                result.error_message = "Unexpected extra argument: " + positional[1];
            } else {
                result.path = positional.front();
            }
        } else if (!positional.empty()) {
            result.path = positional.front();
        }

        return result;
    }

    bool confirm_rename(std::size_t count, std::istream& in, std::ostream& out) {
        out << "\nRename " << count << " entries? [y/N] " << std::flush;
        std::string response;
        if (!std::getline(in, response)) {
            return false;
        }

        const auto first = response.find_first_not_of(" \t");
        const auto last = response.find_last_not_of(" \t\r");
        response = first == std::string::npos ? "" : response.substr(first, last - first + 1);
        std::transform(response.begin(), response.end(), response.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return response == "y" || response == "yes";
    }
}
