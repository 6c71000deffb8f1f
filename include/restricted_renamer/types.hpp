#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace restricted_renamer {
    enum class EntryKind {
        File,
        Directory,
        Symlink
    };

    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        bool write = false;
        bool assume_yes = false;
        bool follow_symlinks = false;
        bool verbose = false;
        std::size_t max_length = 255;
        std::optional<std::string> replace_char;
        std::optional<std::string> path;
        std::optional<std::string> log_file;
        std::string error_message;
    };

    struct ScannedEntry {
        std::filesystem::path path;
        EntryKind kind = EntryKind::File;
        std::size_t depth = 0;
    };

    struct ScanResult {
        std::filesystem::path root;
        std::vector<ScannedEntry> entries;
        std::vector<std::filesystem::path> skipped_symlinks;
        std::vector<std::string> warnings;
    };

    struct RenameAction {
        std::filesystem::path source;
        std::filesystem::path destination;
        EntryKind kind = EntryKind::File;
        std::string original_name;
        std::string final_name;
        std::vector<std::string> issues;
        std::size_t depth = 0;
    };

    struct RenamePlan {
        std::filesystem::path root;
        std::vector<RenameAction> actions;
        std::vector<std::string> warnings;
        std::vector<std::filesystem::path> skipped_symlinks;
        std::size_t total_entries_scanned = 0;
        std::size_t total_renames_needed = 0;

        bool has_changes() const {
            return total_renames_needed > 0;
        }
    };

    struct RenameResult {
        RenameAction action;
        bool success = false;
        std::optional<std::string> error_message;
    };

    struct ExecutionReport {
        std::vector<RenameResult> results;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::string> log_error;

        bool all_succeeded() const {
            for (const auto& result : results) {
                if (!result.success) {
                    return false;
                }
            }
            return !log_error;
        }
    };
}
