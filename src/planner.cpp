#include <map>
#include <sstream>
#include <stdexcept>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/planner.hpp"
#include "restricted_renamer/scanner.hpp"

namespace restricted_renamer {

    namespace {
        using Path = std::filesystem::path;

        constexpr const char* kSymlinkIssue = "Symbolic link: the link itself is renamed, its target is untouched";

        struct DirectoryGroup {
            Path directory;
            std::vector<const ScannedEntry*> children;
        };

        std::vector<DirectoryGroup> group_by_parent(const std::vector<ScannedEntry>& entries) {
            std::vector<DirectoryGroup> groups;
            std::map<Path, std::size_t> index_by_parent;
            for (const auto& entry : entries) {
                const Path parent = entry.path.parent_path();
                auto [it, inserted] = index_by_parent.emplace(parent, groups.size());
                if (inserted) {
                    groups.push_back(DirectoryGroup{parent, {}});
                }
                groups[it->second].children.push_back(&entry);
            }
            return groups;
        }

        void check_path_length(const Path& path, std::vector<std::string>& warnings) {
            const std::size_t length = utf8_length(path.native());
            if (length > kWindowsMaxPath) {
                std::ostringstream oss;
                oss << "Path length " << length << " exceeds Windows MAX_PATH (" << kWindowsMaxPath << "): " << path.string();
                warnings.push_back(oss.str());
            }
        }

        void validate_options(std::size_t max_length, const std::optional<std::string>& replace_char) {
            if (max_length == 0) {
                throw std::invalid_argument("Maximum name length must be at least 1.");
            }
            if (replace_char) {
                if (auto error = validate_replace_char(*replace_char)) {
                    throw std::invalid_argument(*error);
                }
            }
        }

        void plan_directory(const DirectoryGroup& group,
                            std::size_t max_length,
                            const std::optional<std::string>& replace_char,
                            RenamePlan& plan) {
            std::set<std::string> taken;
            for (const ScannedEntry* entry : group.children) {
                taken.insert(entry->path.filename().string());
            }

            for (const ScannedEntry* entry : group.children) {
                const std::string name = entry->path.filename().string();
                auto [desired, issues] = sanitize_name(name, replace_char, max_length);
                if (desired == name) {
                    check_path_length(entry->path, plan.warnings);
                    continue;
                }

                const std::string final_name = find_available_name(desired, taken, max_length);
                taken.insert(final_name);
                if (final_name != desired) {
                    issues.push_back("Name collision resolved: appended suffix to get '" + final_name + "'");
                }
                if (entry->kind == EntryKind::Symlink) {
                    issues.push_back(kSymlinkIssue);
                }

                RenameAction action;
                action.source = entry->path;
                action.destination = group.directory / final_name;
                action.kind = entry->kind;
                action.original_name = name;
                action.final_name = final_name;
                action.issues = std::move(issues);
                action.depth = entry->depth;

                check_path_length(action.destination, plan.warnings);
                plan.actions.push_back(std::move(action));
            }
        }
    }

    std::string find_available_name(const std::string& desired, const std::set<std::string>& taken, std::size_t max_length) {
        if (taken.count(desired) == 0) {
            return desired;
        }

        std::string stem = desired;
        std::string extension;
        const auto dot = desired.rfind('.');
        if (dot != std::string::npos && dot > 0) {
            stem = desired.substr(0, dot);
            extension = desired.substr(dot);
        }

        const std::size_t stem_length = utf8_length(stem);
        const std::size_t extension_length = utf8_length(extension);
        for (std::size_t counter = 1; counter <= taken.size() + 1; ++counter) {
            const std::string suffix = "_" + std::to_string(counter);

            std::string candidate;
            if (extension_length + suffix.size() + 1 > max_length) {
                // No room to keep the extension; shorten the whole name instead.
                if (suffix.size() >= max_length) {
                    break;
                }
                candidate = utf8_prefix(desired, max_length - suffix.size()) + suffix;
            } else if (stem_length + suffix.size() + extension_length > max_length) {
                candidate = utf8_prefix(stem, max_length - extension_length - suffix.size()) + suffix + extension;
            } else {
                candidate = stem + suffix + extension;
            }

            if (taken.count(candidate) == 0) {
                return candidate;
            }
        }

        throw std::logic_error("Unable to resolve name collision for '" + desired + "'");
    }

    RenamePlan build_plan(const Path& root,
                          const std::vector<ScannedEntry>& entries,
                          std::size_t max_length,
                          const std::optional<std::string>& replace_char) {
        validate_options(max_length, replace_char);

        RenamePlan plan;
        plan.root = root;
        plan.total_entries_scanned = entries.size();

        for (const auto& group : group_by_parent(entries)) {
            plan_directory(group, max_length, replace_char, plan);
        }

        plan.total_renames_needed = plan.actions.size();
        return plan;
    }

    RenamePlan build_rename_plan(const Path& root,
                                 std::size_t max_length,
                                 bool follow_symlinks,
                                 const std::optional<std::string>& replace_char) {
        validate_options(max_length, replace_char);

        ScanResult scan = scan_directory(root, follow_symlinks);
        RenamePlan plan = build_plan(scan.root, scan.entries, max_length, replace_char);

        plan.warnings.insert(plan.warnings.begin(), scan.warnings.begin(), scan.warnings.end());
        plan.skipped_symlinks = std::move(scan.skipped_symlinks);
        return plan;
    }
}
