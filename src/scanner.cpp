#include <set>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/scanner.hpp"

namespace restricted_renamer {

    namespace {
        using Path = std::filesystem::path;

        class TreeWalker {
        public:
            TreeWalker(ScanResult& result, bool follow_symlinks)
                : result_(result), follow_symlinks_(follow_symlinks) {
                visited_.insert(result_.root);
            }

            void walk(const Path& directory, std::size_t depth) {
                for (const auto& child : list_children(directory)) {
                    visit(child, depth);
                }
            }

        private:
            std::vector<Path> list_children(const Path& directory) {
                std::vector<Path> children;

                std::error_code iterator_error;
                std::filesystem::directory_iterator it(directory, iterator_error);
                std::filesystem::directory_iterator end;
                if (iterator_error) {
                    result_.warnings.push_back("Unable to read directory " + directory.string() + ": " + iterator_error.message());
                    return children;
                }

                while (it != end) {
                    children.push_back(it->path());
                    it.increment(iterator_error);
                    if (iterator_error) {
                        result_.warnings.push_back("Directory traversal warning in " + directory.string() + ": " + iterator_error.message());
                        break;
                    }
                }

                std::sort(children.begin(), children.end(), [](const Path& a, const Path& b) {
                    return a.filename().native() < b.filename().native();
                });
                return children;
            }

            void emit(const Path& path, EntryKind kind, std::size_t depth) {
                if (!is_valid_utf8(path.filename().native())) {
                    result_.warnings.push_back("Skipping entry whose name is not valid UTF-8: " + path.string());
                    return;
                }
                result_.entries.push_back(ScannedEntry{path, kind, depth});
            }

            void descend(const Path& path, const Path& canonical, std::size_t depth) {
                if (!visited_.insert(canonical).second) {
                    result_.warnings.push_back("Symlink cycle detected: " + path.string() + " -> " + canonical.string());
                    return;
                }
                walk(path, depth + 1);
            }

            static bool leads_to_ancestor(const Path& link, const Path& target) {
                std::error_code parent_error;
                const Path parent = std::filesystem::canonical(link.parent_path(), parent_error);
                return !parent_error && is_path_within(parent, target);
            }

            void visit_followed_link(const Path& path, std::size_t depth) {
                std::error_code status_error;
                const auto target_status = std::filesystem::status(path, status_error);
                if (status_error || !std::filesystem::exists(target_status)) {
                    result_.warnings.push_back("Broken symbolic link: " + path.string());
                    emit(path, EntryKind::Symlink, depth);
                    return;
                }

                if (!std::filesystem::is_directory(target_status)) {
                    emit(path, EntryKind::File, depth);
                    return;
                }

                emit(path, EntryKind::Directory, depth);

                std::error_code canonical_error;
                const Path target = std::filesystem::canonical(path, canonical_error);
                if (canonical_error) {
                    result_.warnings.push_back("Unable to resolve symbolic link " + path.string() + ": " + canonical_error.message());
                    return;
                }

                // Targets inside the root are reached through their real path.
                if (is_path_within(target, result_.root)) {
                    if (visited_.count(target) > 0 && is_path_within(path, target)) {
                        result_.warnings.push_back("Symlink cycle detected: " + path.string() + " -> " + target.string());
                    }
                    return;
                }

                // A link to an ancestor of the root or of the link itself would walk back over the tree.
                if (is_path_within(result_.root, target) || leads_to_ancestor(path, target)) {
                    result_.warnings.push_back("Symlink cycle detected: " + path.string() + " -> " + target.string());
                    return;
                }

                result_.warnings.push_back("Following symbolic link outside the scan root: " + path.string() + " -> " + target.string());
                descend(path, target, depth);
            }

            void visit(const Path& path, std::size_t depth) {
                std::error_code link_status_error;
                const auto link_status = std::filesystem::symlink_status(path, link_status_error);
                if (link_status_error) {
                    result_.warnings.push_back("Unable to classify " + path.string() + ": " + link_status_error.message());
                    return;
                }

                if (std::filesystem::is_symlink(link_status)) {
                    if (follow_symlinks_) {
                        visit_followed_link(path, depth);
                    } else {
                        result_.skipped_symlinks.push_back(path);
                        emit(path, EntryKind::Symlink, depth);
                    }
                    return;
                }

                if (!std::filesystem::is_directory(link_status)) {
                    emit(path, EntryKind::File, depth);
                    return;
                }

                emit(path, EntryKind::Directory, depth);

                std::error_code canonical_error;
                const Path canonical = std::filesystem::canonical(path, canonical_error);
                descend(path, canonical_error ? path.lexically_normal() : canonical, depth);
            }

            ScanResult& result_;
            bool follow_symlinks_;
            std::set<Path> visited_;
        };
    }

    bool is_path_within(const Path& path, const Path& root) {
        Path normal_root = root.lexically_normal();
        if (!normal_root.has_filename() && normal_root.has_relative_path()) {
            normal_root = normal_root.parent_path();
        }
        const Path relative = path.lexically_normal().lexically_relative(normal_root);
        return !relative.empty() && *relative.begin() != "..";
    }

    ScanResult scan_directory(const Path& root, bool follow_symlinks) {
        std::error_code status_error;
        const auto root_status = std::filesystem::status(root, status_error);
        if (status_error || !std::filesystem::is_directory(root_status)) {
            throw std::invalid_argument("Root path is not a directory: " + root.string());
        }

        std::error_code canonical_error;
        Path canonical_root = std::filesystem::canonical(root, canonical_error);
        if (canonical_error) {
            throw std::invalid_argument("Unable to resolve root path " + root.string() + ": " + canonical_error.message());
        }

        ScanResult result;
        result.root = canonical_root;
        TreeWalker walker(result, follow_symlinks);
        walker.walk(result.root, 0);
        return result;
    }
}
