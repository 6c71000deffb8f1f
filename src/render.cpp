#include <vector>
#include <sstream>
#include <iostream>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/render.hpp"

namespace restricted_renamer {

    namespace {
        constexpr const char* kColorReset = "\033[0m";
        constexpr const char* kColorKey = "\033[1;34m";
        constexpr const char* kColorValue = "\033[1;32m";
        constexpr const char* kColorError = "\033[1;31m";
        constexpr const char* kIndentUnit = "  ";

        class JsonBuilder {
        public:
            explicit JsonBuilder(int depth = 1) : depth_(depth) {}

            void add_string(const std::string& key, const std::string& value) {
                add_key(key);
                stream_ << "\"" << json_escape(value) << "\"";
            }

            void add_number(const std::string& key, std::size_t value) {
                add_key(key);
                stream_ << value;
            }

            void add_object_array(const std::string& key, const std::vector<JsonBuilder>& items) {
                add_key(key);
                stream_ << "[";
                if (items.empty()) {
                    stream_ << "]";
                    return;
                }
                stream_ << "\n";
                for (std::size_t i = 0; i < items.size(); ++i) {
                    if (i > 0) {
                        stream_ << ",\n";
                    }
                    stream_ << items[i].object();
                }
                stream_ << "\n" << indent(depth_) << "]";
            }

            std::string object() const {
                return indent(depth_ - 1) + "{\n" + stream_.str() + "\n" + indent(depth_ - 1) + "}";
            }

        private:
            static std::string indent(int depth) {
                std::string out;
                for (int i = 0; i < depth; ++i) {
                    out += kIndentUnit;
                }
                return out;
            }

            void add_key(const std::string& key) {
                if (first_) {
                    first_ = false;
                } else {
                    stream_ << ",\n";
                }
                stream_ << indent(depth_) << "\"" << key << "\": ";
            }

            int depth_;
            bool first_ = true;
            std::ostringstream stream_;
        };

        void append_warnings(std::ostream& out, const std::vector<std::string>& warnings) {
            if (warnings.empty()) {
                return;
            }
            out << "\n\nWarnings (" << warnings.size() << "):";
            for (const auto& warning : warnings) {
                out << "\n  ! " << warning;
            }
        }

        const char* kind_label(EntryKind kind) {
            switch (kind) {
                case EntryKind::Directory: return "[dir] ";
                case EntryKind::Symlink: return "[link]";
                case EntryKind::File: break;
            }
            return "[file]";
        }
    }

    std::string format_plan_summary(const RenamePlan& plan, bool verbose) {
        std::ostringstream out;
        out << "Scanned " << plan.total_entries_scanned << " entries under " << plan.root.string();

        if (!plan.skipped_symlinks.empty()) {
            out << "\nFound " << plan.skipped_symlinks.size()
                << " symlinks that were not followed (use --follow-symlinks to process their targets)";
            if (verbose) {
                for (const auto& link : plan.skipped_symlinks) {
                    out << "\n  symlink: " << link.string();
                }
            }
        }

        if (!plan.has_changes()) {
            append_warnings(out, plan.warnings);
            return out.str();
        }

        out << "\nFound " << plan.total_renames_needed << " entries to rename:\n";
        for (const auto& action : plan.actions) {
            out << "\n  " << kind_label(action.kind) << " " << action.original_name << " -> " << action.final_name;
            out << "\n         in " << action.source.parent_path().string();
            if (verbose) {
                for (const auto& issue : action.issues) {
                    out << "\n         * " << issue;
                }
            }
        }

        append_warnings(out, plan.warnings);
        return out.str();
    }

    std::string render_rename_log_json(const std::vector<RenameResult>& results,
                                       const std::filesystem::path& root,
                                       const std::string& timestamp) {
        std::vector<JsonBuilder> renames;
        std::vector<JsonBuilder> errors;

        for (const auto& result : results) {
            JsonBuilder item(3);
            item.add_string("source", result.action.source.string());
            if (result.success) {
                item.add_string("destination", result.action.destination.string());
                renames.push_back(std::move(item));
            } else {
                item.add_string("error", result.error_message.value_or("Unknown error"));
                errors.push_back(std::move(item));
            }
        }

        JsonBuilder json;
        json.add_string("timestamp", timestamp);
        json.add_string("root", root.string());
        json.add_number("total_renames", renames.size());
        json.add_number("total_errors", errors.size());
        json.add_object_array("renames", renames);
        json.add_object_array("errors", errors);
        return json.object();
    }

    void render_plan_text(const RenamePlan& plan, bool verbose) {
        std::cout << format_plan_summary(plan, verbose) << "\n";
    }

    void render_results_text(const std::vector<RenameResult>& results, const std::optional<std::filesystem::path>& log_file) {
        std::size_t successes = 0;
        std::size_t failures = 0;
        for (const auto& result : results) {
            if (result.success) {
                ++successes;
            } else {
                ++failures;
            }
        }

        std::cout << "\n" << kColorKey << "Done: " << kColorValue << successes << " renamed, "
                  << failures << " errors." << kColorReset << "\n";
        for (const auto& result : results) {
            if (!result.success) {
                std::cerr << kColorError << "  ERROR: " << result.action.source.string() << " -> "
                          << result.error_message.value_or("Unknown error") << kColorReset << "\n";
            }
        }
        if (log_file) {
            std::cout << kColorKey << "Log written to: " << kColorValue << log_file->string() << kColorReset << "\n";
        }
    }

    void render_error(const std::string& message) {
        std::cerr << kColorError << "Error: " << message << kColorReset << "\n";
    }
}
