#include <chrono>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include "restricted_renamer/utils.hpp"
#include "restricted_renamer/render.hpp"
#include "restricted_renamer/executor.hpp"

namespace restricted_renamer {

    namespace {
        using Path = std::filesystem::path;

        RenameResult failed(const RenameAction& action, std::string message) {
            return RenameResult{action, false, std::move(message)};
        }

        RenameResult apply_action(const RenameAction& action) {
            std::error_code source_error;
            const auto source_status = std::filesystem::symlink_status(action.source, source_error);
            if (source_error || !std::filesystem::exists(source_status)) {
                return failed(action, "Source no longer exists: " + action.source.string());
            }

            std::error_code destination_error;
            const auto destination_status = std::filesystem::symlink_status(action.destination, destination_error);
            if (std::filesystem::exists(destination_status)) {
                return failed(action, "Destination already exists: " + action.destination.string());
            }
            if (destination_error && destination_error != std::errc::no_such_file_or_directory) {
                return failed(action, "Unable to check destination " + action.destination.string() + ": " + destination_error.message());
            }

            // rename(2) acts on the directory entry, so a symlink is renamed without touching its target.
            std::error_code rename_error;
            std::filesystem::rename(action.source, action.destination, rename_error);
            if (rename_error) {
                return failed(action, rename_error.message());
            }
            return RenameResult{action, true, std::nullopt};
        }
    }

    std::vector<RenameAction> execution_order(const RenamePlan& plan) {
        std::vector<RenameAction> ordered = plan.actions;
        std::stable_sort(ordered.begin(), ordered.end(), [](const RenameAction& a, const RenameAction& b) {
            if (a.depth != b.depth) {
                return a.depth > b.depth;
            }
            const auto& a_path = a.source.native();
            const auto& b_path = b.source.native();
            if (a_path.size() != b_path.size()) {
                return a_path.size() > b_path.size();
            }
            return a_path > b_path;
        });
        return ordered;
    }

    ExecutionReport execute_plan(const RenamePlan& plan, const std::optional<Path>& log_file) {
        ExecutionReport report;
        report.results.reserve(plan.actions.size());

        for (const auto& action : execution_order(plan)) {
            report.results.push_back(apply_action(action));
        }

        if (!log_file || report.results.empty()) {
            return report;
        }

        try {
            write_rename_log(report.results, plan.root, *log_file);
            report.log_file = log_file;
        } catch (const std::runtime_error& error) {
            report.log_error = error.what();
        }
        return report;
    }

    void write_rename_log(const std::vector<RenameResult>& results, const Path& root, const Path& log_file) {
        if (log_file.has_parent_path()) {
            std::error_code create_error;
            std::filesystem::create_directories(log_file.parent_path(), create_error);
            if (create_error) {
                throw std::runtime_error("Unable to create log directory " + log_file.parent_path().string() + ": " + create_error.message());
            }
        }

        std::ofstream file(log_file, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Unable to open rename log for writing: " + log_file.string());
        }

        file << render_rename_log_json(results, root, format_iso8601_utc(std::chrono::system_clock::now())) << "\n";
        file.flush();
        if (!file) {
            throw std::runtime_error("Unable to write rename log: " + log_file.string());
        }
    }

    std::string generate_log_filename() {
        return "rename_log_" + format_compact_utc(std::chrono::system_clock::now()) + ".json";
    }
}
