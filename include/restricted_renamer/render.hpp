#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "restricted_renamer/types.hpp"

namespace restricted_renamer {
    std::string format_plan_summary(const RenamePlan& plan, bool verbose = false);
    std::string render_rename_log_json(const std::vector<RenameResult>& results,
                                       const std::filesystem::path& root,
                                       const std::string& timestamp);

    void render_plan_text(const RenamePlan& plan, bool verbose);
    void render_results_text(const std::vector<RenameResult>& results, const std::optional<std::filesystem::path>& log_file);
    void render_error(const std::string& message);
}
