#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "restricted_renamer/types.hpp"

namespace restricted_renamer {
    std::vector<RenameAction> execution_order(const RenamePlan& plan);

    // Attempts every action. A log failure is reported in the returned log_error.
    ExecutionReport execute_plan(const RenamePlan& plan,
                                 const std::optional<std::filesystem::path>& log_file = std::nullopt);

    void write_rename_log(const std::vector<RenameResult>& results,
                          const std::filesystem::path& root,
                          const std::filesystem::path& log_file);

    std::string generate_log_filename();
}
