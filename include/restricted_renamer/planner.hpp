#pragma once
#include <set>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "restricted_renamer/types.hpp"
#include "restricted_renamer/sanitizer.hpp"

namespace restricted_renamer {
    RenamePlan build_plan(const std::filesystem::path& root,
                          const std::vector<ScannedEntry>& entries,
                          std::size_t max_length = kDefaultMaxNameLength,
                          const std::optional<std::string>& replace_char = std::nullopt);

    RenamePlan build_rename_plan(const std::filesystem::path& root,
                                 std::size_t max_length = kDefaultMaxNameLength,
                                 bool follow_symlinks = false,
                                 const std::optional<std::string>& replace_char = std::nullopt);

    std::string find_available_name(const std::string& desired,
                                    const std::set<std::string>& taken,
                                    std::size_t max_length = kDefaultMaxNameLength);
}
