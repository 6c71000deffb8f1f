#pragma once
#include <filesystem>
#include "restricted_renamer/types.hpp"

namespace restricted_renamer {
    ScanResult scan_directory(const std::filesystem::path& root, bool follow_symlinks = false);
    bool is_path_within(const std::filesystem::path& path, const std::filesystem::path& root);
}
