#include <iostream>
#include <stdexcept>
#include <filesystem>
#include "restricted_renamer/cli.hpp"
#include "restricted_renamer/render.hpp"
#include "restricted_renamer/planner.hpp"
#include "restricted_renamer/executor.hpp"

namespace {
    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitCancelled = 2;
}

int main(int argc, char* argv[]) {
    auto options = restricted_renamer::parse_cli(argc, argv);

    if (!options.valid) {
        std::cerr << "\033[1;31m" << options.error_message << "\033[0m\n";
        std::cerr << "\033[1;31mUsage: " << argv[0] << " [options] <path>\033[0m\n";
        return kExitFailure;
    }

    if (options.show_help || !options.path) {
        restricted_renamer::print_help(argv[0]);
        return kExitSuccess;
    }

    restricted_renamer::RenamePlan plan;
    try {
        plan = restricted_renamer::build_rename_plan(
            *options.path, options.max_length, options.follow_symlinks, options.replace_char);
    } catch (const std::invalid_argument& error) {
        restricted_renamer::render_error(error.what());
        return kExitFailure;
    }

    restricted_renamer::render_plan_text(plan, options.verbose);

    if (!plan.has_changes()) {
        std::cout << "\nNo renames needed. All names are already portable.\n";
        return kExitSuccess;
    }

    if (!options.write) {
        std::cout << "\nDry-run mode. Use --write to apply changes.\n";
        return kExitSuccess;
    }

    if (!options.assume_yes && !restricted_renamer::confirm_rename(plan.total_renames_needed, std::cin, std::cout)) {
        std::cout << "Cancelled.\n";
        return kExitCancelled;
    }

    const std::filesystem::path log_file = options.log_file
        ? std::filesystem::path(*options.log_file)
        : std::filesystem::path(restricted_renamer::generate_log_filename());

    const auto report = restricted_renamer::execute_plan(plan, log_file);
    if (report.log_error) {
        restricted_renamer::render_error(*report.log_error);
    }

    restricted_renamer::render_results_text(report.results, report.log_file);
    return report.all_succeeded() ? kExitSuccess : kExitFailure;
}
