#pragma once
#include <string>
#include <istream>
#include <ostream>
#include "restricted_renamer/types.hpp"

namespace restricted_renamer {
    void print_help(const std::string& program_name);
    CliParseResult parse_cli(int argc, char* argv[]);
    bool confirm_rename(std::size_t count, std::istream& in, std::ostream& out);
}
