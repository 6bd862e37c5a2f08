#pragma once

#include "config.hpp"

#include <ostream>

namespace svcscan::cli {

    inline constexpr std::string_view version = "svcscan 0.1.0"sv;

    // Parses and runs one command line; returns the process exit code
    int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace svcscan::cli
