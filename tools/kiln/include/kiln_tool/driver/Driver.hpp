#pragma once

#include <kiln_tool/cli/Options.hpp>

#include <string_view>

namespace kiln_tool::driver {

// Runs one parsed command; the result is the process exit status.
int run(const cli::Options& opt, const char* argv0);

// Command line rejected before any command ran: reports it and prints usage.
int usage_error(std::string_view message);

} // namespace kiln_tool::driver
