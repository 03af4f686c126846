#pragma once

#include <string>
#include <vector>

namespace kiln_tool::proc {

struct Outcome {
    bool started = false;
    // exit status, or 128 + signal when the child was killed
    int status = 0;
    std::string error{};
};

// Runs a backend executor (`ninja`, `make`) found on PATH and waits for it.
Outcome run_executor(const std::vector<std::string>& argv);

} // namespace kiln_tool::proc
