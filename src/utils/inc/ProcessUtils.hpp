#pragma once

#include <string>
#include <vector>

namespace ProcessUtils {

struct ProcessResult {
    int exit_code = 0;       // 128 + signal number when the child was killed
    std::string stdout_text;
    std::string stderr_text;
};

// Run argv[0] (looked up in PATH) with the given arguments, wait for it and
// capture both output streams. Throws ProcessSpawnError when the program
// cannot be started.
ProcessResult run_capture(const std::vector<std::string>& argv);

}
