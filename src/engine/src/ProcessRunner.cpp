#include "ProcessRunner.hpp"

ProcessUtils::ProcessResult SystemProcessRunner::run(const std::vector<std::string>& argv) {
    return ProcessUtils::run_capture(argv);
}
