#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = 0;
    std::string output; // stdout, when captured
    bool input_consumed = true; // false if the child closed stdin before reading it all
};

// fork/exec argv[0] from PATH, feed input on stdin and optionally collect
// stdout. A non-zero exit code is not an error here; callers decide.
std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const std::string& input = {},
            bool capture_stdout = false);

} // namespace platform
