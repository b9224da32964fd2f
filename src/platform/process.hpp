#pragma once

#include <string>
#include <vector>

namespace platform {

// Captured output of a finished child process.
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Single-quote an argument for /bin/sh.
std::string shell_quote(const std::string& arg);

// True if program resolves on PATH.
bool command_exists(const std::string& program);

// Run program with args through the shell, capturing stdout as bytes and
// stderr as text. Blocks until the child exits. Throws std::runtime_error
// if the pipe cannot be opened.
CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args);

} // namespace platform
