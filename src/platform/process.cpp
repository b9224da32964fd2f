#include "process.hpp"
#include "platform.hpp"

#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace platform {

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool command_exists(const std::string& program) {
    std::string test = "command -v " + shell_quote(program) + " >/dev/null 2>&1";
    return std::system(test.c_str()) == 0;
}

CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args) {
    auto err_path = temp_file("chartreader_stderr");

    std::string cmd = shell_quote(program);
    for (const auto& a : args) {
        cmd += " " + shell_quote(a);
    }
    cmd += " 2>" + shell_quote(err_path.string());

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open pipe to " + program);
    }

    CommandResult result;
    char buffer[8192];
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.stdout_data.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    {
        std::ifstream err(err_path);
        std::ostringstream ss;
        ss << err.rdbuf();
        result.stderr_data = ss.str();
    }
    std::error_code ec;
    std::filesystem::remove(err_path, ec);

    return result;
}

} // namespace platform
