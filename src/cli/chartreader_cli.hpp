#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_serve_commands(BaseCLI& cli);
void register_jobs_commands(BaseCLI& cli);
void register_pdf_commands(BaseCLI& cli);
void register_settings_commands(BaseCLI& cli);

class ChartReaderCLI : public BaseCLI {
public:
    ChartReaderCLI();

    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};
