#include "chartreader_cli.hpp"
#include "theme.hpp"
#include <iostream>

ChartReaderCLI::ChartReaderCLI() : BaseCLI() {
    register_all_commands();
}

void ChartReaderCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        std::cout << theme::banner();
        this->print_help();
    }, "Show this help message");

    register_serve_commands(*this);
    register_jobs_commands(*this);
    register_pdf_commands(*this);
    register_settings_commands(*this);
}

int ChartReaderCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    int status = execute_command(command, args);
    clear_managers();
    return status;
}
