#include <iostream>
#include <optional>
#include <vector>
#include <string>
#include <curl/curl.h>
#include "cli/chartreader_cli.hpp"
#include "cli/theme.hpp"

void print_usage(ChartReaderCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    chartreader "
              << theme::color::RESET << theme::color::AMBER << "[--config PATH] <command> [args]"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    chartreader --version        Show version\n"
              << "    chartreader --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<fs::path> config_path;

    // Global options come before the command.
    size_t i = 0;
    while (i < args.size() && args[i].rfind("--", 0) == 0) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = fs::path(args[i + 1]);
            i += 2;
        } else if (args[i] == "--version") {
            std::cout << theme::color::AMBER << theme::color::BOLD << "chartreader"
                      << theme::color::RESET << theme::color::DIM
                      << " version " CHARTREADER_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (args[i] == "--help") {
            ChartReaderCLI cli;
            print_usage(cli);
            return 0;
        } else {
            std::cerr << theme::fail("Unknown option: " + args[i]);
            return 2;
        }
    }

    if (i >= args.size()) {
        ChartReaderCLI cli;
        print_usage(cli);
        return 0;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << theme::fail("libcurl failed to initialize");
        return 1;
    }

    int status = 1;
    try {
        ChartReaderCLI cli;
        std::string command = args[i];
        std::vector<std::string> rest(args.begin() + i + 1, args.end());
        if (command == "help" || cli.load_config(config_path)) {
            status = cli.run_command(command, rest);
        } else {
            status = cli.exit_status;
        }
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string("Fatal error: ") + e.what());
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
