#include "base_cli.hpp"
#include "theme.hpp"
#include <managers/job_log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::load_config(const std::optional<fs::path>& explicit_path) {
    auto config_result = Config::load(explicit_path);
    if (config_result.is_err()) {
        fail(config_result.error);
        return false;
    }
    config = config_result.value;
    return true;
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        fail("No configuration loaded.");
        return false;
    }
    return true;
}

bool BaseCLI::require_store() {
    if (store) return true;
    if (!require_config()) return false;

    const auto& layout = config->layout();
    try {
        ensure_directory_structure(layout);
        set_log_dir(layout.logs_dir());

        WorkerSettings defaults;
        defaults.concurrency = config->worker().default_concurrency;
        defaults.model = config->worker().default_model;
        store = std::make_unique<YamlJobStore>(layout.state_dir(), defaults);
        control = std::make_unique<JobControl>(*store, layout);
    } catch (const std::exception& e) {
        fail(fmt::format("Cannot open job store in {}: {}", layout.root.string(), e.what()));
        clear_managers();
        return false;
    }
    return true;
}

void BaseCLI::clear_managers() {
    control.reset();
    store.reset();
}

void BaseCLI::fail(const std::string& msg) {
    std::cout << theme::fail(msg);
    exit_status = 1;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        fail("Unknown command: " + command);
        std::cout << theme::step("Run 'chartreader --help' for available commands.");
        return exit_status;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        fail(std::string(e.what()));
    }
    return exit_status;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Worker",   {"serve", "scan", "import", "export"}},
        {"Jobs",     {"jobs", "runs", "logs", "rerun", "stop", "delete"}},
        {"PDF",      {"candidates", "pick-page"}},
        {"Settings", {"config"}},
        {"General",  {"help"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
