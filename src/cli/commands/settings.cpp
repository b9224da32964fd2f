#include "../base_cli.hpp"
#include "../theme.hpp"
#include "job_helpers.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_settings(BaseCLI& cli, const WorkerSettings& s) {
    std::cout << theme::section("Worker");
    std::cout << theme::kv("Concurrency", std::to_string(s.concurrency));
    std::cout << theme::kv("Paused", s.paused ? theme::yellow("yes") : "no");
    std::cout << theme::kv("Model", s.model);
    std::cout << theme::kv("Fallback", cli.config->worker().fallback_model);

    std::cout << theme::section("Files");
    const auto& layout = cli.config->layout();
    std::cout << theme::kv("Root", layout.root.string());
    std::cout << theme::kv("CSV", layout.csv_path().string());
    std::cout << theme::kv("Config", cli.config->source_path()
                                         ? cli.config->source_path()->string()
                                         : theme::dim("(defaults)"));
    std::cout << "\n";
}

static void do_config(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "init") {
        fs::path path = args.size() > 1 ? fs::path(args[1]) : get_local_config_path();
        auto result = create_default_config(path);
        if (result.is_err()) {
            cli.fail(result.error);
            return;
        }
        std::cout << theme::ok("Config at " + path.string());
        return;
    }

    if (!cli.require_store()) return;

    if (args.empty() || args[0] == "show") {
        print_settings(cli, cli.store->settings());
        return;
    }

    const std::string usage = "config set <concurrency|paused|model> <value>";
    if (args[0] != "set" || args.size() < 3) {
        cli.fail("Usage: " + usage);
        return;
    }

    SettingsUpdate update;
    const std::string& key = args[1];
    const std::string& value = args[2];
    if (key == "concurrency") {
        int n = 0;
        if (!parse_int_arg(cli, value, n, usage)) return;
        update.concurrency = n;
    } else if (key == "paused") {
        if (value == "on" || value == "true" || value == "yes") {
            update.paused = true;
        } else if (value == "off" || value == "false" || value == "no") {
            update.paused = false;
        } else {
            cli.fail("paused takes on or off");
            return;
        }
    } else if (key == "model") {
        update.model = value;
    } else {
        cli.fail("Unknown setting: " + key);
        return;
    }

    auto result = cli.control->update_settings(update);
    if (result.is_err()) {
        cli.fail(result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("{} = {}", key, value));
}

void register_settings_commands(BaseCLI& cli) {
    cli.add_command("config", do_config, "Show settings, 'set <key> <value>' or 'init [path]'");
}
