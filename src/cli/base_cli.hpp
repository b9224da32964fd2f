#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <managers/yaml_job_store.hpp>
#include <managers/job_control.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Loads the config (explicit path, ./chartreader.yaml, user config or
    // defaults). Prints and returns false on a broken file.
    bool load_config(const std::optional<fs::path>& explicit_path);

    bool require_config();

    // Opens the job store under the configured files directory.
    bool require_store();

    void clear_managers();

    // Runs a command and returns the process exit status.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Prints a failure and marks the command as failed.
    void fail(const std::string& msg);

    // Public state
    std::optional<Config> config;
    std::unique_ptr<YamlJobStore> store;
    std::unique_ptr<JobControl> control;
    int exit_status = 0;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
