#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <network/connection_probe.hpp>
#include <platform/process.hpp>
#include <sync/run_history.hpp>
#include <sync/run_recorder.hpp>
#include <sync/sync_orchestrator.hpp>
#include <sync/transfer_driver.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load the profile at profile_path (or an override); prints on failure
    bool require_config(const std::string& profile_override = "");

    // Stored login, empty values if nothing is stored yet
    Credentials credentials() const;

    void init_engine();

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }
    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    // Public state
    bool interactive = false;
    int exit_code = 0;              // process exit status for one-shot commands
    fs::path profile_path;
    Config global;                  // network settings and defaults
    std::optional<Config> config;   // global + loaded profile

    // Declaration order matters: the orchestrator is torn down first
    std::unique_ptr<platform::ProcessRunner> runner;
    std::unique_ptr<ConnectionProbe> probe;
    std::unique_ptr<TransferDriver> driver;
    std::unique_ptr<RunRecorder> recorder;
    std::unique_ptr<RunHistory> history;
    std::unique_ptr<SyncOrchestrator> orchestrator;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
