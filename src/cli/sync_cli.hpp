#pragma once

#include "base_cli.hpp"
#include "run_printer.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <network/connection_monitor.hpp>

// Forward declarations for command registration
void register_sync_commands(BaseCLI& cli);
void register_connection_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

// Interactive wizards (setup_wizards.cpp)
void run_setup_wizard(BaseCLI& cli);
void run_migration(BaseCLI& cli, const std::string& legacy_path);

class SyncCLI : public BaseCLI {
public:
    SyncCLI();
    ~SyncCLI() override;

    void run_repl();

    // One-shot invocation from the command line; returns the exit status.
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();

    // ── Background notifications ────────────────────────────
    // Runs on the main thread from readline's event hook: drains the
    // orchestrator's queue and the connection monitor's notices, printing
    // them above the prompt.
    static int readline_event_hook();
    void drain_events(bool at_prompt);
    void print_above_prompt(const std::vector<std::string>& lines, bool at_prompt);

    void start_monitor();
    void stop_monitor();

    std::unique_ptr<ConnectionMonitor> monitor_;
    ConnectionMonitor::Subscription subscription_;
    std::mutex notice_mutex_;
    std::vector<std::string> notices_;      // written by the monitor thread

    RunPrinter bg_printer_{true};
    std::string current_prompt_;
};
