#include "sync_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <sync/sync_log.hpp>
#include <readline/readline.h>
#include <readline/history.h>

// readline hooks are plain function pointers
static SyncCLI* g_active_cli = nullptr;

// Event hook poll period while idle at the prompt
static constexpr int READLINE_POLL_USEC = 100000;

SyncCLI::SyncCLI() : BaseCLI() {
    register_all_commands();
}

SyncCLI::~SyncCLI() {
    stop_monitor();
    if (g_active_cli == this) g_active_cli = nullptr;
}

void SyncCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    auto quit = [](BaseCLI& cli, const std::string& arg) {
        if (cli.orchestrator && cli.orchestrator->active()) {
            std::cout << theme::dim("Cancelling the running sync...") << "\n";
            cli.orchestrator->cancel();
            cli.orchestrator->wait();
        }
        std::cout << theme::dim("Bye.") << "\n";
        cli.interactive = false;
    };
    add_command("quit", quit, "Exit sharesync");
    add_command("exit", quit, "Exit sharesync");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_sync_commands(*this);
    register_connection_commands(*this);
    register_setup_commands(*this);
}

// ── Monitor ─────────────────────────────────────────────

void SyncCLI::start_monitor() {
    if (!probe) return;
    monitor_ = std::make_unique<ConnectionMonitor>(*probe);
    subscription_ = monitor_->subscribe([this](const ConnectionStatus& status) {
        std::string msg = fmt::format("Connection changed: VPN {}, share {}",
                                      status.vpn_connected ? "up" : "down",
                                      status.share_mounted ? "mounted" : "not mounted");
        std::lock_guard<std::mutex> lock(notice_mutex_);
        notices_.push_back(msg);
    });
    monitor_->check_now();
    {
        // The first observation is the baseline, not a change
        std::lock_guard<std::mutex> lock(notice_mutex_);
        notices_.clear();
    }
    monitor_->start();
}

void SyncCLI::stop_monitor() {
    subscription_.reset();
    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }
}

// ── Background notifications ────────────────────────────

int SyncCLI::readline_event_hook() {
    if (g_active_cli) g_active_cli->drain_events(true);
    return 0;
}

void SyncCLI::print_above_prompt(const std::vector<std::string>& lines, bool at_prompt) {
    if (lines.empty()) return;
    if (!at_prompt) {
        for (const auto& l : lines) std::cout << l;
        std::cout << std::flush;
        return;
    }
    std::cout << "\r\033[K";
    for (const auto& l : lines) std::cout << l;
    std::cout << std::flush;
    rl_on_new_line();
    rl_redisplay();
}

void SyncCLI::drain_events(bool at_prompt) {
    std::vector<std::string> out;

    {
        std::lock_guard<std::mutex> lock(notice_mutex_);
        for (const auto& n : notices_) out.push_back(theme::info(n));
        notices_.clear();
    }

    bool run_finished = false;
    if (orchestrator) {
        std::ostringstream buf;
        bg_printer_.set_output(buf);
        SyncEvent event;
        while (orchestrator->poll_event(event, 0)) {
            bg_printer_.print(event);
            if (event.kind == EventKind::Done) run_finished = true;
        }
        bg_printer_.set_output(std::cout);
        if (!buf.str().empty()) out.push_back(buf.str());
    }

    if (run_finished) {
        // Done is the last event of a run; join its worker
        orchestrator->wait();
        bg_printer_.reset();
        if (recorder) out.push_back(theme::log("Log: " + recorder->log_path().string()));
    }

    std::string prompt = get_prompt_string();
    if (at_prompt && prompt != current_prompt_) {
        current_prompt_ = prompt;
        rl_set_prompt(current_prompt_.c_str());
        if (out.empty()) {
            rl_on_new_line();
            rl_redisplay();
        }
    }
    print_above_prompt(out, at_prompt);
}

// ── REPL ────────────────────────────────────────────────

void SyncCLI::run_repl() {
    std::cout << theme::banner();

    interactive = true;
    if (profile_exists(profile_path.parent_path())) {
        if (require_config()) {
            std::cout << theme::kv("Profile", config->profile().name);
            std::cout << theme::kv("Sources", std::to_string(config->profile().sources.size()));
            std::cout << theme::kv("Destination", config->profile().destination);
        }
    } else {
        std::cout << theme::info("No " + std::string(PROFILE_FILE_NAME) + " in this directory.");
        std::cout << theme::step("Run 'setup' to create one, or 'migrate' to convert a config.txt.");
    }

    if (probe) {
        std::cout << theme::kv("Platform", probe->platform_name());
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    start_monitor();

    g_active_cli = this;
    rl_event_hook = &SyncCLI::readline_event_hook;
    rl_set_keyboard_input_timeout(READLINE_POLL_USEC);

    std::string line;
    while (interactive) {
        current_prompt_ = get_prompt_string();
        char* raw = readline(current_prompt_.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);
        trim(line);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        sync_log("repl: " + line);
        execute_command(command, args);
        drain_events(false);
    }

    rl_event_hook = nullptr;
    g_active_cli = nullptr;
    stop_monitor();

    if (orchestrator && orchestrator->active()) {
        orchestrator->cancel();
        orchestrator->wait();
    }
}

// ── One-shot commands ───────────────────────────────────

int SyncCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (!has_command(command)) {
        std::cout << theme::fail("Unknown command: " + command);
        return 1;
    }
    interactive = false;
    exit_code = 0;
    execute_command(command, join(args, " "));
    return exit_code;
}
