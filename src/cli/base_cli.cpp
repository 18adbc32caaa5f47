#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() : profile_path(get_profile_path()) {
    if (global_config_exists()) {
        auto global_result = Config::load_global();
        if (global_result.is_ok()) {
            global = global_result.value;
        } else {
            std::cout << theme::fail(global_result.error);
        }
    }
    init_engine();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config(const std::string& profile_override) {
    fs::path path = profile_override.empty() ? profile_path
                                             : fs::path(expand_home(profile_override));
    if (config && config->profile_path() == path) {
        return true;
    }

    auto result = Config::load(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Create " + std::string(PROFILE_FILE_NAME) +
                                 " or run 'sharesync migrate' on an old config.txt.");
        return false;
    }
    config = result.value;
    return true;
}

Credentials BaseCLI::credentials() const {
    auto creds = CredentialManager::instance().load_login();
    return creds.is_ok() ? creds.value : Credentials{};
}

void BaseCLI::init_engine() {
    if (!runner) {
        runner = std::make_unique<platform::SystemProcessRunner>();
    }
    probe = make_connection_probe(global.network(), *runner);
    driver = std::make_unique<TransferDriver>(*runner);
    recorder = std::make_unique<RunRecorder>();
    history = std::make_unique<RunHistory>();
    orchestrator = std::make_unique<SyncOrchestrator>(*probe, *runner, *driver);
    orchestrator->set_recorder(recorder.get());
    orchestrator->set_history(history.get());
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        exit_code = 1;
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        exit_code = 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sync",       {"run", "cancel", "preview", "history"}},
        {"Connection", {"status", "connect", "disconnect", "mount", "unmount"}},
        {"Setup",      {"setup", "migrate"}},
        {"General",    {"help", "clear", "quit", "exit"}},
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
                std::cout << theme::color::TEAL
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

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::AMBER) + "sharesync" + rl_esc(theme::color::RESET);
    if (config.has_value()) {
        prompt += ":" + rl_esc(theme::color::TEAL) + config.value().profile().name
                + rl_esc(theme::color::RESET);
    }
    if (orchestrator && orchestrator->active()) {
        prompt += rl_esc(theme::color::GREEN) + " [syncing]" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
