#include "sync_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <filesystem>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>

// ── Interactive prompt helpers ──────────────────────────

static std::string prompt_line(const std::string& label, const std::string& default_val = "") {
    std::string suffix = default_val.empty() ? ": " : " [" + default_val + "]: ";
    std::cout << theme::color::AMBER << "    " << label << suffix << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return default_val;
    trim(answer);
    if (answer.empty()) return default_val;
    return answer;
}

static bool prompt_yes_no(const std::string& label, bool default_yes) {
    std::string answer = prompt_line(label + (default_yes ? " (Y/n)" : " (y/N)"));
    if (answer.empty()) return default_yes;
    return answer[0] == 'y' || answer[0] == 'Y';
}

static int prompt_choice(const std::string& label,
                         const std::vector<std::pair<std::string, std::string>>& options,
                         int default_idx = 0) {
    std::cout << "\n" << theme::dim("    " + label) << "\n";
    for (size_t i = 0; i < options.size(); i++) {
        std::cout << theme::color::AMBER << "      "
                  << (i + 1) << theme::color::RESET << "  "
                  << options[i].first;
        if (!options[i].second.empty()) {
            std::cout << theme::dim(": " + options[i].second);
        }
        std::cout << "\n";
    }
    std::string answer = prompt_line("Choice", std::to_string(default_idx + 1));
    int n = safe_stoi(answer, default_idx + 1);
    if (n >= 1 && n <= static_cast<int>(options.size())) return n - 1;
    return default_idx;
}

static std::string prompt_password(const std::string& label) {
    std::cout << theme::color::AMBER << "    " << label << ": " << theme::color::RESET;
    std::cout.flush();
    std::string password = platform::read_hidden_line();
    std::cout << "\n";
    return password;
}

// ── Steps ───────────────────────────────────────────────

static bool setup_login() {
    std::cout << theme::section("Login");
    std::cout << theme::dim("    One username and password for the VPN and the network share.") << "\n";
    std::cout << theme::dim("    Stored in " + CredentialManager::instance().path().string()
                            + " (readable only by you).") << "\n\n";

    auto& creds = CredentialManager::instance();
    auto existing = creds.load_login();
    Credentials login;
    login.username = prompt_line("Username", existing.is_ok() ? existing.value.username : "");
    if (login.username.empty()) {
        std::cout << theme::fail("Username cannot be empty.");
        return false;
    }

    bool has_password = existing.is_ok() && !existing.value.password.empty();
    login.password = prompt_password(has_password ? "Password (empty keeps the stored one)"
                                                  : "Password");
    if (login.password.empty()) {
        if (!has_password) {
            std::cout << theme::fail("Password cannot be empty.");
            return false;
        }
        login.password = existing.value.password;
    }

    auto stored = creds.store_login(login);
    if (stored.is_err()) {
        std::cout << theme::fail("Failed to store credentials: " + stored.error);
        return false;
    }
    std::cout << theme::ok("Login stored");
    return true;
}

static void setup_profile(BaseCLI& cli) {
    if (fs::exists(cli.profile_path)) {
        std::cout << theme::info("Profile exists: " + cli.profile_path.string());
        return;
    }
    std::cout << theme::section("Profile");
    if (!prompt_yes_no("Create " + std::string(PROFILE_FILE_NAME) + " in this directory?", true)) {
        return;
    }

    ProfileConfig profile;
    profile.name = prompt_line("Job name", cli.profile_path.parent_path().filename().string());
    profile.destination = prompt_line("Local destination folder", "~/sharesync");

    std::string sources = prompt_line("Folders on the share to sync (comma separated)");
    profile.sources = split_trimmed(sources, ',');
    if (profile.sources.empty()) {
        std::cout << theme::fail("At least one source is needed.");
        return;
    }

    int mode = prompt_choice("Sync mode", {
        {"update", "replace files that are newer on the share"},
        {"mirror", "exact copy, deletes files missing on the share"},
        {"additive", "only add new files"},
    });
    profile.mode = mode == 1 ? SyncMode::Mirror
                 : mode == 2 ? SyncMode::Additive
                             : SyncMode::Update;

    auto saved = save_profile(profile, cli.profile_path);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return;
    }
    cli.config.reset();
    std::cout << theme::ok("Wrote " + cli.profile_path.string());
}

// ── Entry points ────────────────────────────────────────

void run_setup_wizard(BaseCLI& cli) {
    if (cli.orchestrator && cli.orchestrator->active()) {
        std::cout << theme::fail("A sync is running; finish or cancel it before setup.");
        cli.exit_code = 1;
        return;
    }

    std::cout << theme::banner();

    bool had_config = global_config_exists();
    auto config_result = create_default_global_config();
    if (config_result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + config_result.error);
        cli.exit_code = 1;
        return;
    }
    if (!had_config) {
        std::cout << theme::ok("Wrote " + get_global_config_path().string());
        auto reloaded = Config::load_global();
        // The fresh file holds the defaults the engine was built with
        if (reloaded.is_ok()) cli.global = reloaded.value;
    } else {
        std::cout << theme::info("Using " + get_global_config_path().string());
    }

    if (!setup_login()) {
        cli.exit_code = 1;
        return;
    }
    setup_profile(cli);

    std::cout << theme::divider();
    std::cout << theme::step("Run 'sharesync preview' to check what will be copied.");
    std::cout << "\n";
}

void run_migration(BaseCLI& cli, const std::string& legacy_path) {
    fs::path legacy = legacy_path.empty() ? fs::current_path() / LEGACY_CONFIG_FILE
                                          : fs::path(expand_home(legacy_path));

    auto result = migrate_legacy_config(legacy, cli.profile_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        cli.exit_code = 1;
        return;
    }
    cli.config.reset();
    std::cout << theme::ok(fmt::format("Converted {} to {}", legacy.string(), result.value.string()));
    std::cout << theme::step("Review the profile, then run 'sharesync preview'.");
}
