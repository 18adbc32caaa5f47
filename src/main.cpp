#include <iostream>
#include <vector>
#include <string>
#include "cli/sync_cli.hpp"
#include "cli/theme.hpp"
#include <platform/net_util.hpp>

static void usage_row(const std::string& cmd, const std::string& arg, const std::string& help) {
    std::cout << theme::color::TEAL << "    sharesync " << cmd << theme::color::RESET;
    if (!arg.empty()) {
        std::cout << " " << theme::color::AMBER << arg << theme::color::RESET;
    }
    size_t used = cmd.size() + (arg.empty() ? 0 : arg.size() + 1);
    std::cout << std::string(used < 24 ? 24 - used : 1, ' ')
              << theme::color::DIM << help << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("", "", "Interactive shell");
    usage_row("run", "[--dry-run]", "Sync the profile in this directory");
    usage_row("preview", "[profile]", "Show what a run would copy");
    usage_row("history", "[N]", "List recent runs");
    usage_row("status", "", "VPN, share and profile status");
    usage_row("connect", "", "Connect the VPN");
    usage_row("disconnect", "", "Disconnect the VPN");
    usage_row("mount", "", "Mount the network share");
    usage_row("unmount", "", "Unmount the network share");
    usage_row("setup", "", "Store the login and create a profile");
    usage_row("migrate", "[config.txt]", "Convert an old config file");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sharesync --version   Show version\n"
              << "    sharesync --help      Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        platform::init_networking();
        SyncCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::AMBER << theme::color::BOLD << "sharesync"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        } else if (cmd == "shell") {
            cli.run_repl();
            return 0;
        }

        if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
