#include "../sync_cli.hpp"
#include <iostream>

static void do_setup(BaseCLI& cli, const std::string& arg) {
    run_setup_wizard(cli);
}

static void do_migrate(BaseCLI& cli, const std::string& arg) {
    run_migration(cli, arg);
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("setup", do_setup, "Store the login and create a profile");
    cli.add_command("migrate", do_migrate, "Convert an old config.txt [PATH] to a profile");
}
