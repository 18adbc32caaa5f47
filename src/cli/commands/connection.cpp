#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>

static void report(BaseCLI& cli, const ConnectionResult& result) {
    if (result.success) {
        std::cout << theme::ok(result.message);
        return;
    }
    std::cout << theme::fail(result.message);
    switch (result.error) {
        case ConnectionError::Unsupported:
            std::cout << theme::step("Use the system VPN client, then run 'mount'.");
            break;
        case ConnectionError::AuthFailed:
            std::cout << theme::step("Run 'setup' to update the stored login.");
            break;
        case ConnectionError::VPNRequired:
            std::cout << theme::step("Run 'connect' first.");
            break;
        case ConnectionError::Cancelled:
            cli.exit_code = 130;
            return;
        default:
            break;
    }
    cli.exit_code = 1;
}

// Manual connection commands run to completion; only a sync run cancels.
static const CancelToken& no_cancel() {
    static const CancelToken token;
    return token;
}

static bool refuse_while_syncing(BaseCLI& cli) {
    if (cli.orchestrator && cli.orchestrator->active()) {
        std::cout << theme::fail("A sync is running; cancel it first.");
        cli.exit_code = 1;
        return true;
    }
    return false;
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    // Global config
    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", theme::dim("defaults (no config file)"));
    }

    // Profile
    if (cli.config.has_value()) {
        std::cout << theme::kv("Profile", cli.config->profile().name);
        std::cout << theme::kv("Destination", cli.config->profile().destination);
    } else if (profile_exists(cli.profile_path.parent_path())) {
        std::cout << theme::kv("Profile", cli.profile_path.string());
    } else {
        std::cout << theme::kv("Profile", theme::dim("none in this directory"));
    }

    // Connection
    const auto& net = cli.global.network();
    auto status = cli.probe->status();
    std::cout << theme::kv("Platform", cli.probe->platform_name());
    std::cout << theme::kv("VPN", status.vpn_connected
                                      ? theme::green("connected")
                                      : theme::red("not connected") + theme::dim("  " + net.vpn_host));
    std::string share = fmt::format("//{}/{}", net.share_host, net.share_path);
    std::cout << theme::kv("Share", status.share_mounted
                                        ? theme::green("mounted") + theme::dim("  " + net.mount_point)
                                        : theme::red("not mounted") + theme::dim("  " + share));

    std::cout << theme::kv("Sync", to_string(cli.orchestrator->state()));
    std::cout << "\n";
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::log("Connecting to " + cli.global.network().vpn_host);
    report(cli, cli.probe->connect_vpn(cli.credentials(), no_cancel()));
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (refuse_while_syncing(cli)) return;
    report(cli, cli.probe->disconnect_vpn(no_cancel()));
}

static void do_mount(BaseCLI& cli, const std::string& arg) {
    if (arg != "--no-vpn" && !cli.probe->check_vpn()) {
        std::cout << theme::log("VPN not connected; connecting first");
        auto vpn = cli.probe->connect_vpn(cli.credentials(), no_cancel());
        if (!vpn.success) {
            report(cli, vpn);
            return;
        }
    }
    report(cli, cli.probe->mount_share(cli.credentials()));
}

static void do_unmount(BaseCLI& cli, const std::string& arg) {
    if (refuse_while_syncing(cli)) return;
    report(cli, cli.probe->unmount_share());
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show VPN, share and profile status");
    cli.add_command("connect", do_connect, "Connect the VPN");
    cli.add_command("disconnect", do_disconnect, "Disconnect the VPN");
    cli.add_command("mount", do_mount, "Mount the network share (connects the VPN if needed)");
    cli.add_command("unmount", do_unmount, "Unmount the network share");
}
