#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/utils.hpp>

static std::string join_or_none(const std::vector<std::string>& words) {
    if (words.empty()) return theme::dim("(none)");
    return shell_join(words);
}

static void do_destination(BaseCLI& cli, const std::string& arg) {
    const Config& config = cli.service.config();
    if (!config.destination_is_set()) {
        std::cout << theme::warn("Destination not set. Use 'set-destination <target>'.");
        return;
    }
    std::cout << theme::kv("Destination", config.transfer().destination);
}

static void do_set_destination(BaseCLI& cli, const std::string& arg) {
    // Outcome (including the usage hint) is reported by the service.
    auto r = cli.service.set_destination(arg);
    if (r.is_err() && r.kind != ErrorKind::DestinationUnset) {
        std::cout << theme::fail(r.error);
    }
}

static void after_start(const Result<void>& r) {
    if (r.is_ok()) {
        std::cout << theme::dim("    'session' shows progress, 'attach' connects to rsync.") << "\n";
    }
}

static void do_upload(BaseCLI& cli, const std::string& arg) {
    after_start(cli.service.upload_marked());
}

static void do_upload_remove(BaseCLI& cli, const std::string& arg) {
    after_start(cli.service.upload_marked_remove());
}

static void do_config(BaseCLI& cli, const std::string& arg) {
    const auto& t = cli.service.config().transfer();

    std::cout << theme::section("Config");
    std::cout << theme::kv("Global", global_config_exists()
        ? get_global_config_path().string()
        : theme::dim("(not found, run 'marksync init')"));
    auto local = get_local_config_path();
    if (fs::exists(local)) {
        std::cout << theme::kv("Local", local.string());
    }
    std::cout << theme::kv("Destination", t.destination);
    std::cout << theme::kv("Flags", join_or_none(t.base_flags));
    std::cout << theme::kv("Extra flags", join_or_none(t.extra_flags));
    std::cout << theme::kv("Transport", join_or_none(t.transport_args));
    std::cout << theme::kv("Relative", t.preserve_relative_paths ? "yes" : "no");
    std::cout << theme::kv("Keybindings", t.install_default_keybindings ? "yes" : "no");
    std::cout << "\n";
}

void register_upload_commands(BaseCLI& cli) {
    cli.add_command("destination", do_destination, "Show the rsync destination");
    cli.add_command("set-destination", do_set_destination, "Set the rsync destination for this run");
    cli.add_command("upload", do_upload, "rsync marked paths to the destination");
    cli.add_command("upload-and-remove", do_upload_remove,
                    "rsync marked paths, then delete the sources");
    cli.add_command("config", do_config, "Show the effective configuration");
}
