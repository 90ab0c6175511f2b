#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <unistd.h>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>

static void do_session(BaseCLI& cli, const std::string& arg) {
    auto session = cli.service.session();
    if (!session) {
        std::cout << theme::dim("    No transfer has run yet.") << "\n";
        return;
    }

    std::cout << theme::section("Transfer");
    std::cout << theme::kv("State", session_state_name(session->state()));
    if (session->finished()) {
        std::cout << theme::kv("Exit code", std::to_string(session->exit_code()));
    }
    std::cout << theme::kv("Command", session->command().render());

    auto lines = session->transcript().tail(TRANSCRIPT_TAIL_LINES);
    if (!lines.empty()) {
        std::cout << "\n";
        for (const auto& line : lines) {
            std::cout << theme::dim("    | ") << line << "\n";
        }
    }
    std::cout << "\n";
}

// Relay the terminal to the running transfer until it exits or Ctrl-] is
// pressed. Output keeps arriving through the event queue meanwhile.
static void do_attach(BaseCLI& cli, const std::string& arg) {
    if (!cli.service.transfer_running()) {
        std::cout << theme::fail("No transfer is running.");
        return;
    }
    if (!platform::stdin_is_tty()) {
        std::cout << theme::fail("attach needs an interactive terminal.");
        return;
    }

    std::cout << theme::dim("    Attached to rsync. Ctrl-] to detach.") << "\n" << std::flush;
    marksync_log("attach");

    bool detached = false;
    {
        platform::RawModeGuard raw;
        char buf[256];
        while (cli.service.transfer_running()) {
            int ready = platform::poll_two(STDIN_FILENO, cli.events.wait_fd(), ATTACH_POLL_MS);
            if (ready & 2) cli.events.drain();
            if (!(ready & 1)) continue;

            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) break;

            std::string bytes(buf, static_cast<size_t>(n));
            auto pos = bytes.find(ATTACH_DETACH_KEY);
            if (pos != std::string::npos) {
                bytes.resize(pos);
                detached = true;
            }
            if (!bytes.empty() && !cli.service.send_input(bytes)) break;
            if (detached) break;
        }
    }
    cli.events.drain();

    std::cout << "\n";
    if (detached) {
        std::cout << theme::dim("    Detached. rsync keeps running.") << "\n";
    }
    marksync_log(detached ? "detach" : "attach ended");
}

static void do_interrupt(BaseCLI& cli, const std::string& arg) {
    if (!cli.service.transfer_running()) {
        std::cout << theme::fail("No transfer is running.");
        return;
    }
    if (cli.service.send_input("\x03")) {
        std::cout << theme::dim("    Sent Ctrl-C to rsync.") << "\n";
    } else {
        std::cout << theme::fail("Could not write to the transfer.");
    }
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("session", do_session, "Show the last transfer and its output");
    cli.add_command("attach", do_attach, "Connect the terminal to the running rsync");
    cli.add_command("interrupt", do_interrupt, "Send Ctrl-C to the running rsync");
}
