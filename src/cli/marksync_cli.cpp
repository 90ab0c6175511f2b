#include "marksync_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <readline/readline.h>
#include <readline/history.h>
#include <fmt/format.h>

MarkSyncCLI* MarkSyncCLI::active_ = nullptr;

MarkSyncCLI::MarkSyncCLI(Config config) : BaseCLI(std::move(config)) {
    register_all_commands();
}

void MarkSyncCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string&) {
        cli.request_quit();
    }, "Exit marksync");

    add_command("exit", [](BaseCLI& cli, const std::string&) {
        cli.request_quit();
    }, "Exit marksync");

    add_command("clear", [](BaseCLI&, const std::string&) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_browse_commands(*this);
    register_mark_commands(*this);
    register_upload_commands(*this);
    register_session_commands(*this);

    if (service.config().transfer().install_default_keybindings) {
        register_mark_keybindings(*this);
    }
}

int MarkSyncCLI::run(const std::vector<std::string>& dirs) {
    marksync_log(fmt::format("start: {} view(s) requested", dirs.size()));

    bool interactive = platform::stdin_is_tty();
    if (interactive) {
        std::cout << theme::banner();
        if (service.config().destination_is_set()) {
            std::cout << theme::kv("Destination", service.config().transfer().destination);
        } else {
            std::cout << theme::warn("Destination not set. Use 'set-destination <target>'.");
        }
    }

    for (const auto& dir : dirs) {
        auto opened = browser.open(dir);
        if (opened.is_err()) {
            std::cout << theme::fail(opened.error);
        }
    }

    if (interactive) {
        show_active_view();
        std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";
        run_interactive();
    } else {
        run_script();
    }

    wait_for_transfer();
    marksync_log("exit");
    return 0;
}

int MarkSyncCLI::run_init() {
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return 1;
    }
    std::cout << theme::ok("Config ready: " + get_global_config_path().string());
    std::cout << theme::step("Edit 'destination' before uploading.");
    return 0;
}

void MarkSyncCLI::handle_line(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;
    if (command.empty()) return;

    std::string args;
    std::getline(iss, args);
    trim(args);

    execute_command(command, args);
}

// ── Interactive loop ─────────────────────────────────────────

void MarkSyncCLI::on_readline_line(char* raw) {
    MarkSyncCLI* self = active_;
    if (!self) {
        free(raw);
        return;
    }

    if (!raw) {
        std::cout << "\n";
        self->request_quit();
        return;
    }

    std::string line = raw;
    free(raw);

    console::set_prompt_active(false);
    if (!line.empty()) {
        add_history(line.c_str());
        self->handle_line(line);
    }
    if (self->quit_requested()) return;

    self->current_prompt_ = self->get_prompt_string();
    rl_set_prompt(self->current_prompt_.c_str());
    console::set_prompt_active(true);
}

void MarkSyncCLI::refresh_prompt() {
    std::string prompt = get_prompt_string();
    if (prompt == current_prompt_) return;
    current_prompt_ = prompt;
    rl_set_prompt(current_prompt_.c_str());
    rl_forced_update_display();
}

void MarkSyncCLI::run_interactive() {
    active_ = this;
    current_prompt_ = get_prompt_string();
    rl_callback_handler_install(current_prompt_.c_str(), on_readline_line);
    console::set_prompt_active(true);

    while (!quit_requested()) {
        int ready = platform::poll_two(STDIN_FILENO, events.wait_fd(), -1);
        if (ready & 2) {
            events.drain();
            if (!quit_requested()) refresh_prompt();
        }
        if ((ready & 1) && !quit_requested()) {
            rl_callback_read_char();
        }
    }

    console::set_prompt_active(false);
    rl_callback_handler_remove();
    active_ = nullptr;

    if (service.transfer_running()) {
        std::cout << theme::dim("    Waiting for the running transfer to finish...") << "\n";
    }
}

// ── Script mode ──────────────────────────────────────────────

void MarkSyncCLI::run_script() {
    std::string line;
    while (!quit_requested() && std::getline(std::cin, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        handle_line(line);
        events.drain();
    }
}

void MarkSyncCLI::wait_for_transfer() {
    while (service.transfer_running()) {
        platform::poll_two(events.wait_fd(), -1, ATTACH_POLL_MS);
        events.drain();
    }
    events.drain();
}
