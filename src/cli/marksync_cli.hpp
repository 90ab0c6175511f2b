#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_browse_commands(BaseCLI& cli);
void register_mark_commands(BaseCLI& cli);
void register_mark_keybindings(BaseCLI& cli);
void register_upload_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);

class MarkSyncCLI : public BaseCLI {
public:
    explicit MarkSyncCLI(Config config);

    // Open a view per directory, then read commands until quit or EOF.
    // Interactive when stdin is a terminal, line-by-line script otherwise.
    int run(const std::vector<std::string>& dirs);

    // Write ~/.marksync/config.yaml if it does not exist yet.
    static int run_init();

private:
    void register_all_commands();

    // ── Interactive loop ───────────────────────────────────────
    // readline runs in callback mode so the event queue can be drained
    // while the user sits at the prompt.
    void run_interactive();
    void run_script();
    void handle_line(const std::string& line);
    void refresh_prompt();
    void wait_for_transfer();

    static void on_readline_line(char* raw);
    static MarkSyncCLI* active_;

    std::string current_prompt_;
};
