#pragma once

#include <string>
#include <map>
#include <functional>
#include <core/config.hpp>
#include <core/event_queue.hpp>
#include <listing/browser.hpp>
#include <managers/mark_store.hpp>
#include <managers/pty_launcher.hpp>
#include <managers/upload_service.hpp>
#include "console.hpp"

class BaseCLI {
public:
    explicit BaseCLI(Config config);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Key sequences that only act while the active view is a listing.
    void bind_key(const std::string& keys,
                  CommandHandler handler,
                  const std::string& help);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Print the active view with cursor and mark annotations.
    void show_active_view() const;
    // Print only the cursor line of the active view.
    void show_cursor_line() const;

    void request_quit() { quit_requested_ = true; }
    bool quit_requested() const { return quit_requested_; }

    std::string get_prompt_string() const;

    // Public state (construction order matters: the service refers to the rest)
    EventQueue events;
    Browser browser;
    MarkStore marks;
    PtyLauncher launcher;
    ConsoleNotifier notifier;
    UploadService service;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::map<std::string, std::pair<CommandHandler, std::string>> bindings_;
    bool quit_requested_ = false;
};
