#include "console.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <cstdio>
#include <iostream>
#include <readline/readline.h>

namespace console {

static bool g_prompt_active = false;

void set_prompt_active(bool active) {
    g_prompt_active = active;
}

void print(const std::string& text) {
    if (!g_prompt_active) {
        std::cout << text << std::flush;
        return;
    }
    rl_clear_visible_line();
    std::cout << text << std::flush;
    if (!text.empty() && text.back() != '\n') std::cout << "\n" << std::flush;
    rl_forced_update_display();
}

} // namespace console

void ConsoleNotifier::notify(const std::string& message, Severity severity) {
    switch (severity) {
        case Severity::Info:
            marksync_log("info: " + message);
            console::print(theme::ok(message));
            break;
        case Severity::Warning:
            marksync_log("warn: " + message);
            console::print(theme::warn(message));
            break;
        case Severity::Error:
            marksync_log("error: " + message);
            console::print(theme::fail(message));
            break;
    }
}
