#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>
#include <sstream>

BaseCLI::BaseCLI(Config config)
    : marks(browser),
      service(std::move(config), marks, browser, launcher, events, notifier) {
    browser.on_reload([this](ViewId view) { service.on_view_reload(view); });
    browser.on_close([this](ViewId view) { service.on_view_reload(view); });
    service.set_output_sink([](const std::string& chunk) { console::print(chunk); });
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::bind_key(const std::string& keys,
                       CommandHandler handler,
                       const std::string& help) {
    bindings_[keys] = {handler, help};
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    CommandHandler handler;

    auto binding = bindings_.find(command);
    if (binding != bindings_.end()) {
        if (!browser.cursor_context()) {
            std::cout << theme::warn(fmt::format("'{}' is only bound in listing views", command));
            return;
        }
        handler = binding->second.first;
    } else {
        auto it = commands_.find(command);
        if (it == commands_.end()) {
            std::cout << theme::fail("Unknown command: " + command);
            std::cout << theme::step("Type 'help' for available commands.");
            return;
        }
        handler = it->second.first;
    }

    try {
        handler(*this, args);
    } catch (const std::exception& e) {
        marksync_log(fmt::format("command '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Browse",   {"ls", "cd", "open", "views", "view", "close", "goto", "down", "up",
                      "find", "reload"}},
        {"Marks",    {"mark", "marks", "clear-marks"}},
        {"Upload",   {"destination", "set-destination", "upload", "upload-and-remove"}},
        {"Transfer", {"session", "attach", "interrupt"}},
        {"General",  {"config", "help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<18}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }

    if (!bindings_.empty()) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  Keys (listing views)" << theme::color::RESET << "\n";
        for (const auto& [keys, entry] : bindings_) {
            std::cout << theme::color::TEAL
                      << fmt::format("    {:<18}", keys)
                      << theme::color::RESET
                      << theme::color::DIM
                      << entry.second
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}

static std::string format_line(const View& v, int line, bool annotated) {
    const std::string& text = v.lines[static_cast<size_t>(line - 1)];
    bool cursor = (line == v.cursor);

    std::string out = cursor ? theme::color::AMBER + "  > " + theme::color::RESET : "    ";
    out += theme::color::DIM + fmt::format("{:>4}  ", line) + theme::color::RESET;
    if (v.kind == ViewKind::Listing && !text.empty() && text.back() == '/') {
        out += theme::teal(text);
    } else {
        out += text;
    }
    if (annotated) out += theme::green(MARK_GLYPH);
    return out + "\n";
}

void BaseCLI::show_active_view() const {
    const View* v = browser.active();
    if (!v) {
        std::cout << theme::dim("    No open views. Use 'open <path>'.") << "\n";
        return;
    }

    auto annotated = browser.annotated_lines(v->id);
    std::ostringstream out;
    out << "\n  " << theme::dim(fmt::format("view {}", v->id)) << "  "
        << theme::bold(v->path.string())
        << (v->kind == ViewKind::Text ? theme::dim("  (text)") : "") << "\n";
    for (int line = 1; line <= static_cast<int>(v->lines.size()); ++line) {
        out << format_line(*v, line, annotated.count(line) > 0);
    }
    out << "\n";
    std::cout << out.str();
}

void BaseCLI::show_cursor_line() const {
    const View* v = browser.active();
    if (!v || v->lines.empty()) return;
    auto annotated = browser.annotated_lines(v->id);
    std::cout << format_line(*v, v->cursor, annotated.count(v->cursor) > 0);
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::TEAL) + "marksync" + rl_esc(theme::color::RESET);
    const View* v = browser.active();
    if (v) {
        std::string name = v->path.filename().string();
        if (name.empty()) name = v->path.string();
        prompt += ":" + rl_esc(theme::color::AMBER) + name + rl_esc(theme::color::RESET);
    }
    if (!marks.empty()) {
        prompt += rl_esc(theme::color::GREEN) + fmt::format(" [{}]", marks.size())
                + rl_esc(theme::color::RESET);
    }
    if (service.transfer_running()) {
        prompt += rl_esc(theme::color::YELLOW) + " (rsync)" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
