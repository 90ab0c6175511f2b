#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <cctype>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>

static bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static void do_mark(BaseCLI& cli, const std::string& arg) {
    if (!arg.empty()) {
        auto moved = is_number(arg) ? cli.browser.move_cursor(safe_stoi(arg))
                                    : cli.browser.find_entry(arg);
        if (moved.is_err()) {
            std::cout << theme::fail(moved.error);
            return;
        }
    }
    if (cli.service.toggle_mark().is_ok()) {
        cli.show_cursor_line();
    }
}

static void do_marks(BaseCLI& cli, const std::string& arg) {
    auto paths = cli.marks.snapshot();
    if (paths.empty()) {
        std::cout << theme::dim("    Nothing marked.") << "\n";
        return;
    }
    std::cout << theme::section(fmt::format("Marked ({})", paths.size()));
    for (const auto& p : paths) {
        std::cout << theme::green(MARK_GLYPH) << " " << p << "\n";
    }
    std::cout << "\n";
}

static void do_clear_marks(BaseCLI& cli, const std::string& arg) {
    cli.service.clear_marks();
}

void register_mark_commands(BaseCLI& cli) {
    cli.add_command("mark", do_mark, "Toggle the mark on the cursor entry [line|name]");
    cli.add_command("marks", do_marks, "List marked paths");
    cli.add_command("clear-marks", do_clear_marks, "Unmark everything");
}

// Default listing-view bindings.
void register_mark_keybindings(BaseCLI& cli) {
    cli.bind_key(KEY_TOGGLE_MARK, [](BaseCLI& c, const std::string&) {
        if (c.service.toggle_mark().is_ok()) c.show_cursor_line();
    }, "Toggle the mark on the cursor entry");

    cli.bind_key(KEY_UPLOAD, [](BaseCLI& c, const std::string&) {
        c.execute_command("upload");
    }, "Upload marked paths");

    cli.bind_key(KEY_CLEAR_MARKS, [](BaseCLI& c, const std::string&) {
        c.service.clear_marks();
    }, "Unmark everything");

    cli.bind_key(KEY_UPLOAD_REMOVE, [](BaseCLI& c, const std::string&) {
        c.execute_command("upload-and-remove");
    }, "Upload marked paths, then remove the sources");
}
