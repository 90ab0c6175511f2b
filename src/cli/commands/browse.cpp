#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static bool report(const Result<void>& r) {
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return false;
    }
    return true;
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    cli.show_active_view();
}

static void do_cd(BaseCLI& cli, const std::string& arg) {
    if (report(cli.browser.change_directory(arg.empty() ? ".." : arg))) {
        cli.show_active_view();
    }
}

static void do_open(BaseCLI& cli, const std::string& arg) {
    auto r = cli.browser.open(arg.empty() ? "." : arg);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return;
    }
    cli.show_active_view();
}

static void do_views(BaseCLI& cli, const std::string& arg) {
    auto ids = cli.browser.view_ids();
    if (ids.empty()) {
        std::cout << theme::dim("    No open views.") << "\n";
        return;
    }

    const View* active = cli.browser.active();
    std::cout << theme::section("Views");
    for (ViewId id : ids) {
        const View* v = cli.browser.view(id);
        bool is_active = active && active->id == id;
        std::cout << (is_active ? theme::amber("  * ") : "    ")
                  << fmt::format("{:<4}", id)
                  << v->path.string()
                  << (v->kind == ViewKind::Text ? theme::dim("  (text)") : "")
                  << "\n";
    }
    std::cout << "\n";
}

static void do_view(BaseCLI& cli, const std::string& arg) {
    int id = safe_stoi(arg, -1);
    if (id < 0) {
        std::cout << "Usage: view <id>\n";
        return;
    }
    if (report(cli.browser.activate(id))) {
        cli.show_active_view();
    }
}

static void do_close(BaseCLI& cli, const std::string& arg) {
    int id;
    if (arg.empty()) {
        const View* v = cli.browser.active();
        if (!v) {
            std::cout << theme::fail("No active view");
            return;
        }
        id = v->id;
    } else {
        id = safe_stoi(arg, -1);
    }
    if (report(cli.browser.close(id))) {
        std::cout << theme::dim(fmt::format("    Closed view {}", id)) << "\n";
    }
}

static void do_goto(BaseCLI& cli, const std::string& arg) {
    int line = safe_stoi(arg, -1);
    if (line < 1) {
        std::cout << "Usage: goto <line>\n";
        return;
    }
    if (report(cli.browser.move_cursor(line))) {
        cli.show_cursor_line();
    }
}

static void do_down(BaseCLI& cli, const std::string& arg) {
    int n = arg.empty() ? 1 : safe_stoi(arg, 1);
    if (report(cli.browser.move_by(n))) {
        cli.show_cursor_line();
    }
}

static void do_up(BaseCLI& cli, const std::string& arg) {
    int n = arg.empty() ? 1 : safe_stoi(arg, 1);
    if (report(cli.browser.move_by(-n))) {
        cli.show_cursor_line();
    }
}

static void do_find(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << "Usage: find <name>\n";
        return;
    }
    if (report(cli.browser.find_entry(arg))) {
        cli.show_cursor_line();
    }
}

static void do_reload(BaseCLI& cli, const std::string& arg) {
    if (report(cli.browser.reload())) {
        cli.show_active_view();
    }
}

void register_browse_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "Show the active view");
    cli.add_command("cd", do_cd, "Enter a directory of the active listing");
    cli.add_command("open", do_open, "Open a new view on a directory or file");
    cli.add_command("views", do_views, "List open views");
    cli.add_command("view", do_view, "Switch to view <id>");
    cli.add_command("close", do_close, "Close view <id> (default: active)");
    cli.add_command("goto", do_goto, "Put the cursor on line <n>");
    cli.add_command("down", do_down, "Move the cursor down [n] lines");
    cli.add_command("up", do_up, "Move the cursor up [n] lines");
    cli.add_command("find", do_find, "Put the cursor on entry <name>");
    cli.add_command("reload", do_reload, "Re-read the active view from disk");
}
