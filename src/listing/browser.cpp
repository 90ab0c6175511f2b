#include "browser.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

static Result<std::vector<std::string>> list_directory(const fs::path& dir) {
    std::vector<std::string> dirs;
    std::vector<std::string> files;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Result<std::vector<std::string>>::Err(
            fmt::format("Cannot list {}: {}", dir.string(), ec.message()), ErrorKind::NoTarget);
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        std::string name = it->path().filename().string();
        if (it->is_directory(type_ec)) {
            dirs.push_back(name + "/");
        } else {
            files.push_back(name);
        }
    }
    std::sort(dirs.begin(), dirs.end());
    std::sort(files.begin(), files.end());

    std::vector<std::string> lines = {"../", "./"};
    lines.insert(lines.end(), dirs.begin(), dirs.end());
    lines.insert(lines.end(), files.begin(), files.end());
    return Result<std::vector<std::string>>::Ok(lines);
}

static Result<std::vector<std::string>> read_text_head(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        return Result<std::vector<std::string>>::Err("Cannot read " + file.string(),
                                                     ErrorKind::NoTarget);
    }
    std::vector<std::string> lines;
    std::string line;
    while (static_cast<int>(lines.size()) < TEXT_VIEW_MAX_LINES && std::getline(in, line)) {
        lines.push_back(line);
    }
    return Result<std::vector<std::string>>::Ok(lines);
}

Result<void> Browser::load(View& v, bool notify) {
    auto lines = (v.kind == ViewKind::Listing) ? list_directory(v.path) : read_text_head(v.path);
    if (lines.is_err()) return Result<void>::Err(lines.error, lines.kind);

    v.lines = std::move(lines.value);
    v.annotations.clear();
    int last = std::max(1, static_cast<int>(v.lines.size()));
    v.cursor = std::min(std::max(v.cursor, 1), last);

    if (notify && reload_listener_) reload_listener_(v.id);
    return Result<void>::Ok();
}

Result<ViewId> Browser::open(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec || !fs::exists(abs, ec)) {
        return Result<ViewId>::Err("No such file or directory: " + path.string(), ErrorKind::NoTarget);
    }

    View v;
    v.id = next_view_;
    v.kind = fs::is_directory(abs, ec) ? ViewKind::Listing : ViewKind::Text;
    v.path = abs.lexically_normal();
    // Listings start on the first entry, past ../ and ./
    v.cursor = (v.kind == ViewKind::Listing) ? 3 : 1;

    auto r = load(v, false);
    if (r.is_err()) return Result<ViewId>::Err(r.error, r.kind);

    ++next_view_;
    ViewId id = v.id;
    views_[id] = std::move(v);
    active_ = id;
    return Result<ViewId>::Ok(id);
}

View* Browser::active_view() {
    if (!active_) return nullptr;
    auto it = views_.find(*active_);
    return it == views_.end() ? nullptr : &it->second;
}

const View* Browser::active() const {
    if (!active_) return nullptr;
    return view(*active_);
}

const View* Browser::view(ViewId id) const {
    auto it = views_.find(id);
    return it == views_.end() ? nullptr : &it->second;
}

std::vector<ViewId> Browser::view_ids() const {
    std::vector<ViewId> ids;
    for (const auto& [id, v] : views_) ids.push_back(id);
    return ids;
}

Result<void> Browser::change_directory(const std::string& target) {
    View* v = active_view();
    if (!v || v->kind != ViewKind::Listing) {
        return Result<void>::Err("Not in a listing view", ErrorKind::NoTarget);
    }

    fs::path next = fs::path(target).is_absolute() ? fs::path(target) : v->path / target;
    next = next.lexically_normal();
    std::string s = next.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    next = s;

    std::error_code ec;
    if (!fs::is_directory(next, ec)) {
        return Result<void>::Err("Not a directory: " + next.string(), ErrorKind::NoTarget);
    }

    fs::path previous = v->path;
    int previous_cursor = v->cursor;
    v->path = next;
    v->cursor = 3;
    auto r = load(*v, true);
    if (r.is_err()) {
        v->path = previous;
        v->cursor = previous_cursor;
        return r;
    }
    return Result<void>::Ok();
}

Result<void> Browser::reload() {
    View* v = active_view();
    if (!v) return Result<void>::Err("No active view", ErrorKind::NoTarget);
    return load(*v, true);
}

Result<void> Browser::activate(ViewId id) {
    if (!views_.count(id)) {
        return Result<void>::Err(fmt::format("No view {}", id), ErrorKind::NoTarget);
    }
    active_ = id;
    return Result<void>::Ok();
}

Result<void> Browser::close(ViewId id) {
    auto it = views_.find(id);
    if (it == views_.end()) {
        return Result<void>::Err(fmt::format("No view {}", id), ErrorKind::NoTarget);
    }
    views_.erase(it);
    if (active_ && *active_ == id) {
        if (views_.empty()) {
            active_.reset();
        } else {
            active_ = views_.rbegin()->first;
        }
    }
    if (close_listener_) close_listener_(id);
    return Result<void>::Ok();
}

Result<void> Browser::move_cursor(int line) {
    View* v = active_view();
    if (!v) return Result<void>::Err("No active view", ErrorKind::NoTarget);
    int last = std::max(1, static_cast<int>(v->lines.size()));
    v->cursor = std::min(std::max(line, 1), last);
    return Result<void>::Ok();
}

Result<void> Browser::move_by(int delta) {
    View* v = active_view();
    if (!v) return Result<void>::Err("No active view", ErrorKind::NoTarget);
    return move_cursor(v->cursor + delta);
}

Result<void> Browser::find_entry(const std::string& name) {
    View* v = active_view();
    if (!v || v->kind != ViewKind::Listing) {
        return Result<void>::Err("Not in a listing view", ErrorKind::NoTarget);
    }
    for (size_t i = 0; i < v->lines.size(); ++i) {
        if (v->lines[i] == name || v->lines[i] == name + "/") {
            v->cursor = static_cast<int>(i) + 1;
            return Result<void>::Ok();
        }
    }
    return Result<void>::Err("No entry named " + name, ErrorKind::NoTarget);
}

std::set<int> Browser::annotated_lines(ViewId id) const {
    std::set<int> lines;
    const View* v = view(id);
    if (!v) return lines;
    for (const auto& [handle, line] : v->annotations) lines.insert(line);
    return lines;
}

std::optional<CursorContext> Browser::cursor_context() const {
    const View* v = active();
    if (!v || v->kind != ViewKind::Listing) return std::nullopt;

    CursorContext ctx;
    ctx.view = v->id;
    ctx.directory = v->path;
    ctx.line = v->cursor;
    ctx.column = 0;
    ctx.whole_entry = true;
    if (v->cursor >= 1 && v->cursor <= static_cast<int>(v->lines.size())) {
        ctx.line_text = v->lines[v->cursor - 1];
    }
    return ctx;
}

bool Browser::is_listing_view(ViewId id) const {
    const View* v = view(id);
    return v && v->kind == ViewKind::Listing;
}

std::vector<ViewId> Browser::listing_views() const {
    std::vector<ViewId> ids;
    for (const auto& [id, v] : views_) {
        if (v.kind == ViewKind::Listing) ids.push_back(id);
    }
    return ids;
}

AnnotationId Browser::add_annotation(ViewId id, int line) {
    auto it = views_.find(id);
    if (it == views_.end()) return -1;
    AnnotationId handle = next_annotation_++;
    it->second.annotations[handle] = line;
    return handle;
}

bool Browser::remove_annotation(ViewId id, AnnotationId handle) {
    auto it = views_.find(id);
    if (it == views_.end()) return false;
    return it->second.annotations.erase(handle) > 0;
}

void Browser::clear_annotations(ViewId id) {
    auto it = views_.find(id);
    if (it != views_.end()) it->second.annotations.clear();
}
