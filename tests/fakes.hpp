#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <utility>
#include <listing/listing_host.hpp>
#include <managers/session_launcher.hpp>
#include <core/notifier.hpp>

// Listing host with scripted views and a settable cursor.
class FakeHost : public ListingHost {
public:
    struct FakeView {
        bool listing = true;
        std::map<AnnotationId, int> annotations;
    };

    std::map<ViewId, FakeView> views;
    std::optional<CursorContext> cursor;
    FilenameCharset charset;
    AnnotationId next_id = 1;
    bool fail_add = false;
    int clear_calls = 0;

    void add_view(ViewId id, bool listing = true) { views[id].listing = listing; }

    void point_at(ViewId view, const std::string& dir, const std::string& text,
                  int line, size_t column = 0, bool whole_entry = false) {
        CursorContext ctx;
        ctx.view = view;
        ctx.directory = dir;
        ctx.line_text = text;
        ctx.line = line;
        ctx.column = column;
        ctx.whole_entry = whole_entry;
        cursor = ctx;
    }

    std::set<int> lines_of(ViewId view) const {
        std::set<int> out;
        auto it = views.find(view);
        if (it == views.end()) return out;
        for (const auto& [id, line] : it->second.annotations) out.insert(line);
        return out;
    }

    size_t annotations_in(ViewId view) const {
        auto it = views.find(view);
        return it == views.end() ? 0 : it->second.annotations.size();
    }

    std::optional<CursorContext> cursor_context() const override { return cursor; }
    FilenameCharset& filename_charset() override { return charset; }

    bool is_listing_view(ViewId view) const override {
        auto it = views.find(view);
        return it != views.end() && it->second.listing;
    }

    std::vector<ViewId> listing_views() const override {
        std::vector<ViewId> out;
        for (const auto& [id, v] : views) {
            if (v.listing) out.push_back(id);
        }
        return out;
    }

    AnnotationId add_annotation(ViewId view, int line) override {
        if (fail_add || !is_listing_view(view)) return -1;
        AnnotationId id = next_id++;
        views[view].annotations[id] = line;
        return id;
    }

    bool remove_annotation(ViewId view, AnnotationId id) override {
        auto it = views.find(view);
        if (it == views.end()) return false;
        return it->second.annotations.erase(id) > 0;
    }

    void clear_annotations(ViewId view) override {
        ++clear_calls;
        auto it = views.find(view);
        if (it != views.end()) it->second.annotations.clear();
    }
};

// Launcher that records argv and lets the test decide when the run ends.
class FakeLauncher : public SessionLauncher {
public:
    std::set<std::string> available = {"rsync"};
    bool fail_launch = false;
    std::vector<std::vector<std::string>> launches;
    std::vector<std::string> input;
    OutputCallback on_output;
    ExitCallback on_exit;
    bool running = false;

    bool program_available(const std::string& program) const override {
        return available.count(program) > 0;
    }

    Result<void> launch(const std::vector<std::string>& argv,
                        OutputCallback out, ExitCallback exit) override {
        if (fail_launch) {
            return Result<void>::Err("could not open a terminal", ErrorKind::SurfaceUnavailable);
        }
        launches.push_back(argv);
        on_output = std::move(out);
        on_exit = std::move(exit);
        running = true;
        return Result<void>::Ok();
    }

    bool send_input(const std::string& bytes) override {
        if (!running) return false;
        input.push_back(bytes);
        return true;
    }

    void emit(const std::string& chunk) { on_output(chunk); }

    void exit_with(int code) {
        running = false;
        on_exit(code);
    }
};

class RecordingNotifier : public Notifier {
public:
    std::vector<std::pair<std::string, Severity>> messages;

    void notify(const std::string& message, Severity severity) override {
        messages.emplace_back(message, severity);
    }

    bool saw(const std::string& text) const {
        for (const auto& m : messages) {
            if (m.first.find(text) != std::string::npos) return true;
        }
        return false;
    }

    Severity last_severity() const { return messages.back().second; }
    const std::string& last() const { return messages.back().first; }
};
