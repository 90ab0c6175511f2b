#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "listing_host.hpp"

enum class ViewKind {
    Listing,   // directory listing: "../", "./", then entries ("name/" for dirs)
    Text,      // first lines of a regular file
};

struct View {
    ViewId id = 0;
    ViewKind kind = ViewKind::Listing;
    std::filesystem::path path;
    std::vector<std::string> lines;
    int cursor = 1;                               // 1-based
    std::map<AnnotationId, int> annotations;      // handle -> line
};

// In-process directory browser with any number of simultaneous views.
// One view is active at a time; cursor commands act on it.
class Browser : public ListingHost {
public:
    using ViewListener = std::function<void(ViewId)>;

    Browser() = default;

    // Open a new view on a directory (listing) or file (text) and activate it.
    Result<ViewId> open(const std::filesystem::path& path);

    // Active listing: enter a directory relative to the listed one.
    Result<void> change_directory(const std::string& target);

    // Re-read the active view from disk.
    Result<void> reload();

    Result<void> activate(ViewId id);
    Result<void> close(ViewId id);

    Result<void> move_cursor(int line);
    Result<void> move_by(int delta);
    // Put the cursor on the listing line whose entry is `name` (or `name/`).
    Result<void> find_entry(const std::string& name);

    // Called after a view's content was rebuilt and its annotations dropped.
    void on_reload(ViewListener listener) { reload_listener_ = std::move(listener); }
    // Called after a view was closed.
    void on_close(ViewListener listener) { close_listener_ = std::move(listener); }

    const View* view(ViewId id) const;
    const View* active() const;
    std::vector<ViewId> view_ids() const;
    std::set<int> annotated_lines(ViewId id) const;

    // ListingHost
    std::optional<CursorContext> cursor_context() const override;
    FilenameCharset& filename_charset() override { return charset_; }

    // AnnotationHost
    bool is_listing_view(ViewId view) const override;
    std::vector<ViewId> listing_views() const override;
    AnnotationId add_annotation(ViewId view, int line) override;
    bool remove_annotation(ViewId view, AnnotationId id) override;
    void clear_annotations(ViewId view) override;

private:
    std::map<ViewId, View> views_;
    std::optional<ViewId> active_;
    ViewId next_view_ = 1;
    AnnotationId next_annotation_ = 1;
    FilenameCharset charset_;
    ViewListener reload_listener_;
    ViewListener close_listener_;

    View* active_view();
    // Rebuild lines from disk, drop annotations, clamp the cursor, notify.
    Result<void> load(View& v, bool notify);
};
