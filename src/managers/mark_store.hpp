#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <listing/listing_host.hpp>

enum class ToggleOutcome {
    Marked,
    Unmarked,
    NoTarget,   // view is gone or not a listing; nothing changed
};

// Marked absolute paths plus, per view, which line carries which annotation.
//
// The mark set is shared by every view: a path marked in one listing is
// marked in all of them. Annotations are per view and purely visual; a
// failure to remove one never blocks a change of the mark set.
class MarkStore {
public:
    explicit MarkStore(AnnotationHost& host);

    ToggleOutcome toggle(const std::string& path, ViewId view, int line);

    // Empty the mark set and clear annotations in every live listing view.
    void clear_all();

    // Sorted ascending, no duplicates.
    std::vector<std::string> snapshot() const;

    // The view's listing was rebuilt: forget its annotations. Marks stay.
    void on_view_reset(ViewId view);

    bool contains(const std::string& path) const { return marks_.count(path) > 0; }
    size_t size() const { return marks_.size(); }
    bool empty() const { return marks_.empty(); }

    size_t annotation_count(ViewId view) const;
    std::vector<int> annotated_lines(ViewId view) const;

private:
    AnnotationHost& host_;
    std::set<std::string> marks_;
    std::map<ViewId, std::map<int, AnnotationId>> index_;   // view -> line -> handle

    void drop_annotation(ViewId view, AnnotationId id);
};
