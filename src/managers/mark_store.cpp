#include "mark_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

MarkStore::MarkStore(AnnotationHost& host) : host_(host) {}

void MarkStore::drop_annotation(ViewId view, AnnotationId id) {
    if (!host_.remove_annotation(view, id)) {
        marksync_log(fmt::format("marks: stale annotation {} in view {}", id, view));
    }
}

ToggleOutcome MarkStore::toggle(const std::string& path, ViewId view, int line) {
    if (path.empty() || !host_.is_listing_view(view)) {
        return ToggleOutcome::NoTarget;
    }

    auto& lines = index_[view];
    auto occupant = lines.find(line);

    if (marks_.count(path)) {
        marks_.erase(path);
        if (occupant != lines.end()) {
            drop_annotation(view, occupant->second);
            lines.erase(occupant);
        }
        return ToggleOutcome::Unmarked;
    }

    marks_.insert(path);
    if (occupant != lines.end()) {
        drop_annotation(view, occupant->second);
        lines.erase(occupant);
    }
    AnnotationId id = host_.add_annotation(view, line);
    if (id >= 0) {
        lines[line] = id;
    } else {
        marksync_log(fmt::format("marks: could not annotate line {} in view {}", line, view));
    }
    return ToggleOutcome::Marked;
}

void MarkStore::clear_all() {
    marks_.clear();
    for (ViewId view : host_.listing_views()) {
        host_.clear_annotations(view);
    }
    // Tables of closed views go too
    index_.clear();
}

std::vector<std::string> MarkStore::snapshot() const {
    return std::vector<std::string>(marks_.begin(), marks_.end());
}

void MarkStore::on_view_reset(ViewId view) {
    host_.clear_annotations(view);
    index_.erase(view);
}

size_t MarkStore::annotation_count(ViewId view) const {
    auto it = index_.find(view);
    return it == index_.end() ? 0 : it->second.size();
}

std::vector<int> MarkStore::annotated_lines(ViewId view) const {
    std::vector<int> out;
    auto it = index_.find(view);
    if (it == index_.end()) return out;
    for (const auto& [line, id] : it->second) out.push_back(line);
    return out;
}
