#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "path_resolver.hpp"

using ViewId = int;
using AnnotationId = int;

// Visual annotations on the lines of host views. Annotations never change the
// line text; they are drawn next to it.
class AnnotationHost {
public:
    virtual ~AnnotationHost() = default;

    // True if the view exists and shows a directory listing.
    virtual bool is_listing_view(ViewId view) const = 0;

    // All live listing views.
    virtual std::vector<ViewId> listing_views() const = 0;

    // Place an annotation on a 1-based line. Returns a negative id on failure.
    virtual AnnotationId add_annotation(ViewId view, int line) = 0;

    // Returns false for a stale or unknown handle.
    virtual bool remove_annotation(ViewId view, AnnotationId id) = 0;

    // Drop every annotation of the view in one pass.
    virtual void clear_annotations(ViewId view) = 0;
};

// What is under the cursor of the active listing view.
struct CursorContext {
    ViewId view = 0;
    std::filesystem::path directory;
    std::string line_text;
    int line = 0;          // 1-based
    size_t column = 0;     // 0-based byte offset
    bool whole_entry = false;   // line_text is exactly one entry name
};

// The directory-listing engine as seen by the mark/upload core.
class ListingHost : public AnnotationHost {
public:
    // nullopt when there is no active view or it is not a listing.
    virtual std::optional<CursorContext> cursor_context() const = 0;

    // Characters the host treats as part of a filename.
    virtual FilenameCharset& filename_charset() = 0;
};
