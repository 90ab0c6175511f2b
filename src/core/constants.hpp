#pragma once

#include <cstddef>

// ── Transfer tool ───────────────────────────────────────────
constexpr const char* TRANSFER_PROGRAM       = "rsync";
constexpr const char* REMOTE_SHELL_PROGRAM   = "ssh";
constexpr const char* RECURSIVE_FLAG         = "-r";
constexpr const char* RELATIVE_FLAG          = "--relative";
constexpr const char* REMOVE_SOURCE_FLAG     = "--remove-source-files";
constexpr const char* REMOTE_SHELL_FLAG      = "-e";

// Shipped in the default config; uploads refuse to run while it is still set.
constexpr const char* PLACEHOLDER_DESTINATION =
    "destination_user@destination_host:/path/to/destination/";

// ── Capture surface ─────────────────────────────────────────
constexpr double SURFACE_WIDTH_RATIO   = 0.9;   // fraction of terminal columns
constexpr double SURFACE_HEIGHT_RATIO  = 0.8;   // fraction of terminal rows
constexpr int SURFACE_MIN_COLS         = 20;
constexpr int SURFACE_MIN_ROWS         = 5;
constexpr int SURFACE_READ_BUF_SIZE    = 4096;
constexpr size_t TRANSCRIPT_MAX_BYTES  = 256 * 1024;
constexpr int TRANSCRIPT_TAIL_LINES    = 20;

// ── Listing ─────────────────────────────────────────────────
constexpr const char* MARK_GLYPH       = " \xe2\x97\x8f";   // " ●"
constexpr int TEXT_VIEW_MAX_LINES      = 200;

// Characters temporarily accepted as part of a filename under the cursor
// (space & ( ) , ; = [ ] { }).
constexpr const char* FILENAME_EXTRA_CHARS = " &(),;=[]{}";

// ── Default key bindings ────────────────────────────────────
constexpr const char* KEY_TOGGLE_MARK       = "mm";
constexpr const char* KEY_UPLOAD            = "mu";
constexpr const char* KEY_CLEAR_MARKS       = "mC";
constexpr const char* KEY_UPLOAD_REMOVE     = "mU";

// ── Main loop ───────────────────────────────────────────────
constexpr int ATTACH_POLL_MS           = 100;
constexpr char ATTACH_DETACH_KEY       = 0x1d;   // Ctrl-]
