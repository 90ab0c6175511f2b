#pragma once

#include <string>
#include <vector>

// Failure categories surfaced by the core. None means success.
enum class ErrorKind {
    None,
    NoTarget,            // cursor/context has nothing to act on
    DestinationUnset,    // destination empty or still the placeholder
    NothingMarked,       // empty selection
    ToolNotFound,        // transfer executable missing from PATH
    TransferFailed,      // non-zero exit from the transfer tool
    SurfaceUnavailable,  // could not allocate the pty / spawn the child
    Busy,                // a transfer session is still running
    InvalidConfig,       // configuration could not be loaded
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::InvalidConfig) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::InvalidConfig) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Transfer settings as read from config.yaml
struct TransferConfig {
    std::string destination;
    std::vector<std::string> transport_args;     // remote-shell args: rsync -e 'ssh <args...>'
    std::vector<std::string> base_flags;
    bool preserve_relative_paths = false;        // pass --relative
    std::vector<std::string> extra_flags;
    bool install_default_keybindings = true;
};

// One-shot additions applied to a copy of the config for a single upload
struct TransferOverrides {
    std::vector<std::string> extra_flags;
};
