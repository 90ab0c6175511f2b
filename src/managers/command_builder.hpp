#pragma once

#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>

// An rsync invocation. argv is executed directly (no shell involved);
// render() is the equivalent shell command line with every word quoted.
struct TransferCommand {
    std::vector<std::string> argv;

    std::string render() const;
};

// Returns true if the named program can be found on PATH.
using ProgramLocator = std::function<bool(const std::string&)>;

// True for -a/--archive or a short cluster containing 'a' (e.g. -avhP).
bool is_archive_flag(const std::string& flag);

// True for -r/--recursive or a short cluster containing 'r'.
bool is_recursive_flag(const std::string& flag);

// Drop blank entries and prefix a dash where one is missing.
std::vector<std::string> normalize_base_flags(const std::vector<std::string>& flags);

// "ssh <arg>..." with each arg quoted for rsync's own splitting of -e.
std::string remote_shell_command(const std::vector<std::string>& transport_args);

// Build the rsync command for `paths` (sorted into the command) and the
// configured destination. Fails with ToolNotFound if rsync is not on PATH.
// An empty path list is the caller's concern.
Result<TransferCommand> build_transfer_command(const std::vector<std::string>& paths,
                                               const TransferConfig& config,
                                               const ProgramLocator& locate);
