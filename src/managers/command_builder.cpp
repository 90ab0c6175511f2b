#include "command_builder.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string TransferCommand::render() const {
    return shell_join(argv);
}

static bool is_short_cluster(const std::string& flag) {
    return flag.size() >= 2 && flag[0] == '-' && flag[1] != '-';
}

bool is_archive_flag(const std::string& flag) {
    if (flag == "--archive") return true;
    return is_short_cluster(flag) && flag.find('a', 1) != std::string::npos;
}

bool is_recursive_flag(const std::string& flag) {
    if (flag == "--recursive") return true;
    return is_short_cluster(flag) && flag.find('r', 1) != std::string::npos;
}

std::vector<std::string> normalize_base_flags(const std::vector<std::string>& flags) {
    std::vector<std::string> out;
    for (auto flag : flags) {
        trim(flag);
        if (flag.empty()) continue;
        if (flag[0] != '-') flag = "-" + flag;
        out.push_back(flag);
    }
    return out;
}

std::string remote_shell_command(const std::vector<std::string>& transport_args) {
    std::string cmd = REMOTE_SHELL_PROGRAM;
    for (const auto& arg : transport_args) {
        cmd += " " + shell_quote(arg);
    }
    return cmd;
}

static bool any_directory(const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        std::error_code ec;
        if (fs::is_directory(p, ec)) return true;
    }
    return false;
}

Result<TransferCommand> build_transfer_command(const std::vector<std::string>& paths,
                                               const TransferConfig& config,
                                               const ProgramLocator& locate) {
    if (!locate || !locate(TRANSFER_PROGRAM)) {
        return Result<TransferCommand>::Err(
            fmt::format("{} not found on PATH", TRANSFER_PROGRAM), ErrorKind::ToolNotFound);
    }

    TransferCommand cmd;
    cmd.argv.push_back(TRANSFER_PROGRAM);

    auto base = normalize_base_flags(config.base_flags);
    cmd.argv.insert(cmd.argv.end(), base.begin(), base.end());

    std::vector<std::string> extra;
    for (const auto& flag : config.extra_flags) {
        if (!flag.empty()) extra.push_back(flag);
    }

    // Directories without -a/-r would be skipped silently by rsync
    if (any_directory(paths)) {
        auto recurses = [](const std::string& f) { return is_archive_flag(f) || is_recursive_flag(f); };
        bool has_recursion = std::any_of(base.begin(), base.end(), recurses) ||
                             std::any_of(extra.begin(), extra.end(), recurses);
        if (!has_recursion) cmd.argv.push_back(RECURSIVE_FLAG);
    }

    if (config.preserve_relative_paths) cmd.argv.push_back(RELATIVE_FLAG);

    cmd.argv.insert(cmd.argv.end(), extra.begin(), extra.end());

    if (!config.transport_args.empty()) {
        cmd.argv.push_back(REMOTE_SHELL_FLAG);
        cmd.argv.push_back(remote_shell_command(config.transport_args));
    }

    std::vector<std::string> sorted = paths;
    std::sort(sorted.begin(), sorted.end());
    cmd.argv.insert(cmd.argv.end(), sorted.begin(), sorted.end());

    cmd.argv.push_back(config.destination);
    return Result<TransferCommand>::Ok(cmd);
}
