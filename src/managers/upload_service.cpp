#include "upload_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

UploadService::UploadService(Config config, MarkStore& marks, ListingHost& host,
                             SessionLauncher& launcher, EventQueue& events, Notifier& notifier)
    : config_(std::move(config)), marks_(marks), host_(host),
      launcher_(launcher), events_(events), notifier_(notifier) {}

Result<void> UploadService::fail(ErrorKind kind, const std::string& msg, Severity severity) {
    marksync_log(fmt::format("upload: {}: {}", error_kind_name(kind), msg));
    notifier_.notify(msg, severity);
    return Result<void>::Err(msg, kind);
}

// ── Marks ──────────────────────────────────────────────────

Result<void> UploadService::toggle_mark() {
    auto ctx = host_.cursor_context();
    if (!ctx) {
        return fail(ErrorKind::NoTarget, "Not in a listing view", Severity::Warning);
    }

    auto path = ctx->whole_entry
        ? resolve_entry_name(ctx->directory, ctx->line_text)
        : resolve_entry(ctx->directory, ctx->line_text, ctx->column, host_.filename_charset());
    if (!path) {
        return fail(ErrorKind::NoTarget, "No file under cursor", Severity::Warning);
    }

    switch (marks_.toggle(*path, ctx->view, ctx->line)) {
        case ToggleOutcome::Marked:
            notifier_.notify("Marked: " + *path, Severity::Info);
            break;
        case ToggleOutcome::Unmarked:
            notifier_.notify("Unmarked: " + *path, Severity::Info);
            break;
        case ToggleOutcome::NoTarget:
            return fail(ErrorKind::NoTarget, "Not in a listing view", Severity::Warning);
    }
    return Result<void>::Ok();
}

void UploadService::clear_marks() {
    marks_.clear_all();
    notifier_.notify("Cleared all marks", Severity::Info);
}

void UploadService::on_view_reload(ViewId view) {
    marks_.on_view_reset(view);
}

Result<void> UploadService::set_destination(const std::string& target) {
    std::string dest = target;
    trim(dest);
    if (dest.empty()) {
        notifier_.notify("Usage: set-destination user@host:/path/to/destination/", Severity::Info);
        return Result<void>::Err("empty destination", ErrorKind::DestinationUnset);
    }
    config_ = config_.with_destination(dest);
    notifier_.notify("Rsync destination set to: " + dest, Severity::Info);
    return Result<void>::Ok();
}

// ── Upload ─────────────────────────────────────────────────

bool UploadService::transfer_running() const {
    return session_ && session_->state() == SessionState::Running;
}

Result<std::vector<std::string>> UploadService::check_ready() {
    using R = Result<std::vector<std::string>>;

    if (!config_.destination_is_set()) {
        auto r = fail(ErrorKind::DestinationUnset,
                      "Rsync destination not set! Use set-destination", Severity::Error);
        return R::Err(r.error, r.kind);
    }

    auto paths = marks_.snapshot();
    if (paths.empty()) {
        auto r = fail(ErrorKind::NothingMarked, "No marked files to upload", Severity::Warning);
        return R::Err(r.error, r.kind);
    }

    if (transfer_running()) {
        auto r = fail(ErrorKind::Busy, "A transfer is still running", Severity::Warning);
        return R::Err(r.error, r.kind);
    }
    return R::Ok(paths);
}

Result<void> UploadService::start_transfer(const Config& config,
                                           const std::vector<std::string>& paths,
                                           TransferSession::SuccessCallback on_success) {
    auto locate = [this](const std::string& program) {
        return launcher_.program_available(program);
    };
    auto command = build_transfer_command(paths, config.transfer(), locate);
    if (command.is_err()) {
        return fail(command.kind, command.error, Severity::Error);
    }
    marksync_log("upload: " + command.value.render());

    auto session = std::make_shared<TransferSession>(launcher_, events_, notifier_);
    session->set_output_sink(output_sink_);
    session_ = session;

    if (session->run(command.value, std::move(on_success)) != SessionState::Running) {
        // The session already reported why
        return Result<void>::Err("transfer could not be started", ErrorKind::SurfaceUnavailable);
    }
    notifier_.notify(fmt::format("Uploading {} path(s) to {}", paths.size(),
                                 config.transfer().destination), Severity::Info);
    return Result<void>::Ok();
}

Result<void> UploadService::upload_marked() {
    auto paths = check_ready();
    if (paths.is_err()) return Result<void>::Err(paths.error, paths.kind);
    return start_transfer(config_, paths.value, nullptr);
}

Result<void> UploadService::upload_marked_remove() {
    auto paths = check_ready();
    if (paths.is_err()) return Result<void>::Err(paths.error, paths.kind);

    // Which marks are directories has to be known before rsync empties them
    std::vector<std::string> dirs;
    for (const auto& p : paths.value) {
        std::error_code ec;
        if (fs::is_directory(p, ec)) dirs.push_back(p);
    }

    TransferOverrides once;
    once.extra_flags.push_back(REMOVE_SOURCE_FLAG);
    Config one_shot = config_.with_overrides(once);

    return start_transfer(one_shot, paths.value, [this, dirs]() {
        auto removed = remove_empty_directories(dirs);
        if (!removed.empty()) {
            std::string msg = "Removed empty directories:";
            for (const auto& d : removed) msg += "\n  " + d;
            notifier_.notify(msg, Severity::Info);
        }
        clear_marks();
    });
}

// ── Cleanup ────────────────────────────────────────────────

std::vector<std::string> remove_empty_directories(std::vector<std::string> dirs) {
    std::sort(dirs.begin(), dirs.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a > b;
    });
    dirs.erase(std::unique(dirs.begin(), dirs.end()), dirs.end());

    std::vector<std::string> removed;
    for (const auto& d : dirs) {
        std::error_code ec;
        if (!fs::is_directory(d, ec)) continue;
        if (!fs::is_empty(d, ec) || ec) continue;
        if (fs::remove(d, ec) && !ec) {
            removed.push_back(d);
        } else {
            marksync_log(fmt::format("cleanup: could not remove {}: {}", d, ec.message()));
        }
    }
    marksync_log(fmt::format("cleanup: removed {} of {} directories", removed.size(), dirs.size()));
    return removed;
}
