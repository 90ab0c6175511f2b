#include "transfer_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:      return "idle";
        case SessionState::Launching: return "launching";
        case SessionState::Running:   return "running";
        case SessionState::Succeeded: return "succeeded";
        case SessionState::Failed:    return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(SessionLauncher& launcher, EventQueue& events, Notifier& notifier)
    : launcher_(launcher), events_(events), notifier_(notifier),
      transcript_(TRANSCRIPT_MAX_BYTES) {}

SessionState TransferSession::run(const TransferCommand& command, SuccessCallback on_success) {
    if (state_ != SessionState::Idle) {
        marksync_log("TransferSession: run() called twice, ignored");
        return state_;
    }

    state_ = SessionState::Launching;
    command_ = command;
    on_success_ = std::move(on_success);
    marksync_log("TransferSession: launching " + command_.render());

    auto self = shared_from_this();
    auto result = launcher_.launch(
        command_.argv,
        [self](const std::string& chunk) {
            self->events_.post([self, chunk] { self->handle_output(chunk); });
        },
        [self](int code) {
            self->events_.post([self, code] { self->finish(code); });
        });

    if (result.is_err()) {
        state_ = SessionState::Failed;
        exit_code_ = -1;
        on_success_ = nullptr;
        marksync_log("TransferSession: launch failed: " + result.error);
        notifier_.notify(result.error, Severity::Error);
        return state_;
    }

    state_ = SessionState::Running;
    return state_;
}

void TransferSession::handle_output(const std::string& chunk) {
    transcript_.append(chunk);
    if (output_sink_) output_sink_(chunk);
}

void TransferSession::finish(int code) {
    if (state_ != SessionState::Running) return;
    exit_code_ = code;

    if (code != 0) {
        state_ = SessionState::Failed;
        on_success_ = nullptr;
        std::string msg = fmt::format("{} exited with code {}", TRANSFER_PROGRAM, code);
        transcript_.append_line("[ERROR] " + msg);
        marksync_log("TransferSession: " + msg);
        notifier_.notify(msg, Severity::Error);
        return;
    }

    state_ = SessionState::Succeeded;
    std::string msg = fmt::format("{} completed successfully", TRANSFER_PROGRAM);
    transcript_.append_line("[DONE] " + msg);
    marksync_log("TransferSession: " + msg);
    notifier_.notify(msg, Severity::Info);

    SuccessCallback callback = std::move(on_success_);
    on_success_ = nullptr;
    if (!callback) return;
    try {
        callback();
    } catch (const std::exception& e) {
        marksync_log(fmt::format("TransferSession: post-transfer step threw: {}", e.what()));
        notifier_.notify(fmt::format("Post-transfer step failed: {}", e.what()), Severity::Error);
    } catch (...) {
        marksync_log("TransferSession: post-transfer step threw a non-standard exception");
        notifier_.notify("Post-transfer step failed: unknown error", Severity::Error);
    }
}
