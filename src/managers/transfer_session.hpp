#pragma once

#include <memory>
#include <string>
#include <functional>
#include <core/event_queue.hpp>
#include <core/notifier.hpp>
#include "command_builder.hpp"
#include "session_launcher.hpp"
#include "session_transcript.hpp"

enum class SessionState {
    Idle,
    Launching,
    Running,
    Succeeded,
    Failed,
};

const char* session_state_name(SessionState state);

// One supervised run of the transfer tool, from spawn to exit.
//
// run() returns as soon as the process is started. Output and the exit code
// arrive through the EventQueue, so everything below runs on the thread that
// drains it: the outcome notification first, then on_success (exit 0 only,
// exactly once, exceptions caught and reported).
//
// Sessions must be owned by a shared_ptr; pending callbacks keep them alive.
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
    using SuccessCallback = std::function<void()>;
    using OutputSink = std::function<void(const std::string&)>;

    TransferSession(SessionLauncher& launcher, EventQueue& events, Notifier& notifier);

    // Returns Running, or Failed when nothing could be spawned.
    SessionState run(const TransferCommand& command, SuccessCallback on_success = nullptr);

    // Receives raw surface output on the draining thread.
    void set_output_sink(OutputSink sink) { output_sink_ = std::move(sink); }

    SessionState state() const { return state_; }
    bool finished() const { return state_ == SessionState::Succeeded || state_ == SessionState::Failed; }
    int exit_code() const { return exit_code_; }
    const SessionTranscript& transcript() const { return transcript_; }
    const TransferCommand& command() const { return command_; }

private:
    SessionLauncher& launcher_;
    EventQueue& events_;
    Notifier& notifier_;

    SessionState state_ = SessionState::Idle;
    int exit_code_ = -1;
    TransferCommand command_;
    SuccessCallback on_success_;
    OutputSink output_sink_;
    SessionTranscript transcript_;

    void handle_output(const std::string& chunk);
    void finish(int code);
};
