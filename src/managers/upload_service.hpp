#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/event_queue.hpp>
#include <core/notifier.hpp>
#include <listing/listing_host.hpp>
#include "mark_store.hpp"
#include "session_launcher.hpp"
#include "transfer_session.hpp"

// User-facing mark and upload operations.
//
// Every precondition is checked before anything is spawned; failures are
// reported through the notifier and returned with their ErrorKind.
class UploadService {
public:
    UploadService(Config config, MarkStore& marks, ListingHost& host,
                  SessionLauncher& launcher, EventQueue& events, Notifier& notifier);

    // Toggle the entry under the cursor of the active listing view.
    Result<void> toggle_mark();

    // rsync every marked path to the destination.
    Result<void> upload_marked();

    // Same, with --remove-source-files for this one run. On success, marked
    // directories left empty are removed and the marks are cleared.
    Result<void> upload_marked_remove();

    void clear_marks();

    Result<void> set_destination(const std::string& target);

    // Host hook: a view's listing was rebuilt.
    void on_view_reload(ViewId view);

    const Config& config() const { return config_; }
    const MarkStore& marks() const { return marks_; }

    // Most recent session (nullptr before the first upload).
    std::shared_ptr<TransferSession> session() const { return session_; }
    bool transfer_running() const;

    // Forward keystrokes to the running transfer.
    bool send_input(const std::string& bytes) { return launcher_.send_input(bytes); }

    // Where new sessions deliver their raw output.
    void set_output_sink(TransferSession::OutputSink sink) { output_sink_ = std::move(sink); }

private:
    Config config_;
    MarkStore& marks_;
    ListingHost& host_;
    SessionLauncher& launcher_;
    EventQueue& events_;
    Notifier& notifier_;
    std::shared_ptr<TransferSession> session_;
    TransferSession::OutputSink output_sink_;

    Result<std::vector<std::string>> check_ready();
    Result<void> start_transfer(const Config& config, const std::vector<std::string>& paths,
                                TransferSession::SuccessCallback on_success);
    Result<void> fail(ErrorKind kind, const std::string& msg, Severity severity);
};

// Remove each directory that still exists and is empty, deepest (longest
// path) first so emptied parents are removed after their children.
// Failures are skipped. Returns the removed directories in removal order.
std::vector<std::string> remove_empty_directories(std::vector<std::string> dirs);
