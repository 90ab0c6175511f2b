#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <platform/pty_surface.hpp>
#include "session_launcher.hpp"

// SessionLauncher backed by a pseudo terminal sized to a fraction of the
// controlling terminal. One reader thread per launch drains the pty and then
// reaps the child.
class PtyLauncher : public SessionLauncher {
public:
    PtyLauncher() = default;
    ~PtyLauncher() override;

    bool program_available(const std::string& program) const override;

    Result<void> launch(const std::vector<std::string>& argv,
                        OutputCallback on_output,
                        ExitCallback on_exit) override;

    bool send_input(const std::string& bytes) override;

private:
    struct Entry {
        std::unique_ptr<platform::PtySurface> surface;
        platform::ProcessHandle proc;
        std::thread thread;
        bool finished = false;
    };
    std::unique_ptr<Entry> current_;
    std::mutex mutex_;

    static void reader_thread(Entry* entry, std::mutex* mutex,
                              OutputCallback on_output, ExitCallback on_exit);
    void join_current();
};
