#pragma once

#include <string>
#include <vector>

namespace platform {

// Owning handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process was successfully spawned and not yet reaped.
    bool valid() const;

    // Block until the process exits. Returns the exit code, or -1 if it was
    // killed by a signal.
    int wait();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);

    friend class PtySurface;
};

// Replace the current (child) process image with argv[0], searched on PATH.
// Only returns by calling _exit(127) when exec fails.
[[noreturn]] void exec_or_die(const std::vector<std::string>& argv);

} // namespace platform
