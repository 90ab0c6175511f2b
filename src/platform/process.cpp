#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    int status;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret != pid_) return -1;
    record_status(status);
    return exit_code_;
}

// ── exec ─────────────────────────────────────────────────────

void exec_or_die(const std::vector<std::string>& argv) {
    if (argv.empty()) _exit(127);

    std::vector<const char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(a.c_str());
    cargv.push_back(nullptr);

    execvp(cargv[0], const_cast<char* const*>(cargv.data()));
    _exit(127);  // exec failed
}

} // namespace platform
