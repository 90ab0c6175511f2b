#include "pty_surface.hpp"

#include <pty.h>
#include <utmp.h>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <cerrno>

namespace platform {

std::unique_ptr<PtySurface> PtySurface::open(int rows, int cols) {
    struct winsize ws = {};
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);

    int master = -1, slave = -1;
    if (openpty(&master, &slave, nullptr, nullptr, &ws) != 0) {
        return nullptr;
    }
    fcntl(master, F_SETFD, FD_CLOEXEC);
    return std::unique_ptr<PtySurface>(new PtySurface(master, slave));
}

PtySurface::PtySurface(int master, int slave)
    : master_(master), slave_(slave) {}

PtySurface::~PtySurface() {
    if (slave_ >= 0) close(slave_);
    if (master_ >= 0) close(master_);
}

ProcessHandle PtySurface::spawn(const std::vector<std::string>& argv) {
    ProcessHandle handle;
    if (slave_ < 0 || argv.empty()) return handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child: new session with the slave as controlling terminal and stdio
        close(master_);
        if (login_tty(slave_) != 0) _exit(127);
        exec_or_die(argv);
    }

    // Parent
    close(slave_);
    slave_ = -1;
    handle.pid_ = pid;
    return handle;
}

int PtySurface::read(char* buf, int len) {
    while (true) {
        ssize_t n = ::read(master_, buf, static_cast<size_t>(len));
        if (n >= 0) return static_cast<int>(n);
        if (errno == EINTR) continue;
        return 0;  // EIO once the slave side is gone
    }
}

bool PtySurface::write(const std::string& bytes) {
    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(master_, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // namespace platform
