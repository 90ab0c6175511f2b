#pragma once

#include <memory>
#include <string>
#include <vector>
#include "process.hpp"

namespace platform {

// A pseudo terminal that a child process runs attached to.
//
// The child sees the slave side as its controlling terminal (so ssh password
// prompts and rsync progress work as on a real tty); the parent reads output
// from and writes keystrokes to the master side.
class PtySurface {
public:
    // Allocate a pty of the given size. Returns nullptr on failure.
    static std::unique_ptr<PtySurface> open(int rows, int cols);

    ~PtySurface();

    PtySurface(const PtySurface&) = delete;
    PtySurface& operator=(const PtySurface&) = delete;

    // Fork and exec argv on the slave side. The slave descriptor is closed in
    // the parent afterwards, so reads on the master hit EOF/EIO once the child
    // (and anything it spawned) has exited. Returns an invalid handle on failure.
    ProcessHandle spawn(const std::vector<std::string>& argv);

    // Blocking read from the master side. Returns bytes read, 0 on EOF/EIO.
    int read(char* buf, int len);

    // Write keystrokes to the child. Returns false on failure.
    bool write(const std::string& bytes);

private:
    PtySurface(int master, int slave);

    int master_ = -1;
    int slave_ = -1;
};

} // namespace platform
