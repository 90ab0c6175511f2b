#include "pty_launcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <signal.h>

PtyLauncher::~PtyLauncher() {
    std::unique_ptr<Entry> entry;
    bool finished = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = std::move(current_);
        if (entry) finished = entry->finished;
    }
    if (!entry) return;
    // Hang up the whole session; the reader thread reaps the child
    if (!finished && entry->proc.valid()) {
        kill(-entry->proc.native_handle(), SIGHUP);
        kill(entry->proc.native_handle(), SIGTERM);
    }
    if (entry->thread.joinable()) entry->thread.join();
}

bool PtyLauncher::program_available(const std::string& program) const {
    return platform::find_executable(program).has_value();
}

void PtyLauncher::join_current() {
    std::unique_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry = std::move(current_);
    }
    if (entry && entry->thread.joinable()) entry->thread.join();
}

Result<void> PtyLauncher::launch(const std::vector<std::string>& argv,
                                 OutputCallback on_output,
                                 ExitCallback on_exit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && !current_->finished) {
            return Result<void>::Err("A transfer is already running", ErrorKind::Busy);
        }
    }
    join_current();

    int cols = std::max(SURFACE_MIN_COLS,
                        static_cast<int>(platform::term_width() * SURFACE_WIDTH_RATIO));
    int rows = std::max(SURFACE_MIN_ROWS,
                        static_cast<int>(platform::term_height() * SURFACE_HEIGHT_RATIO));

    auto surface = platform::PtySurface::open(rows, cols);
    if (!surface) {
        return Result<void>::Err("Could not allocate a terminal for the transfer",
                                 ErrorKind::SurfaceUnavailable);
    }

    auto proc = surface->spawn(argv);
    if (!proc.valid()) {
        return Result<void>::Err("Could not start " + (argv.empty() ? std::string("?") : argv[0]),
                                 ErrorKind::SurfaceUnavailable);
    }
    marksync_log(fmt::format("PtyLauncher: pid {} on {}x{} pty: {}",
                             proc.native_handle(), cols, rows, shell_join(argv)));

    auto entry = std::make_unique<Entry>();
    entry->surface = std::move(surface);
    entry->proc = std::move(proc);
    auto* raw = entry.get();

    std::lock_guard<std::mutex> lock(mutex_);
    entry->thread = std::thread(&PtyLauncher::reader_thread, raw, &mutex_,
                                std::move(on_output), std::move(on_exit));
    current_ = std::move(entry);
    return Result<void>::Ok();
}

void PtyLauncher::reader_thread(Entry* entry, std::mutex* mutex,
                                OutputCallback on_output, ExitCallback on_exit) {
    char buf[SURFACE_READ_BUF_SIZE];
    while (true) {
        int n = entry->surface->read(buf, sizeof(buf));
        if (n <= 0) break;
        if (on_output) on_output(std::string(buf, static_cast<size_t>(n)));
    }

    int code = entry->proc.wait();
    marksync_log(fmt::format("PtyLauncher: pid {} exited with {}",
                             entry->proc.native_handle(), code));
    {
        std::lock_guard<std::mutex> lock(*mutex);
        entry->finished = true;
    }
    if (on_exit) on_exit(code);
}

bool PtyLauncher::send_input(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_ || current_->finished) return false;
    return current_->surface->write(bytes);
}
