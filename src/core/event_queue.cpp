#include "event_queue.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>

EventQueue::EventQueue() {
    if (pipe(pipe_) != 0) {
        throw std::runtime_error(fmt::format("EventQueue: pipe failed: {}", std::strerror(errno)));
    }
    for (int fd : pipe_) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

EventQueue::~EventQueue() {
    for (int fd : pipe_) {
        if (fd >= 0) close(fd);
    }
}

void EventQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    // A full pipe already means "pending"; dropping the byte is fine.
    char b = 1;
    ssize_t n = write(pipe_[1], &b, 1);
    (void)n;
}

void EventQueue::clear_wakeups() {
    char buf[64];
    while (read(pipe_[0], buf, sizeof(buf)) > 0) {}
}

size_t EventQueue::drain() {
    size_t ran = 0;
    while (true) {
        std::deque<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clear_wakeups();
            batch.swap(tasks_);
        }
        if (batch.empty()) break;

        for (auto& task : batch) {
            try {
                task();
            } catch (const std::exception& e) {
                marksync_log(fmt::format("EventQueue: task threw: {}", e.what()));
            } catch (...) {
                marksync_log("EventQueue: task threw a non-standard exception");
            }
            ++ran;
        }
    }
    return ran;
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.empty();
}
