#pragma once

#include <deque>
#include <functional>
#include <mutex>

// Tasks posted from any thread, run on the main thread by drain().
//
// wait_fd() becomes readable whenever tasks are pending, so the main loop can
// poll it alongside stdin instead of blocking in readline.
class EventQueue {
public:
    using Task = std::function<void()>;

    EventQueue();
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Thread-safe. Tasks run in the order they were posted.
    void post(Task task);

    // Run every task pending at the time of the call (plus any they post).
    // Exceptions escaping a task are logged and do not stop the drain.
    // Returns the number of tasks run.
    size_t drain();

    bool empty() const;
    int wait_fd() const { return pipe_[0]; }

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
    int pipe_[2] = {-1, -1};

    void clear_wakeups();
};
