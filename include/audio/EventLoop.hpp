#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

// Single-threaded cooperative run loop.
//
// run() blocks the calling thread and executes posted tasks and periodic
// timers on it, one at a time, until quit() is called. Anything running on
// the loop may therefore mutate shared session state without locking.
//
//   post()  : any thread (audio callback thread included)
//   quit()  : any thread, idempotent; tasks still queued are discarded
//   addTimer() / clearTimers(): before run() or from inside a loop callback
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    void addTimer(std::chrono::milliseconds period, Task callback);
    void clearTimers() { timers_.clear(); }
    size_t timerCount() const { return timers_.size(); }

    void run();
    void quit();

    bool quitRequested() const;
    size_t pendingTasks() const;

    // Clears the quit flag and any queued tasks so the loop can run again.
    void reset();

private:
    struct Timer {
        std::chrono::milliseconds             period;
        std::chrono::steady_clock::time_point next;
        Task                                  callback;
    };

    // Fire every timer whose deadline has passed. False once quit was requested.
    bool fireDueTimers();

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<Task>        queue_;
    bool                    quit_ = false;

    std::vector<Timer> timers_;
};
