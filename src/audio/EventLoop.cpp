#include "audio/EventLoop.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

void EventLoop::post(Task task) {
    {
        std::lock_guard lock(mtx_);
        if (quit_) return;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::addTimer(std::chrono::milliseconds period, Task callback) {
    if (period.count() <= 0) {
        spdlog::warn("Ignoring timer with non-positive period {}ms", period.count());
        return;
    }
    timers_.push_back({period, std::chrono::steady_clock::now() + period,
                       std::move(callback)});
}

void EventLoop::run() {
    auto now = std::chrono::steady_clock::now();
    for (auto& t : timers_)
        t.next = now + t.period;

    std::deque<Task> batch;
    while (true) {
        {
            std::unique_lock lock(mtx_);
            auto ready = [this] { return quit_ || !queue_.empty(); };

            if (timers_.empty()) {
                cv_.wait(lock, ready);
            } else {
                auto deadline = std::min_element(
                    timers_.begin(), timers_.end(),
                    [](const Timer& a, const Timer& b) { return a.next < b.next; })->next;
                cv_.wait_until(lock, deadline, ready);
            }

            if (quit_) return;
            batch.swap(queue_);
        }

        for (auto& task : batch) {
            task();
            if (quitRequested()) return;
        }
        batch.clear();

        if (!fireDueTimers()) return;
    }
}

bool EventLoop::fireDueTimers() {
    auto now = std::chrono::steady_clock::now();
    for (size_t i = 0; i < timers_.size(); i++) {
        if (now < timers_[i].next) continue;

        // Skip missed periods rather than firing a backlog.
        timers_[i].next += timers_[i].period;
        if (timers_[i].next <= now)
            timers_[i].next = now + timers_[i].period;

        timers_[i].callback();
        if (quitRequested()) return false;
    }
    return true;
}

void EventLoop::quit() {
    {
        std::lock_guard lock(mtx_);
        quit_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool EventLoop::quitRequested() const {
    std::lock_guard lock(mtx_);
    return quit_;
}

size_t EventLoop::pendingTasks() const {
    std::lock_guard lock(mtx_);
    return queue_.size();
}

void EventLoop::reset() {
    std::lock_guard lock(mtx_);
    quit_ = false;
    queue_.clear();
}
