// =============================================================================
// Event Loop - Implementation
// =============================================================================

#include "loanvoice/core/event_loop.h"

#include "loanvoice/core/logger.h"

#include <exception>

namespace loanvoice {

void EventLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::post_delayed(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_seq_++;
        auto due = Clock::now() + time_offset_ + delay;
        timers_.emplace(std::make_pair(due, id), std::make_pair(id, std::move(task)));
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel_timer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.first == id) {
            timers_.erase(it);
            return;
        }
    }
}

EventLoop::Clock::time_point EventLoop::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Clock::now() + time_offset_;
}

void EventLoop::advance_time(std::chrono::milliseconds delta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        time_offset_ += delta;
    }
    cv_.notify_one();
}

size_t EventLoop::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

bool EventLoop::in_loop_thread() const {
    return loop_thread_ == std::this_thread::get_id();
}

// Caller must NOT hold mutex_
bool EventLoop::pop_ready(Task& out) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Due timers are promoted to the task queue in due-time order, so a timer
    // never jumps ahead of work that was already posted.
    auto now = Clock::now() + time_offset_;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        tasks_.push_back(std::move(timers_.begin()->second.second));
        timers_.erase(timers_.begin());
    }

    if (tasks_.empty()) return false;
    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

void EventLoop::execute(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        // A throwing handler must not take the loop (and with it capture and
        // playback) down.
        LV_LOG_ERROR("EventLoop", "Task threw: %s", e.what());
    }
}

void EventLoop::run() {
    loop_thread_ = std::this_thread::get_id();
    running_ = true;
    stop_requested_ = false;

    while (!stop_requested_.load()) {
        Task task;
        if (pop_ready(task)) {
            execute(task);
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_.load() || !tasks_.empty()) continue;

        if (timers_.empty()) {
            cv_.wait(lock, [this] {
                return stop_requested_.load() || !tasks_.empty() || !timers_.empty();
            });
        } else {
            // Wait until the earliest timer is due (in real time)
            auto due = timers_.begin()->first.first - time_offset_;
            cv_.wait_until(lock, due);
        }
    }

    running_ = false;
    loop_thread_ = std::thread::id();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::run_pending(size_t max_tasks) {
    auto previous = loop_thread_;
    loop_thread_ = std::this_thread::get_id();

    size_t executed = 0;
    Task task;
    while (executed < max_tasks && pop_ready(task)) {
        execute(task);
        ++executed;
    }

    loop_thread_ = previous;
    return executed;
}

}  // namespace loanvoice
