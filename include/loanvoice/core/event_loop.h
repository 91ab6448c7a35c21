/**
 * @file event_loop.h
 * @brief LoanVoice - Single-threaded cooperative event loop
 *
 * Every piece of conversation logic runs on the thread that calls run().
 * Device and socket threads never touch session state directly: they post
 * tasks here, and the tasks execute one at a time in FIFO order.
 *
 * Delayed tasks (timers) are ordered by due time, then by posting order.
 */

#ifndef LOANVOICE_CORE_EVENT_LOOP_H
#define LOANVOICE_CORE_EVENT_LOOP_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace loanvoice {

class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;

    EventLoop() = default;
    ~EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Queue a task for the next loop iteration (thread-safe)
    void post(Task task);

    // Queue a task to run after `delay` (thread-safe). Returns an id for cancel_timer().
    TimerId post_delayed(std::chrono::milliseconds delay, Task task);

    // Drop a pending delayed task. No-op if it already ran.
    void cancel_timer(TimerId id);

    // Run until stop() is called. Must be called from a single thread.
    void run();

    // Make run() return after the current task (thread-safe)
    void stop();

    // Run every task that is ready now, including tasks posted while
    // draining, without blocking. Returns the number of tasks executed.
    size_t run_pending(size_t max_tasks = 100000);

    // Shift the loop's notion of "now" forward; lets tests fire timers
    // without sleeping.
    void advance_time(std::chrono::milliseconds delta);

    Clock::time_point now() const;

    size_t pending_tasks() const;
    size_t pending_timers() const;

    bool is_running() const { return running_.load(); }

    // True when called from the thread currently inside run()/run_pending()
    bool in_loop_thread() const;

private:
    bool pop_ready(Task& out);
    void execute(Task& task);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    // (due time, sequence) -> (id, task)
    std::map<std::pair<Clock::time_point, uint64_t>, std::pair<TimerId, Task>> timers_;
    uint64_t next_timer_seq_ = 1;
    Clock::duration time_offset_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread::id loop_thread_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_CORE_EVENT_LOOP_H
