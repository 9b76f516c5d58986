#pragma once

/**
 * @file event_loop.h
 * @brief Single-threaded cooperative scheduler
 *
 * All protocol logic in peerlink runs as callbacks on one EventLoop:
 * posted tasks, timers and descriptor readiness. post() may be called from
 * any thread; everything else must be called from the loop thread.
 */

#include "io_poller.h"
#include "socket.h"

#include <functional>
#include <memory>
#include <mutex>
#include <deque>
#include <set>
#include <unordered_map>
#include <atomic>
#include <cstdint>

namespace peerlink {

class EventLoop {
public:
    using Task = std::function<void()>;
    using FdCallback = std::function<void(uint32_t events)>;
    using TimerId = uint64_t;

    static constexpr TimerId kInvalidTimer = 0;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Queue a task for the next iteration (thread-safe)
    void post(Task task);

    /**
     * @brief Run a task once after a delay
     * @return Timer id usable with cancel_timer()
     */
    TimerId call_later(int64_t delay_ms, Task task);

    // False when the timer already fired or was never scheduled
    bool cancel_timer(TimerId id);

    bool watch_fd(socket_t fd, uint32_t events, FdCallback callback);
    bool update_fd(socket_t fd, uint32_t events);
    void unwatch_fd(socket_t fd);

    /**
     * @brief One iteration: wait for descriptors, fire due timers, run posted tasks
     * @param timeout_ms Upper bound on waiting (-1 waits until the next timer or event)
     * @return true if any callback ran
     */
    bool run_once(int timeout_ms);

    // Run until stop() is called
    void run();

    // Run until nothing is immediately runnable; future timers stay scheduled
    void run_until_idle();

    // Run for a wall-clock duration
    void run_for(int64_t duration_ms);

    /**
     * @brief Run until the predicate holds or the duration elapses
     * @return Final value of the predicate
     */
    bool run_until(const std::function<bool()>& predicate, int64_t max_duration_ms);

    void stop();

    // Monotonic milliseconds
    int64_t now() const;

    size_t pending_timer_count() const { return timers_.size(); }

private:
    struct Timer {
        int64_t due;
        Task task;
    };

    bool has_pending_tasks();
    bool run_pending_tasks();
    bool run_due_timers();
    bool dispatch_fds(int wait_ms);
    int compute_wait(int timeout_ms);
    void drain_wakeup();
    void wakeup();
    void invoke(const Task& task, const char* what);

    std::unique_ptr<IOPoller> poller_;
    socket_t wakeup_read_ = INVALID_SOCKET_VALUE;
    socket_t wakeup_write_ = INVALID_SOCKET_VALUE;

    std::mutex tasks_mutex_;
    std::deque<Task> tasks_;

    TimerId next_timer_id_ = 1;
    std::unordered_map<TimerId, Timer> timers_;
    std::set<std::pair<int64_t, TimerId>> timer_queue_;

    std::unordered_map<socket_t, FdCallback> fd_callbacks_;

    std::atomic<bool> stop_requested_;
};

} // namespace peerlink
