#include "event_loop.h"
#include "logger.h"

#include <chrono>
#include <cstring>
#include <exception>
#include <vector>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#define LOG_LOOP_DEBUG(message) LOG_DEBUG("loop", message)
#define LOG_LOOP_WARN(message)  LOG_WARN("loop", message)
#define LOG_LOOP_ERROR(message) LOG_ERROR("loop", message)

namespace peerlink {

namespace {
constexpr int kMaxPollResults = 64;
}

EventLoop::EventLoop()
    : poller_(IOPoller::create()), stop_requested_(false) {
    int fds[2];
    if (pipe(fds) != 0) {
        LOG_LOOP_ERROR("Failed to create wakeup pipe: " << strerror(errno));
        return;
    }
    wakeup_read_ = fds[0];
    wakeup_write_ = fds[1];
    set_socket_nonblocking(wakeup_read_);
    set_socket_nonblocking(wakeup_write_);
    fcntl(wakeup_read_, F_SETFD, FD_CLOEXEC);
    fcntl(wakeup_write_, F_SETFD, FD_CLOEXEC);

    if (!poller_->add(wakeup_read_, PollIn)) {
        LOG_LOOP_ERROR("Failed to register wakeup pipe with " << poller_->name());
    }
    LOG_LOOP_DEBUG("Event loop created using " << poller_->name());
}

EventLoop::~EventLoop() {
    if (wakeup_read_ != INVALID_SOCKET_VALUE) {
        poller_->remove(wakeup_read_);
        ::close(wakeup_read_);
    }
    if (wakeup_write_ != INVALID_SOCKET_VALUE) {
        ::close(wakeup_write_);
    }
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(task));
    }
    wakeup();
}

EventLoop::TimerId EventLoop::call_later(int64_t delay_ms, Task task) {
    if (delay_ms < 0) {
        delay_ms = 0;
    }
    TimerId id = next_timer_id_++;
    int64_t due = now() + delay_ms;
    timers_[id] = Timer{due, std::move(task)};
    timer_queue_.insert(std::make_pair(due, id));
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    timer_queue_.erase(std::make_pair(it->second.due, id));
    timers_.erase(it);
    return true;
}

bool EventLoop::watch_fd(socket_t fd, uint32_t events, FdCallback callback) {
    if (fd_callbacks_.count(fd)) {
        LOG_LOOP_WARN("Descriptor " << fd << " is already watched");
        return false;
    }
    if (!poller_->add(fd, events)) {
        return false;
    }
    fd_callbacks_[fd] = std::move(callback);
    return true;
}

bool EventLoop::update_fd(socket_t fd, uint32_t events) {
    if (!fd_callbacks_.count(fd)) {
        return false;
    }
    return poller_->modify(fd, events);
}

void EventLoop::unwatch_fd(socket_t fd) {
    if (fd_callbacks_.erase(fd) > 0) {
        poller_->remove(fd);
    }
}

bool EventLoop::run_once(int timeout_ms) {
    bool did_work = dispatch_fds(compute_wait(timeout_ms));
    did_work = run_due_timers() || did_work;
    did_work = run_pending_tasks() || did_work;
    return did_work;
}

void EventLoop::run() {
    stop_requested_ = false;
    while (!stop_requested_) {
        run_once(-1);
    }
}

void EventLoop::run_until_idle() {
    stop_requested_ = false;
    while (!stop_requested_ && run_once(0)) {
    }
}

void EventLoop::run_for(int64_t duration_ms) {
    stop_requested_ = false;
    int64_t deadline = now() + duration_ms;
    while (!stop_requested_) {
        int64_t remaining = deadline - now();
        if (remaining <= 0) {
            break;
        }
        run_once(static_cast<int>(remaining));
    }
}

bool EventLoop::run_until(const std::function<bool()>& predicate, int64_t max_duration_ms) {
    stop_requested_ = false;
    int64_t deadline = now() + max_duration_ms;
    while (!stop_requested_ && !predicate()) {
        int64_t remaining = deadline - now();
        if (remaining <= 0) {
            break;
        }
        run_once(static_cast<int>(remaining < 50 ? remaining : 50));
    }
    return predicate();
}

void EventLoop::stop() {
    stop_requested_ = true;
    wakeup();
}

int64_t EventLoop::now() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool EventLoop::has_pending_tasks() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return !tasks_.empty();
}

bool EventLoop::run_pending_tasks() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        batch.swap(tasks_);
    }
    // Tasks posted while this batch runs wait for the next iteration
    for (auto& task : batch) {
        invoke(task, "task");
    }
    return !batch.empty();
}

bool EventLoop::run_due_timers() {
    int64_t current = now();
    std::vector<Task> due;
    while (!timer_queue_.empty() && timer_queue_.begin()->first <= current) {
        TimerId id = timer_queue_.begin()->second;
        timer_queue_.erase(timer_queue_.begin());
        auto it = timers_.find(id);
        if (it != timers_.end()) {
            due.push_back(std::move(it->second.task));
            timers_.erase(it);
        }
    }
    for (auto& task : due) {
        invoke(task, "timer");
    }
    return !due.empty();
}

bool EventLoop::dispatch_fds(int wait_ms) {
    PollResult results[kMaxPollResults];
    int n = poller_->wait(results, kMaxPollResults, wait_ms);
    if (n <= 0) {
        return false;
    }

    bool did_work = false;
    for (int i = 0; i < n; ++i) {
        if (results[i].fd == wakeup_read_) {
            drain_wakeup();
            continue;
        }
        auto it = fd_callbacks_.find(results[i].fd);
        if (it == fd_callbacks_.end()) {
            // unwatched by an earlier callback in this batch
            continue;
        }
        FdCallback callback = it->second;
        uint32_t events = results[i].events;
        invoke([&callback, events]() { callback(events); }, "fd");
        did_work = true;
    }
    return did_work;
}

int EventLoop::compute_wait(int timeout_ms) {
    if (has_pending_tasks() || stop_requested_) {
        return 0;
    }
    if (timer_queue_.empty()) {
        return timeout_ms;
    }
    int64_t until_next = timer_queue_.begin()->first - now();
    if (until_next < 0) {
        until_next = 0;
    }
    if (timeout_ms < 0 || until_next < timeout_ms) {
        return static_cast<int>(until_next);
    }
    return timeout_ms;
}

void EventLoop::drain_wakeup() {
    char buffer[64];
    while (::read(wakeup_read_, buffer, sizeof(buffer)) > 0) {
    }
}

void EventLoop::wakeup() {
    if (wakeup_write_ == INVALID_SOCKET_VALUE) {
        return;
    }
    char byte = 1;
    // A full pipe already guarantees a wakeup
    if (::write(wakeup_write_, &byte, 1) < 0 && errno != EAGAIN) {
        LOG_LOOP_WARN("Failed to signal event loop: " << strerror(errno));
    }
}

void EventLoop::invoke(const Task& task, const char* what) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_LOOP_ERROR("Exception in " << what << " callback: " << e.what());
    }
}

} // namespace peerlink
