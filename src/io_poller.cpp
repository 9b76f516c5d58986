#include "io_poller.h"
#include "logger.h"

#include <cstring>
#include <vector>
#include <errno.h>
#include <unistd.h>

#if defined(__linux__)
    #define POLLER_USE_EPOLL 1
    #include <sys/epoll.h>
#else
    #define POLLER_USE_POLL 1
    #include <poll.h>
#endif

#define LOG_POLLER_DEBUG(msg) LOG_DEBUG("poller", msg)
#define LOG_POLLER_ERROR(msg) LOG_ERROR("poller", msg)

namespace peerlink {

#if defined(POLLER_USE_EPOLL)

class EpollPoller final : public IOPoller {
public:
    EpollPoller() {
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            LOG_POLLER_ERROR("epoll_create1 failed: " << strerror(errno));
        } else {
            LOG_POLLER_DEBUG("Created epoll instance (fd=" << epfd_ << ")");
        }
    }

    ~EpollPoller() override {
        if (epfd_ >= 0) {
            ::close(epfd_);
        }
    }

    bool add(socket_t fd, uint32_t events) override {
        return control(EPOLL_CTL_ADD, fd, events);
    }

    bool modify(socket_t fd, uint32_t events) override {
        return control(EPOLL_CTL_MOD, fd, events);
    }

    bool remove(socket_t fd) override {
        if (epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
            if (errno != ENOENT && errno != EBADF) {
                LOG_POLLER_ERROR("epoll_ctl DEL failed for fd " << fd << ": " << strerror(errno));
            }
            return false;
        }
        return true;
    }

    int wait(PollResult* results, int max_results, int timeout_ms) override {
        if (static_cast<int>(events_.size()) < max_results) {
            events_.resize(max_results);
        }

        int n = epoll_wait(epfd_, events_.data(), max_results, timeout_ms);
        if (n < 0) {
            if (errno != EINTR) {
                LOG_POLLER_ERROR("epoll_wait failed: " << strerror(errno));
            }
            return -1;
        }

        for (int i = 0; i < n; ++i) {
            results[i].fd = static_cast<socket_t>(events_[i].data.fd);
            results[i].events = from_epoll_events(events_[i].events);
        }
        return n;
    }

    const char* name() const override { return "epoll"; }

private:
    bool control(int op, socket_t fd, uint32_t events) {
        struct epoll_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.data.fd = fd;
        ev.events = 0;
        if (events & PollIn)  ev.events |= EPOLLIN;
        if (events & PollOut) ev.events |= EPOLLOUT;

        if (epoll_ctl(epfd_, op, fd, &ev) < 0) {
            LOG_POLLER_ERROR("epoll_ctl " << (op == EPOLL_CTL_ADD ? "ADD" : "MOD")
                             << " failed for fd " << fd << ": " << strerror(errno));
            return false;
        }
        return true;
    }

    static uint32_t from_epoll_events(uint32_t epoll_events) {
        uint32_t flags = 0;
        if (epoll_events & EPOLLIN)  flags |= PollIn;
        if (epoll_events & EPOLLOUT) flags |= PollOut;
        if (epoll_events & EPOLLERR) flags |= PollErr;
        if (epoll_events & EPOLLHUP) flags |= PollHup;
        return flags;
    }

    int epfd_ = -1;
    std::vector<struct epoll_event> events_;
};

#endif // POLLER_USE_EPOLL

#if defined(POLLER_USE_POLL)

class PollPoller final : public IOPoller {
public:
    bool add(socket_t fd, uint32_t events) override {
        for (const auto& p : fds_) {
            if (p.fd == fd) return false;
        }
        struct pollfd p;
        p.fd = fd;
        p.events = to_poll_events(events);
        p.revents = 0;
        fds_.push_back(p);
        return true;
    }

    bool modify(socket_t fd, uint32_t events) override {
        for (auto& p : fds_) {
            if (p.fd == fd) {
                p.events = to_poll_events(events);
                return true;
            }
        }
        return false;
    }

    bool remove(socket_t fd) override {
        for (auto it = fds_.begin(); it != fds_.end(); ++it) {
            if (it->fd == fd) {
                fds_.erase(it);
                return true;
            }
        }
        return false;
    }

    int wait(PollResult* results, int max_results, int timeout_ms) override {
        int ret = ::poll(fds_.data(), static_cast<nfds_t>(fds_.size()), timeout_ms);
        if (ret < 0) {
            if (errno != EINTR) {
                LOG_POLLER_ERROR("poll failed: " << strerror(errno));
            }
            return -1;
        }

        int n = 0;
        for (const auto& p : fds_) {
            if (n >= max_results) break;
            if (p.revents == 0) continue;
            uint32_t flags = 0;
            if (p.revents & POLLIN)  flags |= PollIn;
            if (p.revents & POLLOUT) flags |= PollOut;
            if (p.revents & (POLLERR | POLLNVAL)) flags |= PollErr;
            if (p.revents & POLLHUP) flags |= PollHup;
            results[n].fd = p.fd;
            results[n].events = flags;
            ++n;
        }
        return n;
    }

    const char* name() const override { return "poll"; }

private:
    static short to_poll_events(uint32_t flags) {
        short e = 0;
        if (flags & PollIn)  e |= POLLIN;
        if (flags & PollOut) e |= POLLOUT;
        return e;
    }

    std::vector<struct pollfd> fds_;
};

#endif // POLLER_USE_POLL

std::unique_ptr<IOPoller> IOPoller::create() {
#if defined(POLLER_USE_EPOLL)
    return std::unique_ptr<IOPoller>(new EpollPoller());
#else
    return std::unique_ptr<IOPoller>(new PollPoller());
#endif
}

} // namespace peerlink
