#pragma once

/**
 * @file io_poller.h
 * @brief Readiness multiplexing for the event loop
 *
 * - Linux:       epoll
 * - other POSIX: poll()
 *
 * Usage:
 *   auto poller = IOPoller::create();
 *   poller->add(fd, PollIn);
 *
 *   PollResult results[64];
 *   int n = poller->wait(results, 64, 100);  // 100ms timeout
 */

#include "socket.h"

#include <memory>
#include <cstdint>

namespace peerlink {

enum PollFlags : uint32_t {
    PollNone = 0,
    PollIn   = 1 << 0,  ///< Readable (data available or connection pending accept)
    PollOut  = 1 << 1,  ///< Writable (send buffer space or connect completed)
    PollErr  = 1 << 2,  ///< Error condition
    PollHup  = 1 << 3,  ///< Peer hung up
};

inline uint32_t operator|(PollFlags a, PollFlags b) {
    return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

struct PollResult {
    socket_t fd;        ///< Descriptor that has events
    uint32_t events;    ///< Bitmask of PollFlags that occurred
};

/**
 * @brief Abstract readiness multiplexer, used from the event loop thread only
 */
class IOPoller {
public:
    virtual ~IOPoller() = default;

    /**
     * @brief Create the platform-preferred poller (epoll on Linux, poll() elsewhere)
     */
    static std::unique_ptr<IOPoller> create();

    virtual bool add(socket_t fd, uint32_t events) = 0;
    virtual bool modify(socket_t fd, uint32_t events) = 0;
    virtual bool remove(socket_t fd) = 0;

    /**
     * @brief Wait for readiness
     * @param timeout_ms -1 blocks forever, 0 returns immediately
     * @return Number of entries filled (0 on timeout, -1 on error)
     */
    virtual int wait(PollResult* results, int max_results, int timeout_ms) = 0;

    virtual const char* name() const = 0;

    IOPoller() = default;
    IOPoller(const IOPoller&) = delete;
    IOPoller& operator=(const IOPoller&) = delete;
};

} // namespace peerlink
