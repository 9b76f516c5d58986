#include <gtest/gtest.h>
#include "event_loop.h"
#include "io_poller.h"
#include "logger.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace peerlink;

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
    }

    void TearDown() override {
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    EventLoop loop_;
};

TEST_F(EventLoopTest, PostedTasksRunInOrder) {
    std::vector<int> order;
    loop_.post([&]() { order.push_back(1); });
    loop_.post([&]() { order.push_back(2); });
    loop_.post([&]() {
        order.push_back(3);
        loop_.post([&]() { order.push_back(4); });
    });
    loop_.run_until_idle();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(EventLoopTest, TimersFireInDueOrder) {
    std::vector<int> order;
    loop_.call_later(30, [&]() { order.push_back(30); });
    loop_.call_later(10, [&]() { order.push_back(10); });
    loop_.call_later(20, [&]() { order.push_back(20); });
    EXPECT_EQ(loop_.pending_timer_count(), 3u);

    EXPECT_TRUE(loop_.run_until([&]() { return order.size() == 3; }, 1000));
    EXPECT_EQ(order, (std::vector<int>{10, 20, 30}));
    EXPECT_EQ(loop_.pending_timer_count(), 0u);
}

TEST_F(EventLoopTest, CancelledTimerDoesNotFire) {
    bool fired = false;
    EventLoop::TimerId id = loop_.call_later(10, [&]() { fired = true; });
    EXPECT_NE(id, EventLoop::kInvalidTimer);
    EXPECT_TRUE(loop_.cancel_timer(id));
    EXPECT_FALSE(loop_.cancel_timer(id));
    loop_.run_for(50);
    EXPECT_FALSE(fired);
}

TEST_F(EventLoopTest, RunUntilIdleLeavesFutureTimers) {
    bool fired = false;
    loop_.call_later(60000, [&]() { fired = true; });
    loop_.run_until_idle();
    EXPECT_FALSE(fired);
    EXPECT_EQ(loop_.pending_timer_count(), 1u);
}

TEST_F(EventLoopTest, ThrowingTaskDoesNotStopTheLoop) {
    bool after = false;
    loop_.post([]() { throw std::runtime_error("boom"); });
    loop_.post([&]() { after = true; });
    loop_.run_until_idle();
    EXPECT_TRUE(after);
}

TEST_F(EventLoopTest, PostFromAnotherThreadWakesTheLoop) {
    std::atomic<bool> ran{false};
    std::thread poster([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        loop_.post([&]() { ran = true; });
    });
    EXPECT_TRUE(loop_.run_until([&]() { return ran.load(); }, 2000));
    poster.join();
}

TEST_F(EventLoopTest, WatchedDescriptorReportsReadable) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    std::string received;
    ASSERT_TRUE(loop_.watch_fd(fds[0], PollIn, [&](uint32_t events) {
        if (events & PollIn) {
            char buffer[16];
            ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
            if (n > 0) received.append(buffer, static_cast<size_t>(n));
        }
    }));

    ASSERT_EQ(::write(fds[1], "ping", 4), 4);
    EXPECT_TRUE(loop_.run_until([&]() { return received == "ping"; }, 1000));

    loop_.unwatch_fd(fds[0]);
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(EventLoopTest, StopEndsRun) {
    loop_.call_later(10, [&]() { loop_.stop(); });
    loop_.run();
    SUCCEED();
}
