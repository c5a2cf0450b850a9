#include <gtest/gtest.h>
#include "audio/EventLoop.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(EventLoopTest, RunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> seen;

    loop.post([&] { seen.push_back(1); });
    loop.post([&] { seen.push_back(2); });
    loop.post([&] { seen.push_back(3); loop.quit(); });
    loop.run();

    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoopTest, QuitDiscardsRemainingTasks) {
    EventLoop loop;
    int ran = 0;

    loop.post([&] { ran++; loop.quit(); });
    loop.post([&] { ran++; });
    loop.run();

    EXPECT_EQ(ran, 1);
    EXPECT_TRUE(loop.quitRequested());
    EXPECT_EQ(loop.pendingTasks(), 0u);
}

TEST(EventLoopTest, PostAfterQuitIsDropped) {
    EventLoop loop;
    loop.quit();
    loop.post([] {});
    EXPECT_EQ(loop.pendingTasks(), 0u);
}

TEST(EventLoopTest, TimerFiresUntilQuit) {
    EventLoop loop;
    int ticks = 0;

    loop.addTimer(5ms, [&] {
        if (++ticks == 3) loop.quit();
    });
    loop.run();

    EXPECT_EQ(ticks, 3);
}

TEST(EventLoopTest, NonPositiveTimerIsIgnored) {
    EventLoop loop;
    loop.addTimer(0ms, [] {});
    EXPECT_EQ(loop.timerCount(), 0u);
}

TEST(EventLoopTest, TasksFromAnotherThreadWakeTheLoop) {
    EventLoop loop;
    std::atomic<int> received{0};

    std::thread producer([&] {
        for (int i = 0; i < 10; i++) {
            loop.post([&] { received++; });
            std::this_thread::sleep_for(1ms);
        }
        loop.post([&] { loop.quit(); });
    });

    loop.run();
    producer.join();

    EXPECT_EQ(received.load(), 10);
}

TEST(EventLoopTest, ResetAllowsSecondRun) {
    EventLoop loop;
    int runs = 0;

    loop.post([&] { runs++; loop.quit(); });
    loop.run();

    loop.reset();
    EXPECT_FALSE(loop.quitRequested());
    loop.post([&] { runs++; loop.quit(); });
    loop.run();

    EXPECT_EQ(runs, 2);
}
