#include <gtest/gtest.h>
#include <core/event_queue.hpp>
#include <platform/terminal.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

TEST(EventQueue, RunsInPostOrder) {
    EventQueue q;
    std::vector<int> seen;
    q.post([&] { seen.push_back(1); });
    q.post([&] { seen.push_back(2); });
    q.post([&] { seen.push_back(3); });

    EXPECT_FALSE(q.empty());
    EXPECT_EQ(q.drain(), 3u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(q.empty());
}

TEST(EventQueue, TasksPostedDuringDrainAlsoRun) {
    EventQueue q;
    std::vector<int> seen;
    q.post([&] {
        seen.push_back(1);
        q.post([&] { seen.push_back(2); });
    });
    EXPECT_EQ(q.drain(), 2u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(EventQueue, ThrowingTaskDoesNotStopDrain) {
    EventQueue q;
    bool after = false;
    q.post([] { throw std::runtime_error("bad task"); });
    q.post([&] { after = true; });

    EXPECT_NO_THROW(q.drain());
    EXPECT_TRUE(after);
}

TEST(EventQueue, NonStandardThrowDoesNotStopDrain) {
    EventQueue q;
    bool after = false;
    q.post([] { throw 7; });
    q.post([&] { after = true; });

    EXPECT_NO_THROW(q.drain());
    EXPECT_TRUE(after);
}

TEST(EventQueue, WaitFdSignalsPendingWork) {
    EventQueue q;
    EXPECT_EQ(platform::poll_two(q.wait_fd(), -1, 0) & 1, 0);

    std::thread producer([&] { q.post([] {}); });
    producer.join();

    EXPECT_EQ(platform::poll_two(q.wait_fd(), -1, 1000) & 1, 1);
    q.drain();
    EXPECT_EQ(platform::poll_two(q.wait_fd(), -1, 0) & 1, 0);
}

TEST(EventQueue, ManyProducers) {
    EventQueue q;
    int count = 0;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < 250; ++i) q.post([&] { ++count; });
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_EQ(q.drain(), 1000u);
    EXPECT_EQ(count, 1000);
}
