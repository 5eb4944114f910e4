#include <gtest/gtest.h>
#include <ssh/handoff_channel.hpp>
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

TEST(HandoffChannel, PreservesFifoOrder) {
    HandoffChannel ch;
    EXPECT_TRUE(ch.push("ab"));
    EXPECT_TRUE(ch.push("cd"));
    EXPECT_TRUE(ch.push("ef"));

    EXPECT_EQ(*ch.try_pop(), "ab");
    EXPECT_EQ(*ch.try_pop(), "cd");
    EXPECT_EQ(*ch.try_pop(), "ef");
    EXPECT_FALSE(ch.try_pop().has_value());
}

TEST(HandoffChannel, IgnoresEmptyChunks) {
    HandoffChannel ch;
    EXPECT_TRUE(ch.push(""));
    EXPECT_EQ(ch.size(), 0u);
    EXPECT_FALSE(ch.try_pop().has_value());
}

TEST(HandoffChannel, PopForTimesOutWhenEmpty) {
    HandoffChannel ch;
    auto start = std::chrono::steady_clock::now();
    auto chunk = ch.pop_for(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(chunk.has_value());
    EXPECT_GE(elapsed, 45ms);
}

TEST(HandoffChannel, PopForWakesOnArrival) {
    HandoffChannel ch;
    std::thread producer([&] {
        std::this_thread::sleep_for(30ms);
        ch.push("late");
    });

    auto start = std::chrono::steady_clock::now();
    auto chunk = ch.pop_for(2000ms);
    auto elapsed = std::chrono::steady_clock::now() - start;
    producer.join();

    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk, "late");
    EXPECT_LT(elapsed, 1000ms);
}

TEST(HandoffChannel, CloseKeepsPendingChunks) {
    HandoffChannel ch;
    ch.push("tail");
    ch.close();

    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.drained());
    EXPECT_FALSE(ch.push("more"));

    EXPECT_EQ(*ch.try_pop(), "tail");
    EXPECT_TRUE(ch.drained());
}

TEST(HandoffChannel, CloseWakesWaitingConsumer) {
    HandoffChannel ch;
    std::thread closer([&] {
        std::this_thread::sleep_for(30ms);
        ch.close();
    });

    auto start = std::chrono::steady_clock::now();
    auto chunk = ch.pop_for(5000ms);
    auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_FALSE(chunk.has_value());
    EXPECT_LT(elapsed, 2000ms);
}

TEST(HandoffChannel, FullChannelBlocksProducer) {
    HandoffChannel ch(1);
    ch.push("first");

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        ch.push("second");
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed);

    EXPECT_EQ(*ch.try_pop(), "first");
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(*ch.try_pop(), "second");
}

TEST(HandoffChannel, CloseReleasesBlockedProducer) {
    HandoffChannel ch(1);
    ch.push("first");

    std::atomic<int> result{-1};
    std::thread producer([&] {
        result = ch.push("second") ? 1 : 0;
    });

    std::this_thread::sleep_for(30ms);
    ch.close();
    producer.join();

    EXPECT_EQ(result, 0);
}
