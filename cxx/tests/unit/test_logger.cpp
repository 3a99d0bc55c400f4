#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>
#include <vector>

using namespace keyfall;

TEST(LoggerTest, SingleThreadedPushPop) {
    auto& logger = AudioLogger::instance();

    // Clear any existing entries
    while (logger.pop_entry()) {}

    logger.log_message("TEST", "Hello World");
    logger.log_event("VALUE", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "VALUE");
    EXPECT_EQ(entry2->value, 42.0f);
    EXPECT_GE(entry2->timestamp, entry1->timestamp);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongTextIsTruncated) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    const std::string long_tag(100, 't');
    const std::string long_msg(200, 'm');
    logger.log_message(long_tag.c_str(), long_msg.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->tag), std::string(31, 't'));
    EXPECT_EQ(std::string(entry->message), std::string(63, 'm'));
}

TEST(LoggerTest, FlushWritesTaggedLines) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    logger.log_message("ALSA", "Underrun");
    logger.log_event("PROC_US", 12.0f);

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), 2u);
    EXPECT_EQ(out.str(), "[ALSA] Underrun\n[PROC_US] 12\n");

    std::ostringstream empty;
    EXPECT_EQ(logger.flush(empty), 0u);
    EXPECT_TRUE(empty.str().empty());
}

TEST(LoggerTest, MultiThreadedCapture) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // "Background" thread (Consumer)
    std::thread consumer([&]() {
        while (true) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else if (!running) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    });

    // "Audio" thread (Producer)
    std::thread producer([&]() {
        for (int i = 0; i < 100; ++i) {
            logger.log_event("ITER", static_cast<float>(i));
        }
    });

    producer.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    running = false;
    consumer.join();

    ASSERT_EQ(captured.size(), 100u);
    EXPECT_STREQ(captured[0].tag, "ITER");
    EXPECT_EQ(captured[0].value, 0.0f);
    EXPECT_EQ(captured.back().value, 99.0f);
}

TEST(RingBufferTest, RejectsPushWhenFull) {
    LockFreeRingBuffer<int, 8> ring;
    EXPECT_EQ(ring.capacity(), 7u);
    EXPECT_TRUE(ring.empty());

    for (int i = 0; i < 7; ++i) {
        EXPECT_TRUE(ring.push(i));
    }
    EXPECT_FALSE(ring.push(99));

    for (int i = 0; i < 7; ++i) {
        auto value = ring.pop();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_FALSE(ring.pop().has_value());
    EXPECT_TRUE(ring.empty());
}
