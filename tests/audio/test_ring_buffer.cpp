/**
 * @file test_ring_buffer.cpp
 * @brief Unit tests for the lock-free sample ring buffer
 */

#include <gtest/gtest.h>

#include "audio/RingBuffer.hpp"

#include <thread>
#include <vector>

using namespace EigenPlayer;

// =============================================================================
// Single Thread Tests
// =============================================================================

TEST(RingBufferTest, StartsEmpty) {
    RingBuffer<float> ring(8);
    EXPECT_TRUE(ring.IsEmpty());
    EXPECT_FALSE(ring.IsFull());
    EXPECT_EQ(0u, ring.Size());
    EXPECT_EQ(8u, ring.Capacity());
    EXPECT_FALSE(ring.TryPop().has_value());
}

TEST(RingBufferTest, HoldsExactlyCapacity) {
    RingBuffer<float> ring(4);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(ring.TryPush(static_cast<float>(i)));
    }
    EXPECT_TRUE(ring.IsFull());
    EXPECT_FALSE(ring.TryPush(99.0f));
    EXPECT_EQ(4u, ring.Size());
}

TEST(RingBufferTest, PreservesFifoOrderAcrossWrap) {
    RingBuffer<float> ring(3);
    float next = 0.0f;
    float expected = 0.0f;

    for (int round = 0; round < 10; ++round) {
        while (ring.TryPush(next)) {
            next += 1.0f;
        }
        for (int i = 0; i < 2; ++i) {
            auto value = ring.TryPop();
            ASSERT_TRUE(value.has_value());
            EXPECT_FLOAT_EQ(expected, *value);
            expected += 1.0f;
        }
    }
}

TEST(RingBufferTest, PushBulkStopsWhenFull) {
    RingBuffer<float> ring(5);
    std::vector<float> data = {1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(5u, ring.PushBulk(data.data(), data.size()));
    EXPECT_EQ(0u, ring.PushBulk(data.data(), data.size()));

    ASSERT_EQ(1.0f, ring.TryPop().value_or(0.0f));
    EXPECT_EQ(1u, ring.PushBulk(data.data() + 5, 2));
}

TEST(RingBufferTest, ClearDropsQueuedSamples) {
    RingBuffer<float> ring(16);
    std::vector<float> data(10, 0.5f);
    ring.PushBulk(data.data(), data.size());

    ring.Clear();
    EXPECT_TRUE(ring.IsEmpty());
    EXPECT_TRUE(ring.TryPush(1.0f));
    EXPECT_FLOAT_EQ(1.0f, ring.TryPop().value_or(0.0f));
}

TEST(RingBufferTest, ConfiguredAudioSizeHoldsOneSecondOfMono) {
    RingBuffer<float> ring(88200);
    EXPECT_EQ(88200u, ring.Capacity());
}

// =============================================================================
// Producer / Consumer Tests
// =============================================================================

TEST(RingBufferTest, ProducerConsumerDeliversEverySampleInOrder) {
    constexpr int kCount = 200000;
    RingBuffer<float> ring(1024);

    std::thread producer([&ring] {
        for (int i = 0; i < kCount;) {
            if (ring.TryPush(static_cast<float>(i))) {
                ++i;
            } else {
                std::this_thread::yield();
            }
        }
    });

    int received = 0;
    bool ordered = true;
    while (received < kCount) {
        if (auto value = ring.TryPop()) {
            ordered = ordered && (*value == static_cast<float>(received));
            ++received;
            EXPECT_LE(ring.Size(), ring.Capacity());
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    EXPECT_TRUE(ordered);
    EXPECT_TRUE(ring.IsEmpty());
}
