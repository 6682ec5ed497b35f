/**
 * @file ProgressChannelTest.cpp
 * @brief Unit tests for ProgressChannel
 */

#include "engine/ProgressChannel.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

auto make_event(const std::string& device, uint64_t bytes) -> ProgressEvent {
    ProgressEvent event;
    event.device_id = device;
    event.bytes_done = bytes;
    event.total_bytes = 100;
    return event;
}

}  // namespace

// Test: every subscriber gets every event in publish order
TEST(ProgressChannelTest, Publish_DeliversInOrderToAllSubscribers) {
    engine::ProgressChannel channel(64);
    std::mutex mutex;
    std::vector<uint64_t> first;
    std::vector<uint64_t> second;
    channel.subscribe([&](const ProgressEvent& e) {
        std::lock_guard lock(mutex);
        first.push_back(e.bytes_done);
    });
    channel.subscribe([&](const ProgressEvent& e) {
        std::lock_guard lock(mutex);
        second.push_back(e.bytes_done);
    });

    for (uint64_t i = 0; i < 10; ++i) {
        channel.publish(make_event("sdb", i));
    }
    channel.flush();

    std::lock_guard lock(mutex);
    EXPECT_EQ(first, (std::vector<uint64_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(second, first);
    EXPECT_EQ(channel.delivered_count(), 10u);
    EXPECT_EQ(channel.dropped_count(), 0u);
}

// Test: a stalled subscriber never blocks publishers; the oldest events are dropped
TEST(ProgressChannelTest, Publish_SlowSubscriber_DropsOldestWithoutBlocking) {
    engine::ProgressChannel channel(4);
    std::promise<void> gate;
    auto released = gate.get_future().share();
    std::atomic<bool> entered{false};
    std::mutex mutex;
    std::vector<uint64_t> seen;

    channel.subscribe([&](const ProgressEvent& e) {
        entered.store(true);
        released.wait();
        std::lock_guard lock(mutex);
        seen.push_back(e.bytes_done);
    });

    channel.publish(make_event("sdb", 0));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([&] { return entered.load(); }));

    bool published = ThreadingTestHelper::WaitFor(
        [&] {
            for (uint64_t i = 1; i <= 9; ++i) {
                channel.publish(make_event("sdb", i));
            }
        },
        std::chrono::milliseconds{1000});
    EXPECT_TRUE(published);

    gate.set_value();
    channel.flush();

    EXPECT_EQ(channel.dropped_count(), 5u);
    std::lock_guard lock(mutex);
    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 6, 7, 8, 9}));
}

// Test: a throwing subscriber does not stop delivery
TEST(ProgressChannelTest, Publish_ThrowingSubscriber_Isolated) {
    engine::ProgressChannel channel(16);
    std::atomic<int> good{0};
    channel.subscribe([](const ProgressEvent&) { throw std::runtime_error("display gone"); });
    channel.subscribe([&good](const ProgressEvent&) { ++good; });

    channel.publish(make_event("sdb", 1));
    channel.publish(make_event("sdb", 2));
    channel.flush();

    EXPECT_EQ(good.load(), 2);
}

// Test: unsubscribed sinks stop receiving events
TEST(ProgressChannelTest, Unsubscribe_StopsDelivery) {
    engine::ProgressChannel channel(16);
    std::atomic<int> count{0};
    auto id = channel.subscribe([&count](const ProgressEvent&) { ++count; });

    channel.publish(make_event("sdb", 1));
    channel.flush();
    channel.unsubscribe(id);
    channel.publish(make_event("sdb", 2));
    channel.flush();

    EXPECT_EQ(count.load(), 1);
}

// Test: stop delivers what is queued and ignores later events
TEST(ProgressChannelTest, Stop_DrainsQueueThenIgnoresPublish) {
    engine::ProgressChannel channel(16);
    std::atomic<int> count{0};
    channel.subscribe([&count](const ProgressEvent&) { ++count; });

    channel.publish(make_event("sdb", 1));
    channel.publish(make_event("sdc", 1));
    channel.stop();
    channel.publish(make_event("sdb", 2));
    channel.flush();

    EXPECT_EQ(count.load(), 2);
}
