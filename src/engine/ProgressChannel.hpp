/**
 * @file ProgressChannel.hpp
 * @brief Bounded, non-blocking progress event stream
 *
 * Worker threads publish ProgressEvents; a dedicated consumer thread
 * delivers them to subscribers. Publishing never waits for a subscriber:
 * when the queue is full the oldest event is dropped and counted.
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace engine {

class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 1'024);
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;
    ProgressChannel(ProgressChannel&&) = delete;
    ProgressChannel& operator=(ProgressChannel&&) = delete;

    /**
     * @brief Register a subscriber
     * @return Subscription ID for unsubscribe()
     */
    auto subscribe(ProgressSink sink) -> size_t;
    void unsubscribe(size_t subscription_id);

    /**
     * @brief Enqueue an event for delivery (never blocks on consumers)
     */
    void publish(ProgressEvent event);

    /**
     * @brief Wait until every queued event has been delivered
     */
    void flush();

    /**
     * @brief Deliver what is queued, then stop the consumer thread
     */
    void stop();

    [[nodiscard]] auto dropped_count() const -> uint64_t;
    [[nodiscard]] auto delivered_count() const -> uint64_t;

private:
    void consume();

    const size_t capacity_;
    std::deque<ProgressEvent> queue_;
    std::unordered_map<size_t, ProgressSink> subscribers_;
    size_t next_subscription_id_ = 0;
    uint64_t dropped_ = 0;
    uint64_t delivered_ = 0;
    bool delivering_ = false;
    bool stopping_ = false;
    bool consumer_done_ = false;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::thread consumer_;
};

}  // namespace engine
