/**
 * @file ProgressChannel.cpp
 * @brief Bounded, non-blocking progress event stream
 */

#include "engine/ProgressChannel.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace engine {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)), consumer_([this] { consume(); }) {}

ProgressChannel::~ProgressChannel() {
    stop();
}

auto ProgressChannel::subscribe(ProgressSink sink) -> size_t {
    std::lock_guard lock(mutex_);
    auto id = next_subscription_id_++;
    subscribers_[id] = std::move(sink);
    return id;
}

void ProgressChannel::unsubscribe(size_t subscription_id) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(subscription_id);
}

void ProgressChannel::publish(ProgressEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    work_cv_.notify_one();
}

void ProgressChannel::flush() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !delivering_) || consumer_done_; });
}

void ProgressChannel::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (consumer_.joinable()) {
        consumer_.join();
    }
    idle_cv_.notify_all();
}

auto ProgressChannel::dropped_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return dropped_;
}

auto ProgressChannel::delivered_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return delivered_;
}

void ProgressChannel::consume() {
    while (true) {
        std::deque<ProgressEvent> batch;
        std::vector<ProgressSink> sinks;
        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty() && stopping_) {
                consumer_done_ = true;
                break;
            }
            batch.swap(queue_);
            sinks.reserve(subscribers_.size());
            for (const auto& [id, sink] : subscribers_) {
                sinks.push_back(sink);
            }
            delivering_ = true;
        }

        // Subscribers run without the lock so publishers are never held up
        for (const auto& event : batch) {
            for (const auto& sink : sinks) {
                try {
                    sink(event);
                } catch (const std::exception& e) {
                    LOG_WARNING("ProgressChannel",
                                std::string("Progress subscriber threw: ") + e.what());
                }
            }
        }

        {
            std::lock_guard lock(mutex_);
            delivered_ += batch.size();
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }
}

}  // namespace engine
