/**
 * @file ProgressTracker.hpp
 * @brief Throughput bookkeeping and rate-limited progress emission for one pass
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace engine {

/**
 * @struct ProgressContext
 * @brief Identifies the pass a tracker reports for
 */
struct ProgressContext {
    std::string device_id;
    size_t pass_index = 0;
    size_t total_passes = 0;
};

/**
 * @brief Tracks speed with a rolling average of recent samples
 *
 * Events reach the sink at most once per interval (plus the forced final
 * event). Throughput samples for the session record are decimated so that
 * at most max_samples are kept regardless of pass duration. Rates count only
 * bytes beyond base_bytes, the prefix already confirmed when a pass resumes.
 *
 * @note Not thread-safe; owned by the worker running the pass.
 */
class ProgressTracker {
public:
    ProgressTracker(ProgressContext context, ProgressPhase phase, uint64_t total_bytes,
                    const ProgressSink& sink, std::chrono::milliseconds interval,
                    size_t max_samples, uint64_t base_bytes = 0)
        : context_(std::move(context)), phase_(phase), total_bytes_(total_bytes), sink_(sink),
          interval_(interval), sample_stride_(std::max(interval, std::chrono::milliseconds{1})),
          max_samples_(std::max<size_t>(max_samples, 2)),
          start_time_(std::chrono::steady_clock::now()), last_speed_time_(start_time_),
          last_emit_time_(start_time_), last_sample_time_(start_time_), base_bytes_(base_bytes),
          last_speed_bytes_(base_bytes), bytes_done_(base_bytes) {}

    /**
     * @brief Record that bytes_done bytes of the pass are complete
     * @param force Emit regardless of the interval (final event)
     */
    void update(uint64_t bytes_done, bool force = false) {
        auto now = std::chrono::steady_clock::now();
        bytes_done_ = bytes_done;

        auto since_speed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last_speed_time_);
        if (since_speed.count() >= MIN_UPDATE_INTERVAL_MS && bytes_done > last_speed_bytes_) {
            const double seconds = static_cast<double>(since_speed.count()) / 1000.0;
            speed_samples_.push_back(static_cast<uint64_t>(
                static_cast<double>(bytes_done - last_speed_bytes_) / seconds));
            if (speed_samples_.size() > MAX_SPEED_SAMPLES) {
                speed_samples_.pop_front();
            }
            last_speed_time_ = now;
            last_speed_bytes_ = bytes_done;
        }

        if (force || now - last_sample_time_ >= sample_stride_) {
            record_sample(now);
        }

        if (sink_ && (force || now - last_emit_time_ >= interval_)) {
            ProgressEvent event;
            event.device_id = context_.device_id;
            event.pass_index = context_.pass_index;
            event.total_passes = context_.total_passes;
            event.phase = phase_;
            event.bytes_done = bytes_done;
            event.total_bytes = total_bytes_;
            event.throughput_bytes_per_sec = current_speed();
            event.timestamp = std::chrono::system_clock::now();
            sink_(event);
            last_emit_time_ = now;
        }
    }

    /**
     * @brief Rolling average over the recent speed samples (bytes/s)
     */
    [[nodiscard]] auto current_speed() const -> uint64_t {
        if (speed_samples_.empty()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start_time_)
                               .count();
            if (elapsed <= 0 || bytes_done_ <= base_bytes_) {
                return 0;
            }
            return static_cast<uint64_t>(static_cast<double>(bytes_done_ - base_bytes_) * 1000.0 /
                                         static_cast<double>(elapsed));
        }
        uint64_t total = 0;
        for (auto sample : speed_samples_) {
            total += sample;
        }
        return total / speed_samples_.size();
    }

    [[nodiscard]] auto samples() const -> const std::vector<ThroughputSample>& { return samples_; }

    [[nodiscard]] auto take_samples() -> std::vector<ThroughputSample> { return std::move(samples_); }

private:
    void record_sample(std::chrono::steady_clock::time_point now) {
        ThroughputSample sample;
        sample.elapsed_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count());
        sample.bytes_done = bytes_done_;
        sample.bytes_per_sec = current_speed();
        samples_.push_back(sample);
        last_sample_time_ = now;

        if (samples_.size() >= max_samples_) {
            // Keep every other sample and halve the sampling rate
            std::vector<ThroughputSample> kept;
            kept.reserve(samples_.size() / 2 + 1);
            for (size_t i = 0; i < samples_.size(); i += 2) {
                kept.push_back(samples_[i]);
            }
            samples_ = std::move(kept);
            sample_stride_ *= 2;
        }
    }

    static constexpr size_t MAX_SPEED_SAMPLES = 10;        // Rolling average window
    static constexpr int64_t MIN_UPDATE_INTERVAL_MS = 100;  // Minimum ms between speed calculations

    ProgressContext context_;
    ProgressPhase phase_;
    uint64_t total_bytes_;
    const ProgressSink& sink_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds sample_stride_;
    size_t max_samples_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_speed_time_;
    std::chrono::steady_clock::time_point last_emit_time_;
    std::chrono::steady_clock::time_point last_sample_time_;
    uint64_t base_bytes_;
    uint64_t last_speed_bytes_;
    uint64_t bytes_done_;
    std::deque<uint64_t> speed_samples_;
    std::vector<ThroughputSample> samples_;
};

}  // namespace engine
