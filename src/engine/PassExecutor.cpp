/**
 * @file PassExecutor.cpp
 * @brief Chunked pass writing
 */

#include "engine/PassExecutor.hpp"

#include "patterns/PatternSource.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <span>
#include <vector>

namespace engine {

auto PassExecutor::execute_pass(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                                const ProgressContext& context, const ProgressSink& sink,
                                const std::atomic<bool>& cancel_flag, uint64_t start_offset) const
    -> PassResult {
    PassResult result;
    result.pass_index = context.pass_index;
    result.pattern = spec.pattern;
    result.value = spec.value;
    result.seed_fingerprint = spec.seed_fingerprint;
    result.total_bytes = accessor.capacity();
    result.bytes_written = std::min(start_offset, result.total_bytes);
    result.attempts = 1;
    result.started_at = std::chrono::system_clock::now();

    if (!accessor.is_addressable()) {
        return execute_whole_device(accessor, spec, context, sink, cancel_flag, std::move(result));
    }

    auto source = patterns::PatternSource::create(spec);
    if (!source) {
        result.status = PassStatus::FAILED;
        result.error = source.error();
        result.finished_at = std::chrono::system_clock::now();
        return result;
    }

    const uint64_t capacity = result.total_bytes;
    const size_t chunk_size = std::max<size_t>(config_.chunk_size, 1);
    std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(chunk_size, capacity)));
    if (source->is_uniform()) {
        std::fill(buffer.begin(), buffer.end(), source->uniform_value());
    }

    uint64_t offset = result.bytes_written;
    ProgressTracker tracker(context, ProgressPhase::WRITING, capacity, sink,
                            config_.progress_interval, config_.max_throughput_samples, offset);

    tracker.update(offset);
    result.status = PassStatus::SUCCEEDED;

    while (offset < capacity) {
        if (cancel_flag.load()) {
            result.status = PassStatus::ABORTED;
            result.error = util::Error::cancelled();
            break;
        }

        const auto length = static_cast<size_t>(std::min<uint64_t>(buffer.size(), capacity - offset));
        std::span<uint8_t> chunk(buffer.data(), length);
        if (!source->is_uniform()) {
            if (auto filled = source->fill(offset, chunk); !filled) {
                result.status = PassStatus::FAILED;
                result.error = filled.error();
                break;
            }
        }

        const auto chunk_start = std::chrono::steady_clock::now();
        auto written = accessor.write_chunk(offset, chunk);
        const auto chunk_elapsed = std::chrono::steady_clock::now() - chunk_start;

        if (!written) {
            result.status = PassStatus::FAILED;
            result.error = written.error();
            if (!result.error->offset) {
                result.error->offset = offset;
            }
            break;
        }
        if (config_.chunk_timeout.count() > 0 && chunk_elapsed > config_.chunk_timeout) {
            // The chunk is not counted as confirmed and will be rewritten
            auto error = util::Error::device_io(
                "Chunk write at offset " + std::to_string(offset) + " exceeded timeout of " +
                    std::to_string(config_.chunk_timeout.count()) + " ms",
                ETIMEDOUT, true);
            error.offset = offset;
            result.status = PassStatus::FAILED;
            result.error = std::move(error);
            break;
        }

        offset += length;
        result.bytes_written = offset;
        tracker.update(offset);
    }

    if (result.status == PassStatus::SUCCEEDED) {
        if (auto flushed = accessor.flush(); !flushed) {
            result.status = PassStatus::FAILED;
            result.error = flushed.error();
        }
    }

    tracker.update(result.bytes_written, true);
    result.throughput_samples = tracker.take_samples();
    result.finished_at = std::chrono::system_clock::now();

    if (result.status != PassStatus::SUCCEEDED) {
        LOG_WARNING("PassExecutor", "Pass " + std::to_string(context.pass_index + 1) + " on " +
                                        context.device_id + " ended " +
                                        std::string(to_string(result.status)) + " at " +
                                        std::to_string(result.bytes_written) + "/" +
                                        std::to_string(capacity) + " bytes" +
                                        (result.error ? ": " + result.error->message : ""));
    }
    return result;
}

auto PassExecutor::execute_whole_device(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                                        const ProgressContext& context, const ProgressSink& sink,
                                        const std::atomic<bool>& cancel_flag,
                                        PassResult result) const -> PassResult {
    if (!spec.is_deterministic() || spec.value != 0x00) {
        result.status = PassStatus::SKIPPED;
        result.bytes_written = 0;
        result.note = "Pattern " + std::string(to_string(spec.pattern)) +
                      " needs addressable access";
        result.finished_at = std::chrono::system_clock::now();
        return result;
    }

    ProgressTracker tracker(context, ProgressPhase::WRITING, result.total_bytes, sink,
                            config_.progress_interval, config_.max_throughput_samples);
    tracker.update(0, true);

    result.bytes_written = 0;
    auto filled = accessor.zero_fill_device(cancel_flag);
    if (filled) {
        result.status = PassStatus::SUCCEEDED;
        result.bytes_written = result.total_bytes;
        result.note = "Whole-device zero fill through fallback utility";
    } else if (filled.error().kind == util::ErrorKind::CANCELLATION_REQUESTED) {
        result.status = PassStatus::ABORTED;
        result.error = filled.error();
    } else {
        result.status = PassStatus::FAILED;
        result.error = filled.error();
    }

    tracker.update(result.bytes_written, true);
    result.throughput_samples = tracker.take_samples();
    result.finished_at = std::chrono::system_clock::now();
    return result;
}

}  // namespace engine
