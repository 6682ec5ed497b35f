/**
 * @file Verifier.cpp
 * @brief Full-scan and sampled verification
 */

#include "engine/Verifier.hpp"

#include "patterns/PatternSource.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <span>

namespace engine {

auto Verifier::sample_count(uint64_t capacity, uint64_t range_bytes, double confidence,
                            double defect_fraction, uint64_t min_ranges) -> uint64_t {
    if (capacity == 0) {
        return 0;
    }
    range_bytes = std::max<uint64_t>(range_bytes, 1);
    const uint64_t total = (capacity + range_bytes - 1) / range_bytes;

    uint64_t needed = min_ranges;
    if (confidence > 0.0 && confidence < 1.0 && defect_fraction > 0.0 && defect_fraction < 1.0) {
        const double n = std::ceil(std::log1p(-confidence) / std::log1p(-defect_fraction));
        // Past the range count (or not finite) every range is read anyway
        needed = n < static_cast<double>(total) ? std::max(needed, static_cast<uint64_t>(n)) : total;
    } else if (confidence >= 1.0) {
        needed = total;
    }
    return std::min(std::max<uint64_t>(needed, 1), total);
}

auto Verifier::choose_ranges(uint64_t total, uint64_t count, uint64_t seed)
    -> std::vector<uint64_t> {
    count = std::min(count, total);
    if (count == total) {
        std::vector<uint64_t> all(static_cast<size_t>(total));
        for (uint64_t i = 0; i < total; ++i) {
            all[static_cast<size_t>(i)] = i;
        }
        return all;
    }

    // Floyd's algorithm: count distinct values without materializing [0, total)
    std::mt19937_64 generator{seed};
    std::set<uint64_t> chosen;
    for (uint64_t j = total - count; j < total; ++j) {
        std::uniform_int_distribution<uint64_t> pick(0, j);
        const uint64_t t = pick(generator);
        if (!chosen.insert(t).second) {
            chosen.insert(j);
        }
    }
    return {chosen.begin(), chosen.end()};
}

auto Verifier::verify(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                      VerificationMode mode, const std::atomic<bool>& cancel_flag,
                      const ProgressContext& context, const ProgressSink& sink) const
    -> VerificationResult {
    VerificationResult result;
    result.mode = mode;

    if (mode == VerificationMode::NONE) {
        result.outcome = VerificationOutcome::NOT_PERFORMED;
        return result;
    }
    if (!accessor.is_addressable()) {
        result.outcome = VerificationOutcome::NOT_PERFORMED;
        result.message = "Access path cannot read back";
        return result;
    }

    const uint64_t capacity = accessor.capacity();
    std::vector<Range> ranges;

    if (mode == VerificationMode::FULL_SCAN) {
        ranges.push_back({0, capacity});
        result.confidence = 1.0;
    } else {
        const uint64_t range_bytes = std::max<uint64_t>(config_.sample_range_bytes, 1);
        const uint64_t total = (capacity + range_bytes - 1) / range_bytes;
        const uint64_t count =
            sample_count(capacity, range_bytes, config_.sampled_confidence,
                         config_.sampled_defect_fraction, config_.sample_min_ranges);
        const uint64_t seed = sample_seed_ ? *sample_seed_ : std::random_device{}();

        for (auto index : choose_ranges(total, count, seed)) {
            const uint64_t offset = index * range_bytes;
            ranges.push_back({offset, std::min(range_bytes, capacity - offset)});
        }
        result.sampled_ranges = ranges.size();
        result.confidence =
            ranges.size() == total
                ? 1.0
                : 1.0 - std::pow(1.0 - config_.sampled_defect_fraction,
                                 static_cast<double>(ranges.size()));
    }

    uint64_t total_bytes = 0;
    for (const auto& range : ranges) {
        total_bytes += range.length;
    }

    result = check_ranges(accessor, spec, ranges, total_bytes, cancel_flag, context, sink,
                          std::move(result));

    if (result.outcome == VerificationOutcome::FAILED) {
        LOG_WARNING("Verifier", "Pass " + std::to_string(context.pass_index + 1) + " on " +
                                    context.device_id + ": mismatch at offset " +
                                    std::to_string(*result.mismatch_offset));
    } else if (result.outcome == VerificationOutcome::PASSED) {
        LOG_DEBUG("Verifier", "Pass " + std::to_string(context.pass_index + 1) + " on " +
                                  context.device_id + " verified (" +
                                  std::string(to_string(mode)) + ", " +
                                  std::to_string(result.bytes_verified) + " bytes)");
    }
    return result;
}

auto Verifier::check_ranges(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                            const std::vector<Range>& ranges, uint64_t total_bytes,
                            const std::atomic<bool>& cancel_flag, const ProgressContext& context,
                            const ProgressSink& sink, VerificationResult result) const
    -> VerificationResult {
    auto source = patterns::PatternSource::create(spec);
    if (!source) {
        result.outcome = VerificationOutcome::ERROR;
        result.message = source.error().message;
        result.error = source.error();
        return result;
    }

    const size_t chunk_size = std::max<size_t>(config_.chunk_size, 1);
    std::vector<uint8_t> actual(chunk_size);
    std::vector<uint8_t> expected;
    if (!source->is_uniform()) {
        expected.resize(chunk_size);
    }

    ProgressTracker tracker(context, ProgressPhase::VERIFYING, total_bytes, sink,
                            config_.progress_interval, config_.max_throughput_samples);

    for (const auto& range : ranges) {
        uint64_t offset = range.offset;
        const uint64_t end = range.offset + range.length;

        while (offset < end) {
            if (cancel_flag.load()) {
                result.outcome = VerificationOutcome::ABORTED;
                result.message = "Verification cancelled";
                return result;
            }

            const auto length = static_cast<size_t>(std::min<uint64_t>(chunk_size, end - offset));
            std::span<uint8_t> chunk(actual.data(), length);
            if (auto read = accessor.read_chunk(offset, chunk); !read) {
                result.outcome = VerificationOutcome::ERROR;
                result.message = read.error().message;
                result.error = read.error();
                return result;
            }

            std::optional<size_t> mismatch;
            if (source->is_uniform()) {
                const uint8_t value = source->uniform_value();
                auto it = std::find_if(chunk.begin(), chunk.end(),
                                       [value](uint8_t b) { return b != value; });
                if (it != chunk.end()) {
                    mismatch = static_cast<size_t>(it - chunk.begin());
                }
            } else {
                std::span<uint8_t> want(expected.data(), length);
                if (auto filled = source->fill(offset, want); !filled) {
                    result.outcome = VerificationOutcome::ERROR;
                    result.message = filled.error().message;
                    result.error = filled.error();
                    return result;
                }
                auto diff = std::mismatch(chunk.begin(), chunk.end(), want.begin());
                if (diff.first != chunk.end()) {
                    mismatch = static_cast<size_t>(diff.first - chunk.begin());
                }
            }

            if (mismatch) {
                result.outcome = VerificationOutcome::FAILED;
                result.mismatch_offset = offset + *mismatch;
                result.bytes_verified += *mismatch;
                result.message = "Mismatch at offset " + std::to_string(*result.mismatch_offset);
                tracker.update(result.bytes_verified, true);
                return result;
            }

            offset += length;
            result.bytes_verified += length;
            tracker.update(result.bytes_verified);
        }
    }

    tracker.update(result.bytes_verified, true);
    result.outcome = VerificationOutcome::PASSED;
    return result;
}

}  // namespace engine
