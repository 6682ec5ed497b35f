/**
 * @file PassExecutor.hpp
 * @brief Writes one pass's pattern across a device
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/WipeConfig.hpp"
#include "models/WipeTypes.hpp"

#include <atomic>
#include <cstdint>

namespace engine {

/**
 * @class PassExecutor
 * @brief Streams a pattern in fixed-size chunks over the whole capacity
 *
 * A single call makes one attempt. A chunk failure ends the attempt with
 * status FAILED and bytes_written equal to the confirmed prefix, so the
 * caller can resume from there. Cancellation is observed between chunks.
 */
class PassExecutor {
public:
    explicit PassExecutor(const WipeConfig& config) : config_(config) {}

    /**
     * @brief Write the pass from start_offset to the end of the device
     * @param accessor Opened accessor
     * @param spec Pass to write (RANDOM passes must carry a seed)
     * @param context Pass identity for progress events
     * @param sink Progress consumer (may be empty)
     * @param cancel_flag Cooperative cancellation
     * @param start_offset Confirmed prefix from an earlier attempt
     * @return Result with bytes_written counted from offset 0
     */
    [[nodiscard]] auto execute_pass(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                                    const ProgressContext& context, const ProgressSink& sink,
                                    const std::atomic<bool>& cancel_flag,
                                    uint64_t start_offset = 0) const -> PassResult;

private:
    [[nodiscard]] auto execute_whole_device(devices::IDeviceAccessor& accessor,
                                            const PassSpec& spec, const ProgressContext& context,
                                            const ProgressSink& sink,
                                            const std::atomic<bool>& cancel_flag,
                                            PassResult result) const -> PassResult;

    const WipeConfig& config_;
};

}  // namespace engine
