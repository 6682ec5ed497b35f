/**
 * @file Verifier.hpp
 * @brief Read-back verification of a written pass
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/WipeConfig.hpp"
#include "models/WipeTypes.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace engine {

/**
 * @class Verifier
 * @brief Compares device contents with the pattern a pass wrote
 *
 * FULL_SCAN reads every byte. SAMPLED reads randomly placed ranges whose
 * count follows from the configured confidence and defect fraction. Any
 * mismatch is reported as FAILED with the exact offset of the first
 * differing byte.
 */
class Verifier {
public:
    /**
     * @param config Engine configuration
     * @param sample_seed Fixed seed for range selection (random when unset)
     */
    explicit Verifier(const WipeConfig& config, std::optional<uint64_t> sample_seed = std::nullopt)
        : config_(config), sample_seed_(sample_seed) {}

    [[nodiscard]] auto verify(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                              VerificationMode mode, const std::atomic<bool>& cancel_flag,
                              const ProgressContext& context = {},
                              const ProgressSink& sink = {}) const -> VerificationResult;

    /**
     * @brief Number of ranges a sampled verification reads
     *
     * ceil(ln(1 - confidence) / ln(1 - defect_fraction)), at least
     * min_ranges, at most the number of ranges on the device.
     */
    [[nodiscard]] static auto sample_count(uint64_t capacity, uint64_t range_bytes,
                                           double confidence, double defect_fraction,
                                           uint64_t min_ranges) -> uint64_t;

    /**
     * @brief Distinct range indices in [0, total), ascending
     */
    [[nodiscard]] static auto choose_ranges(uint64_t total, uint64_t count, uint64_t seed)
        -> std::vector<uint64_t>;

private:
    struct Range {
        uint64_t offset;
        uint64_t length;
    };

    [[nodiscard]] auto check_ranges(devices::IDeviceAccessor& accessor, const PassSpec& spec,
                                    const std::vector<Range>& ranges, uint64_t total_bytes,
                                    const std::atomic<bool>& cancel_flag,
                                    const ProgressContext& context, const ProgressSink& sink,
                                    VerificationResult result) const -> VerificationResult;

    const WipeConfig& config_;
    std::optional<uint64_t> sample_seed_;
};

}  // namespace engine
