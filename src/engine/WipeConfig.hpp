/**
 * @file WipeConfig.hpp
 * @brief Tunables of the sanitization engine
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace engine {

/**
 * @enum VerificationPolicy
 * @brief How the orchestrator derives the verification performed per pass
 */
enum class VerificationPolicy {
    AS_REQUIRED,    ///< Follow each pass's requirement
    ALWAYS_FULL,    ///< Full scan after every addressable pass
    SAMPLED_ONLY,   ///< Sampled wherever verification is required
    SKIP            ///< No read-back at all
};

[[nodiscard]] auto to_string(VerificationPolicy policy) -> std::string_view;
[[nodiscard]] auto verification_policy_from_string(std::string_view name)
    -> std::optional<VerificationPolicy>;

/**
 * @struct WipeConfig
 * @brief Engine configuration, passed at orchestrator construction
 */
struct WipeConfig {
    size_t chunk_size = 1'024 * 1'024;   ///< Write/verify granularity (multiple of 512)

    // Transient I/O errors
    uint32_t max_io_retries = 3;
    std::chrono::milliseconds retry_backoff{100};   ///< First delay, doubled per retry
    std::chrono::milliseconds max_backoff{5'000};
    std::chrono::milliseconds chunk_timeout{30'000}; ///< Slower chunk writes count as failures

    // Progress
    std::chrono::milliseconds progress_interval{100};
    size_t progress_queue_capacity = 1'024;
    size_t max_throughput_samples = 256;

    // Verification
    VerificationPolicy verification_policy = VerificationPolicy::AS_REQUIRED;
    bool verify_final_pass_by_default = true;
    double sampled_confidence = 0.99;
    double sampled_defect_fraction = 0.001;
    size_t sample_range_bytes = 64 * 1'024;
    size_t sample_min_ranges = 16;
    uint32_t max_pass_reexecutions = 1;

    // Safety
    std::string confirmation_phrase = "ERASE";

    // Fallback access
    std::vector<std::string> fallback_command = {"blkdiscard", "--zeroout", "{path}"};
};

}  // namespace engine
