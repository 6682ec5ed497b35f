/**
 * @file WipeTypes.hpp
 * @brief Data types for sanitization sessions
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "util/Error.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @enum PatternKind
 * @brief Byte pattern written by a pass
 */
enum class PatternKind {
    ZERO,        ///< Constant 0x00
    ONE,         ///< Constant 0xFF
    RANDOM,      ///< Cryptographically seeded keystream, fresh per pass
    FIXED,       ///< Constant caller-chosen byte
    COMPLEMENT   ///< Bitwise complement of an earlier deterministic pass
};

/**
 * @enum VerificationMode
 * @brief How thoroughly a pass is read back
 */
enum class VerificationMode {
    NONE,
    SAMPLED,    ///< Random ranges, bounded count, stated confidence
    FULL_SCAN   ///< Every byte
};

/**
 * @enum AccessMode
 * @brief Device access path actually used by a session
 */
enum class AccessMode {
    DIRECT,    ///< Raw, addressable block I/O
    FALLBACK   ///< External disk-clearing utility, whole-device zero fill only
};

enum class PassStatus {
    SUCCEEDED,
    FAILED,
    SKIPPED,
    ABORTED
};

enum class SessionStatus {
    PENDING,
    COMPLETED,
    ABORTED,
    FAILED
};

enum class VerificationOutcome {
    NOT_PERFORMED,
    PASSED,
    FAILED,
    ABORTED,
    ERROR
};

enum class ProgressPhase {
    WRITING,
    VERIFYING
};

/**
 * @enum OrchestratorState
 * @brief States of the per-device wipe state machine
 */
enum class OrchestratorState {
    IDLE,
    VALIDATING,
    SELECTING_ACCESS_MODE,
    EXECUTING,
    VERIFYING,
    FINALIZING,
    COMPLETED,
    ABORTED,
    FAILED
};

/**
 * @struct PatternSeed
 * @brief Key material for a random pass (AES-256-CTR key and initial counter)
 *
 * Lives only in memory for the duration of a session; records keep the
 * fingerprint.
 */
struct PatternSeed {
    std::array<uint8_t, 32> key{};
    std::array<uint8_t, 16> iv{};
};

/**
 * @struct PassSpec
 * @brief One pass of a standard
 */
struct PassSpec {
    PatternKind pattern = PatternKind::ZERO;
    uint8_t value = 0x00;                   ///< Byte written by deterministic kinds
    std::optional<size_t> complement_of;    ///< Referenced pass for COMPLEMENT
    VerificationMode verification = VerificationMode::NONE;
    std::optional<PatternSeed> seed;        ///< Set for RANDOM passes
    std::string seed_fingerprint;           ///< Hex SHA-256 prefix of the seed

    [[nodiscard]] auto is_deterministic() const -> bool {
        return pattern != PatternKind::RANDOM;
    }
};

/**
 * @struct Standard
 * @brief A named sanitization standard (required passes, in order)
 */
struct Standard {
    std::string id;
    std::string name;
    std::string description;
    std::vector<PassSpec> passes;
};

struct ThroughputSample {
    uint64_t elapsed_ms = 0;        ///< Since the pass started
    uint64_t bytes_done = 0;
    uint64_t bytes_per_sec = 0;     ///< Rolling average at that moment

    auto operator==(const ThroughputSample&) const -> bool = default;
};

struct VerificationResult {
    VerificationMode mode = VerificationMode::NONE;
    VerificationOutcome outcome = VerificationOutcome::NOT_PERFORMED;
    uint64_t bytes_verified = 0;
    std::optional<uint64_t> mismatch_offset;   ///< First differing byte
    uint64_t sampled_ranges = 0;
    double confidence = 0.0;                   ///< Stated bound for SAMPLED, 1.0 for FULL_SCAN
    std::string message;
    std::optional<util::Error> error;          ///< Set when outcome is ERROR

    [[nodiscard]] auto passed() const -> bool {
        return outcome == VerificationOutcome::PASSED;
    }
};

/**
 * @struct PassResult
 * @brief What actually happened during one pass
 */
struct PassResult {
    size_t pass_index = 0;
    PatternKind pattern = PatternKind::ZERO;
    uint8_t value = 0x00;
    std::string seed_fingerprint;
    uint64_t bytes_written = 0;
    uint64_t total_bytes = 0;
    uint32_t attempts = 0;          ///< Write attempts including I/O retries
    uint32_t reexecutions = 0;      ///< Rewrites after a failed verification
    std::vector<ThroughputSample> throughput_samples;
    VerificationResult verification;
    PassStatus status = PassStatus::SKIPPED;
    std::optional<util::Error> error;
    std::string note;
    Timestamp started_at{};
    Timestamp finished_at{};

    [[nodiscard]] auto average_throughput() const -> uint64_t;
};

struct SessionEvent {
    Timestamp at{};
    OrchestratorState state = OrchestratorState::IDLE;
    std::optional<size_t> pass_index;
    std::string message;
};

/**
 * @struct WipeSession
 * @brief The auditable record of one device's sanitization
 *
 * Built by the orchestrator through SessionRecorder; handed out as
 * std::shared_ptr<const WipeSession> once finalized.
 */
struct WipeSession {
    std::string session_id;
    DeviceInfo device;
    std::string standard_id;
    AccessMode access_mode = AccessMode::DIRECT;
    std::string downgrade_reason;
    std::vector<PassResult> passes;
    SessionStatus status = SessionStatus::PENDING;
    std::optional<util::Error> failure;
    Timestamp started_at{};
    Timestamp finished_at{};
    std::vector<SessionEvent> events;
    bool finalized = false;

    [[nodiscard]] auto total_bytes_written() const -> uint64_t;
    [[nodiscard]] auto duration() const -> std::chrono::milliseconds;
};

/**
 * @struct ProgressEvent
 * @brief Live progress sample for real-time consumers
 */
struct ProgressEvent {
    std::string device_id;
    size_t pass_index = 0;
    size_t total_passes = 0;
    ProgressPhase phase = ProgressPhase::WRITING;
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;
    uint64_t throughput_bytes_per_sec = 0;
    Timestamp timestamp{};

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) {
            return 100.0;
        }
        return (static_cast<double>(bytes_done) / static_cast<double>(total_bytes)) * 100.0;
    }
};

/**
 * @brief Callback type for progress reporting
 */
using ProgressSink = std::function<void(const ProgressEvent&)>;

/**
 * @struct WipeRequest
 * @brief Structured request from the interaction layer
 */
struct WipeRequest {
    std::vector<std::string> device_ids;
    std::string standard_id;
    std::string confirmation_token;   ///< Gates the irreversible action
};

// Stable names used by logs, records and the CLI
[[nodiscard]] auto to_string(PatternKind kind) -> std::string_view;
[[nodiscard]] auto to_string(VerificationMode mode) -> std::string_view;
[[nodiscard]] auto to_string(AccessMode mode) -> std::string_view;
[[nodiscard]] auto to_string(PassStatus status) -> std::string_view;
[[nodiscard]] auto to_string(SessionStatus status) -> std::string_view;
[[nodiscard]] auto to_string(VerificationOutcome outcome) -> std::string_view;
[[nodiscard]] auto to_string(OrchestratorState state) -> std::string_view;

[[nodiscard]] auto pattern_kind_from_string(std::string_view name) -> std::optional<PatternKind>;
[[nodiscard]] auto verification_mode_from_string(std::string_view name)
    -> std::optional<VerificationMode>;
[[nodiscard]] auto access_mode_from_string(std::string_view name) -> std::optional<AccessMode>;
[[nodiscard]] auto pass_status_from_string(std::string_view name) -> std::optional<PassStatus>;
[[nodiscard]] auto session_status_from_string(std::string_view name)
    -> std::optional<SessionStatus>;
[[nodiscard]] auto verification_outcome_from_string(std::string_view name)
    -> std::optional<VerificationOutcome>;
[[nodiscard]] auto orchestrator_state_from_string(std::string_view name)
    -> std::optional<OrchestratorState>;
