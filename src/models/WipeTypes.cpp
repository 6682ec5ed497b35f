/**
 * @file WipeTypes.cpp
 * @brief Name tables and helpers for session data types
 */

#include "models/WipeTypes.hpp"

#include <initializer_list>
#include <numeric>

namespace {

template <typename Enum>
auto parse_enum(std::string_view name, std::initializer_list<Enum> values) -> std::optional<Enum> {
    for (auto value : values) {
        if (to_string(value) == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

auto PassResult::average_throughput() const -> uint64_t {
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at).count();
    if (elapsed <= 0) {
        return throughput_samples.empty() ? 0 : throughput_samples.back().bytes_per_sec;
    }
    return static_cast<uint64_t>(static_cast<double>(bytes_written) * 1000.0 /
                                 static_cast<double>(elapsed));
}

auto WipeSession::total_bytes_written() const -> uint64_t {
    return std::accumulate(passes.begin(), passes.end(), uint64_t{0},
                           [](uint64_t sum, const PassResult& pass) {
                               return sum + pass.bytes_written;
                           });
}

auto WipeSession::duration() const -> std::chrono::milliseconds {
    if (finished_at < started_at) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
}

auto to_string(PatternKind kind) -> std::string_view {
    switch (kind) {
        case PatternKind::ZERO:
            return "zero";
        case PatternKind::ONE:
            return "one";
        case PatternKind::RANDOM:
            return "random";
        case PatternKind::FIXED:
            return "fixed";
        case PatternKind::COMPLEMENT:
            return "complement";
    }
    return "unknown";
}

auto to_string(VerificationMode mode) -> std::string_view {
    switch (mode) {
        case VerificationMode::NONE:
            return "none";
        case VerificationMode::SAMPLED:
            return "sampled";
        case VerificationMode::FULL_SCAN:
            return "full-scan";
    }
    return "unknown";
}

auto to_string(AccessMode mode) -> std::string_view {
    switch (mode) {
        case AccessMode::DIRECT:
            return "direct";
        case AccessMode::FALLBACK:
            return "fallback";
    }
    return "unknown";
}

auto to_string(PassStatus status) -> std::string_view {
    switch (status) {
        case PassStatus::SUCCEEDED:
            return "succeeded";
        case PassStatus::FAILED:
            return "failed";
        case PassStatus::SKIPPED:
            return "skipped";
        case PassStatus::ABORTED:
            return "aborted";
    }
    return "unknown";
}

auto to_string(SessionStatus status) -> std::string_view {
    switch (status) {
        case SessionStatus::PENDING:
            return "pending";
        case SessionStatus::COMPLETED:
            return "completed";
        case SessionStatus::ABORTED:
            return "aborted";
        case SessionStatus::FAILED:
            return "failed";
    }
    return "unknown";
}

auto to_string(VerificationOutcome outcome) -> std::string_view {
    switch (outcome) {
        case VerificationOutcome::NOT_PERFORMED:
            return "not-performed";
        case VerificationOutcome::PASSED:
            return "passed";
        case VerificationOutcome::FAILED:
            return "failed";
        case VerificationOutcome::ABORTED:
            return "aborted";
        case VerificationOutcome::ERROR:
            return "error";
    }
    return "unknown";
}

auto to_string(OrchestratorState state) -> std::string_view {
    switch (state) {
        case OrchestratorState::IDLE:
            return "Idle";
        case OrchestratorState::VALIDATING:
            return "Validating";
        case OrchestratorState::SELECTING_ACCESS_MODE:
            return "SelectingAccessMode";
        case OrchestratorState::EXECUTING:
            return "Executing";
        case OrchestratorState::VERIFYING:
            return "Verifying";
        case OrchestratorState::FINALIZING:
            return "Finalizing";
        case OrchestratorState::COMPLETED:
            return "Completed";
        case OrchestratorState::ABORTED:
            return "Aborted";
        case OrchestratorState::FAILED:
            return "Failed";
    }
    return "Unknown";
}

auto pattern_kind_from_string(std::string_view name) -> std::optional<PatternKind> {
    return parse_enum(name, {PatternKind::ZERO, PatternKind::ONE, PatternKind::RANDOM,
                             PatternKind::FIXED, PatternKind::COMPLEMENT});
}

auto verification_mode_from_string(std::string_view name) -> std::optional<VerificationMode> {
    return parse_enum(name, {VerificationMode::NONE, VerificationMode::SAMPLED,
                             VerificationMode::FULL_SCAN});
}

auto access_mode_from_string(std::string_view name) -> std::optional<AccessMode> {
    return parse_enum(name, {AccessMode::DIRECT, AccessMode::FALLBACK});
}

auto pass_status_from_string(std::string_view name) -> std::optional<PassStatus> {
    return parse_enum(name, {PassStatus::SUCCEEDED, PassStatus::FAILED, PassStatus::SKIPPED,
                             PassStatus::ABORTED});
}

auto session_status_from_string(std::string_view name) -> std::optional<SessionStatus> {
    return parse_enum(name, {SessionStatus::PENDING, SessionStatus::COMPLETED,
                             SessionStatus::ABORTED, SessionStatus::FAILED});
}

auto verification_outcome_from_string(std::string_view name)
    -> std::optional<VerificationOutcome> {
    return parse_enum(name, {VerificationOutcome::NOT_PERFORMED, VerificationOutcome::PASSED,
                             VerificationOutcome::FAILED, VerificationOutcome::ABORTED,
                             VerificationOutcome::ERROR});
}

auto orchestrator_state_from_string(std::string_view name) -> std::optional<OrchestratorState> {
    return parse_enum(name,
                      {OrchestratorState::IDLE, OrchestratorState::VALIDATING,
                       OrchestratorState::SELECTING_ACCESS_MODE, OrchestratorState::EXECUTING,
                       OrchestratorState::VERIFYING, OrchestratorState::FINALIZING,
                       OrchestratorState::COMPLETED, OrchestratorState::ABORTED,
                       OrchestratorState::FAILED});
}
