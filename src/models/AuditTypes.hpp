/**
 * @file AuditTypes.hpp
 * @brief Compliance verdict types (SOLL vs IST)
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class DeviationKind {
    STANDARD_MISMATCH,
    SESSION_INCOMPLETE,
    ACCESS_MODE_DOWNGRADE,
    MISSING_PASS,
    PASS_FAILED,
    PATTERN_MISMATCH,
    INCOMPLETE_COVERAGE,
    ORDER_VIOLATION,
    UNEXPECTED_PASS,
    VERIFICATION_MISSING,
    VERIFICATION_WEAKER,
    VERIFICATION_FAILED
};

enum class Severity {
    MINOR,
    MAJOR,
    CRITICAL
};

/**
 * @struct Deviation
 * @brief One discrepancy between what the standard requires and what was done
 */
struct Deviation {
    DeviationKind kind = DeviationKind::SESSION_INCOMPLETE;
    Severity severity = Severity::CRITICAL;
    std::optional<size_t> pass_index;
    std::string description;

    auto operator==(const Deviation&) const -> bool = default;
};

/**
 * @struct AuditVerdict
 * @brief Derived, immutable result of auditing one session against one standard
 */
struct AuditVerdict {
    std::string standard_id;
    std::string session_id;
    bool compliant = false;   ///< true iff deviations is empty
    std::vector<Deviation> deviations;

    [[nodiscard]] auto has(DeviationKind kind) const -> bool {
        for (const auto& deviation : deviations) {
            if (deviation.kind == kind) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto max_severity() const -> std::optional<Severity> {
        std::optional<Severity> worst;
        for (const auto& deviation : deviations) {
            if (!worst || deviation.severity > *worst) {
                worst = deviation.severity;
            }
        }
        return worst;
    }

    auto operator==(const AuditVerdict&) const -> bool = default;
};

[[nodiscard]] inline auto to_string(DeviationKind kind) -> std::string_view {
    switch (kind) {
        case DeviationKind::STANDARD_MISMATCH:
            return "StandardMismatch";
        case DeviationKind::SESSION_INCOMPLETE:
            return "SessionIncomplete";
        case DeviationKind::ACCESS_MODE_DOWNGRADE:
            return "AccessModeDowngrade";
        case DeviationKind::MISSING_PASS:
            return "MissingPass";
        case DeviationKind::PASS_FAILED:
            return "PassFailed";
        case DeviationKind::PATTERN_MISMATCH:
            return "PatternMismatch";
        case DeviationKind::INCOMPLETE_COVERAGE:
            return "IncompleteCoverage";
        case DeviationKind::ORDER_VIOLATION:
            return "OrderViolation";
        case DeviationKind::UNEXPECTED_PASS:
            return "UnexpectedPass";
        case DeviationKind::VERIFICATION_MISSING:
            return "VerificationMissing";
        case DeviationKind::VERIFICATION_WEAKER:
            return "VerificationWeaker";
        case DeviationKind::VERIFICATION_FAILED:
            return "VerificationFailed";
    }
    return "Unknown";
}

[[nodiscard]] inline auto to_string(Severity severity) -> std::string_view {
    switch (severity) {
        case Severity::MINOR:
            return "minor";
        case Severity::MAJOR:
            return "major";
        case Severity::CRITICAL:
            return "critical";
    }
    return "unknown";
}

[[nodiscard]] inline auto deviation_kind_from_string(std::string_view name)
    -> std::optional<DeviationKind> {
    for (auto kind : {DeviationKind::STANDARD_MISMATCH, DeviationKind::SESSION_INCOMPLETE,
                      DeviationKind::ACCESS_MODE_DOWNGRADE, DeviationKind::MISSING_PASS,
                      DeviationKind::PASS_FAILED, DeviationKind::PATTERN_MISMATCH,
                      DeviationKind::INCOMPLETE_COVERAGE, DeviationKind::ORDER_VIOLATION,
                      DeviationKind::UNEXPECTED_PASS, DeviationKind::VERIFICATION_MISSING,
                      DeviationKind::VERIFICATION_WEAKER, DeviationKind::VERIFICATION_FAILED}) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline auto severity_from_string(std::string_view name) -> std::optional<Severity> {
    for (auto severity : {Severity::MINOR, Severity::MAJOR, Severity::CRITICAL}) {
        if (to_string(severity) == name) {
            return severity;
        }
    }
    return std::nullopt;
}
