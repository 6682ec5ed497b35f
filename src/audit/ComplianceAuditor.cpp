/**
 * @file ComplianceAuditor.cpp
 */

#include "audit/ComplianceAuditor.hpp"

#include <string>

namespace audit {

namespace {

auto byte_hex(uint8_t value) -> std::string {
    static constexpr char HEX[] = "0123456789ABCDEF";
    return std::string("0x") + HEX[value >> 4] + HEX[value & 0x0F];
}

auto describe_pattern(PatternKind kind, uint8_t value) -> std::string {
    if (kind == PatternKind::RANDOM) {
        return std::string(to_string(kind));
    }
    return std::string(to_string(kind)) + " " + byte_hex(value);
}

// Deterministic passes compare by the byte actually written
auto same_pattern(const PassSpec& required, const PassResult& actual) -> bool {
    if (!required.is_deterministic()) {
        return actual.pattern == PatternKind::RANDOM;
    }
    return actual.pattern != PatternKind::RANDOM && actual.value == required.value;
}

class VerdictBuilder {
public:
    VerdictBuilder(const Standard& standard, const WipeSession& session) {
        verdict_.standard_id = standard.id;
        verdict_.session_id = session.session_id;
    }

    void add(DeviationKind kind, std::optional<size_t> pass_index, std::string description) {
        Deviation deviation;
        deviation.kind = kind;
        deviation.severity = ComplianceAuditor::severity_of(kind);
        deviation.pass_index = pass_index;
        deviation.description = std::move(description);
        verdict_.deviations.push_back(std::move(deviation));
    }

    auto build() -> AuditVerdict {
        verdict_.compliant = verdict_.deviations.empty();
        return std::move(verdict_);
    }

private:
    AuditVerdict verdict_;
};

void audit_verification(VerdictBuilder& builder, size_t index, const PassSpec& required,
                        const PassResult& actual) {
    const auto& performed = actual.verification;
    const auto label = "Pass " + std::to_string(index + 1);

    if (performed.outcome == VerificationOutcome::FAILED) {
        builder.add(DeviationKind::VERIFICATION_FAILED, index,
                    label + " read-back mismatch at offset " +
                        (performed.mismatch_offset ? std::to_string(*performed.mismatch_offset)
                                                   : std::string("unknown")));
        return;
    }
    if (required.verification == VerificationMode::NONE) {
        return;
    }
    if (performed.outcome != VerificationOutcome::PASSED) {
        builder.add(DeviationKind::VERIFICATION_MISSING, index,
                    label + " requires " + std::string(to_string(required.verification)) +
                        " verification, outcome " + std::string(to_string(performed.outcome)));
        return;
    }
    if (required.verification == VerificationMode::FULL_SCAN &&
        performed.mode != VerificationMode::FULL_SCAN) {
        builder.add(DeviationKind::VERIFICATION_WEAKER, index,
                    label + " verified by " + std::string(to_string(performed.mode)) +
                        " where a full scan is required");
    }
}

}  // namespace

auto ComplianceAuditor::severity_of(DeviationKind kind) -> Severity {
    switch (kind) {
        case DeviationKind::UNEXPECTED_PASS:
            return Severity::MINOR;
        case DeviationKind::ACCESS_MODE_DOWNGRADE:
        case DeviationKind::VERIFICATION_MISSING:
        case DeviationKind::VERIFICATION_WEAKER:
            return Severity::MAJOR;
        case DeviationKind::STANDARD_MISMATCH:
        case DeviationKind::SESSION_INCOMPLETE:
        case DeviationKind::MISSING_PASS:
        case DeviationKind::PASS_FAILED:
        case DeviationKind::PATTERN_MISMATCH:
        case DeviationKind::INCOMPLETE_COVERAGE:
        case DeviationKind::ORDER_VIOLATION:
        case DeviationKind::VERIFICATION_FAILED:
            return Severity::CRITICAL;
    }
    return Severity::CRITICAL;
}

auto ComplianceAuditor::audit(const Standard& standard, const WipeSession& session)
    -> AuditVerdict {
    VerdictBuilder builder(standard, session);

    if (session.standard_id != standard.id) {
        builder.add(DeviationKind::STANDARD_MISMATCH, std::nullopt,
                    "Session ran " + session.standard_id + ", audited against " + standard.id);
    }
    if (session.status != SessionStatus::COMPLETED) {
        std::string description = "Session ended " + std::string(to_string(session.status));
        if (session.failure) {
            description += ": " + session.failure->message;
        }
        builder.add(DeviationKind::SESSION_INCOMPLETE, std::nullopt, std::move(description));
    }
    if (session.access_mode == AccessMode::FALLBACK) {
        builder.add(DeviationKind::ACCESS_MODE_DOWNGRADE, std::nullopt,
                    "Fallback access used" +
                        (session.downgrade_reason.empty() ? std::string()
                                                          : ": " + session.downgrade_reason));
    }

    // Recorded passes must appear in strictly ascending index order
    for (size_t k = 1; k < session.passes.size(); ++k) {
        if (session.passes[k].pass_index <= session.passes[k - 1].pass_index) {
            builder.add(DeviationKind::ORDER_VIOLATION, session.passes[k].pass_index,
                        "Pass " + std::to_string(session.passes[k].pass_index + 1) +
                            " recorded after pass " +
                            std::to_string(session.passes[k - 1].pass_index + 1));
        }
    }

    const uint64_t capacity = session.device.capacity_bytes;

    for (size_t i = 0; i < standard.passes.size(); ++i) {
        const auto& required = standard.passes[i];
        const auto label = "Pass " + std::to_string(i + 1);

        const PassResult* actual = nullptr;
        for (const auto& pass : session.passes) {
            if (pass.pass_index == i) {
                actual = &pass;
                break;
            }
        }

        if (actual == nullptr || actual->status == PassStatus::SKIPPED) {
            std::string description =
                label + " (" + describe_pattern(required.pattern, required.value) + ") not executed";
            if (actual != nullptr && !actual->note.empty()) {
                description += ": " + actual->note;
            }
            builder.add(DeviationKind::MISSING_PASS, i, std::move(description));
            continue;
        }

        if (!same_pattern(required, *actual)) {
            builder.add(DeviationKind::PATTERN_MISMATCH, i,
                        label + " wrote " + describe_pattern(actual->pattern, actual->value) +
                            ", required " + describe_pattern(required.pattern, required.value));
        }

        if (actual->status == PassStatus::FAILED || actual->status == PassStatus::ABORTED) {
            std::string description = label + " " + std::string(to_string(actual->status));
            if (actual->error) {
                description += ": " + actual->error->message;
            }
            builder.add(DeviationKind::PASS_FAILED, i, std::move(description));
            if (actual->verification.outcome == VerificationOutcome::FAILED) {
                audit_verification(builder, i, required, *actual);
            }
            continue;
        }

        const uint64_t expected_bytes = capacity > 0 ? capacity : actual->total_bytes;
        if (actual->bytes_written < expected_bytes) {
            builder.add(DeviationKind::INCOMPLETE_COVERAGE, i,
                        label + " covered " + std::to_string(actual->bytes_written) + " of " +
                            std::to_string(expected_bytes) + " bytes");
        }

        audit_verification(builder, i, required, *actual);
    }

    for (const auto& pass : session.passes) {
        if (pass.pass_index >= standard.passes.size() && pass.status != PassStatus::SKIPPED) {
            builder.add(DeviationKind::UNEXPECTED_PASS, pass.pass_index,
                        "Pass " + std::to_string(pass.pass_index + 1) + " is not part of " +
                            standard.id);
        }
    }

    return builder.build();
}

auto ComplianceAuditor::audit(const patterns::PatternGenerator& catalog, const WipeSession& session)
    -> std::expected<AuditVerdict, util::Error> {
    auto standard = catalog.find(session.standard_id);
    if (!standard) {
        return std::unexpected(standard.error());
    }
    return audit(*standard, session);
}

}  // namespace audit
