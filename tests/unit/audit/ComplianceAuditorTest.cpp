/**
 * @file ComplianceAuditorTest.cpp
 * @brief Unit tests for ComplianceAuditor
 */

#include "audit/ComplianceAuditor.hpp"

#include "patterns/PatternGenerator.hpp"

#include <gtest/gtest.h>

using audit::ComplianceAuditor;

namespace {
constexpr uint64_t CAPACITY = 8 * 1'024 * 1'024;
}

class ComplianceAuditorTest : public ::testing::Test {
protected:
    patterns::PatternGenerator catalog;

    auto Find(const std::string& id) -> Standard {
        auto standard = catalog.find(id);
        EXPECT_TRUE(standard.has_value()) << id;
        return standard.value_or(Standard{});
    }

    // Session that did exactly what the standard requires
    static auto CompliantSession(const Standard& standard) -> WipeSession {
        WipeSession session;
        session.session_id = "0123abcd";
        session.device = {.id = "sdb", .path = "/dev/sdb", .capacity_bytes = CAPACITY};
        session.standard_id = standard.id;
        session.status = SessionStatus::COMPLETED;
        session.finalized = true;

        for (size_t i = 0; i < standard.passes.size(); ++i) {
            const auto& spec = standard.passes[i];
            PassResult pass;
            pass.pass_index = i;
            pass.pattern = spec.pattern;
            pass.value = spec.value;
            pass.bytes_written = CAPACITY;
            pass.total_bytes = CAPACITY;
            pass.attempts = 1;
            pass.status = PassStatus::SUCCEEDED;
            if (spec.verification != VerificationMode::NONE) {
                pass.verification.mode = spec.verification;
                pass.verification.outcome = VerificationOutcome::PASSED;
                pass.verification.bytes_verified = CAPACITY;
            }
            session.passes.push_back(pass);
        }
        return session;
    }
};

// Test: a session that matches its standard has no deviations
TEST_F(ComplianceAuditorTest, Audit_MatchingSession_Compliant) {
    for (const auto& id : {"NIST_800_88", "BSI_VS_A"}) {
        auto standard = Find(id);

        auto verdict = ComplianceAuditor::audit(standard, CompliantSession(standard));

        EXPECT_TRUE(verdict.compliant) << id;
        EXPECT_TRUE(verdict.deviations.empty()) << id;
        EXPECT_EQ(verdict.standard_id, id);
        EXPECT_EQ(verdict.session_id, "0123abcd");
        EXPECT_FALSE(verdict.max_severity().has_value());
    }
}

// Test: the same input always produces the same verdict
TEST_F(ComplianceAuditorTest, Audit_IsDeterministic) {
    auto standard = Find("BSI_VS_A");
    auto session = CompliantSession(standard);
    session.passes[1].value = 0x00;
    session.status = SessionStatus::FAILED;

    EXPECT_EQ(ComplianceAuditor::audit(standard, session),
              ComplianceAuditor::audit(standard, session));
}

// Test: a fallback single zero pass against a three-pass standard
TEST_F(ComplianceAuditorTest, Audit_FallbackZeroOnly_DowngradeAndMissingPasses) {
    auto standard = Find("BSI_VS_A");
    auto session = CompliantSession(standard);
    session.access_mode = AccessMode::FALLBACK;
    session.downgrade_reason = "Permission denied";
    session.passes[0].verification = {};
    for (size_t i = 1; i < session.passes.size(); ++i) {
        session.passes[i].status = PassStatus::SKIPPED;
        session.passes[i].bytes_written = 0;
        session.passes[i].note = "needs addressable access";
    }

    auto verdict = ComplianceAuditor::audit(standard, session);

    EXPECT_FALSE(verdict.compliant);
    EXPECT_TRUE(verdict.has(DeviationKind::ACCESS_MODE_DOWNGRADE));
    EXPECT_TRUE(verdict.has(DeviationKind::MISSING_PASS));
    EXPECT_FALSE(verdict.has(DeviationKind::PATTERN_MISMATCH));
    EXPECT_EQ(verdict.max_severity(), Severity::CRITICAL);

    size_t missing = 0;
    for (const auto& deviation : verdict.deviations) {
        if (deviation.kind == DeviationKind::MISSING_PASS) {
            ++missing;
            EXPECT_NE(deviation.description.find("needs addressable access"), std::string::npos);
        }
        if (deviation.kind == DeviationKind::ACCESS_MODE_DOWNGRADE) {
            EXPECT_EQ(deviation.severity, Severity::MAJOR);
            EXPECT_NE(deviation.description.find("Permission denied"), std::string::npos);
        }
    }
    EXPECT_EQ(missing, 2u);
}

// Test: an aborted session is incomplete and its partial pass is flagged
TEST_F(ComplianceAuditorTest, Audit_Aborted_SessionIncompleteAndPassFailed) {
    auto standard = Find("NIST_800_88");
    auto session = CompliantSession(standard);
    session.status = SessionStatus::ABORTED;
    session.failure = util::Error::cancelled();
    session.passes[0].status = PassStatus::ABORTED;
    session.passes[0].bytes_written = CAPACITY / 2;
    session.passes[0].verification = {};
    session.passes[0].error = util::Error::cancelled();

    auto verdict = ComplianceAuditor::audit(standard, session);

    EXPECT_FALSE(verdict.compliant);
    EXPECT_TRUE(verdict.has(DeviationKind::SESSION_INCOMPLETE));
    EXPECT_TRUE(verdict.has(DeviationKind::PASS_FAILED));
    EXPECT_FALSE(verdict.has(DeviationKind::INCOMPLETE_COVERAGE));
}

// Test: a failed read-back is reported with its offset
TEST_F(ComplianceAuditorTest, Audit_VerificationFailed_ReportsOffset) {
    auto standard = Find("NIST_800_88");
    auto session = CompliantSession(standard);
    session.status = SessionStatus::FAILED;
    session.failure = util::Error::verification_failed(5'000'000);
    session.passes[0].status = PassStatus::FAILED;
    session.passes[0].verification.outcome = VerificationOutcome::FAILED;
    session.passes[0].verification.mismatch_offset = 5'000'000;

    auto verdict = ComplianceAuditor::audit(standard, session);

    ASSERT_TRUE(verdict.has(DeviationKind::VERIFICATION_FAILED));
    for (const auto& deviation : verdict.deviations) {
        if (deviation.kind == DeviationKind::VERIFICATION_FAILED) {
            EXPECT_EQ(deviation.pass_index, 0u);
            EXPECT_NE(deviation.description.find("5000000"), std::string::npos);
        }
    }
}

TEST_F(ComplianceAuditorTest, Audit_WrongByte_PatternMismatch) {
    auto standard = Find("BSI_VS_A");
    auto session = CompliantSession(standard);
    session.passes[1].value = 0x00;

    auto verdict = ComplianceAuditor::audit(standard, session);

    ASSERT_EQ(verdict.deviations.size(), 1u);
    EXPECT_EQ(verdict.deviations[0].kind, DeviationKind::PATTERN_MISMATCH);
    EXPECT_EQ(verdict.deviations[0].pass_index, 1u);
}

TEST_F(ComplianceAuditorTest, Audit_ShortPass_IncompleteCoverage) {
    auto standard = Find("NIST_800_88");
    auto session = CompliantSession(standard);
    session.passes[0].bytes_written = CAPACITY - 512;

    auto verdict = ComplianceAuditor::audit(standard, session);

    ASSERT_EQ(verdict.deviations.size(), 1u);
    EXPECT_EQ(verdict.deviations[0].kind, DeviationKind::INCOMPLETE_COVERAGE);
}

// Test: verification below what the standard requires
TEST_F(ComplianceAuditorTest, Audit_Verification_MissingOrWeaker) {
    auto standard = Find("NIST_800_88");
    ASSERT_EQ(standard.passes[0].verification, VerificationMode::FULL_SCAN);

    auto skipped = CompliantSession(standard);
    skipped.passes[0].verification = {};
    EXPECT_TRUE(ComplianceAuditor::audit(standard, skipped).has(DeviationKind::VERIFICATION_MISSING));

    auto sampled = CompliantSession(standard);
    sampled.passes[0].verification.mode = VerificationMode::SAMPLED;
    auto verdict = ComplianceAuditor::audit(standard, sampled);
    EXPECT_TRUE(verdict.has(DeviationKind::VERIFICATION_WEAKER));
    EXPECT_EQ(verdict.max_severity(), Severity::MAJOR);
}

TEST_F(ComplianceAuditorTest, Audit_OutOfOrderPasses_OrderViolation) {
    auto standard = Find("BSI_VS_A");
    auto session = CompliantSession(standard);
    std::swap(session.passes[0], session.passes[1]);

    auto verdict = ComplianceAuditor::audit(standard, session);

    EXPECT_TRUE(verdict.has(DeviationKind::ORDER_VIOLATION));
}

TEST_F(ComplianceAuditorTest, Audit_ExtraPass_UnexpectedPassMinor) {
    auto standard = Find("NIST_800_88");
    auto session = CompliantSession(standard);
    auto extra = session.passes[0];
    extra.pass_index = 1;
    extra.verification = {};
    session.passes.push_back(extra);

    auto verdict = ComplianceAuditor::audit(standard, session);

    ASSERT_EQ(verdict.deviations.size(), 1u);
    EXPECT_EQ(verdict.deviations[0].kind, DeviationKind::UNEXPECTED_PASS);
    EXPECT_EQ(verdict.deviations[0].severity, Severity::MINOR);
}

// Test: auditing against another standard than the one that ran
TEST_F(ComplianceAuditorTest, Audit_DifferentStandard_StandardMismatch) {
    auto nist = Find("NIST_800_88");
    auto session = CompliantSession(nist);

    auto verdict = ComplianceAuditor::audit(Find("BSI_VS_A"), session);

    EXPECT_FALSE(verdict.compliant);
    EXPECT_TRUE(verdict.has(DeviationKind::STANDARD_MISMATCH));
    EXPECT_TRUE(verdict.has(DeviationKind::MISSING_PASS));
}

TEST_F(ComplianceAuditorTest, AuditByCatalog_UnknownStandard_ConfigurationError) {
    auto session = CompliantSession(Find("NIST_800_88"));
    session.standard_id = "NO_SUCH_STANDARD";

    auto verdict = ComplianceAuditor::audit(catalog, session);

    ASSERT_FALSE(verdict.has_value());
    EXPECT_EQ(verdict.error().kind, util::ErrorKind::CONFIGURATION);
}

TEST_F(ComplianceAuditorTest, AuditByCatalog_KnownStandard_Compliant) {
    auto verdict = ComplianceAuditor::audit(catalog, CompliantSession(Find("BSI_VS_A")));

    ASSERT_TRUE(verdict.has_value());
    EXPECT_TRUE(verdict->compliant);
}
