/**
 * @file ComplianceAuditor.hpp
 * @brief SOLL/IST comparison of a wipe session against a standard
 */

#pragma once

#include "models/AuditTypes.hpp"
#include "models/WipeTypes.hpp"
#include "patterns/PatternGenerator.hpp"
#include "util/Error.hpp"

#include <expected>

namespace audit {

/**
 * @class ComplianceAuditor
 * @brief Derives an AuditVerdict from what a standard requires (SOLL) and
 *        what a session actually did (IST)
 *
 * Pure and deterministic: the same standard and session always produce the
 * same verdict, so a persisted session can be re-audited at any time.
 */
class ComplianceAuditor {
public:
    /**
     * @brief Compare a session with a standard
     * @return Verdict; compliant iff no deviation was found
     */
    [[nodiscard]] static auto audit(const Standard& standard, const WipeSession& session)
        -> AuditVerdict;

    /**
     * @brief Audit against the standard the session names
     * @return ConfigurationError if the catalog does not know the standard
     */
    [[nodiscard]] static auto audit(const patterns::PatternGenerator& catalog,
                                    const WipeSession& session)
        -> std::expected<AuditVerdict, util::Error>;

    [[nodiscard]] static auto severity_of(DeviationKind kind) -> Severity;
};

}  // namespace audit
