/**
 * @file SessionSerializer.hpp
 * @brief Versioned, tamper-evident JSON record of a wipe session
 */

#pragma once

#include "models/AuditTypes.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace audit {

/**
 * @struct SessionRecord
 * @brief A session loaded back from disk, with the verdict stored beside it
 */
struct SessionRecord {
    WipeSession session;
    std::optional<AuditVerdict> verdict;
};

/**
 * @class SessionSerializer
 * @brief Reads and writes session records
 *
 * Layout:
 * @code
 * {
 *   "format": "disk-sanitizer/session",
 *   "version": 1,
 *   "digest": "<sha256 hex of body.dump()>",
 *   "body": { "session": {...}, "verdict": {...} }
 * }
 * @endcode
 *
 * Random seeds are never written; passes carry only the seed fingerprint.
 */
class SessionSerializer {
public:
    static constexpr std::string_view FORMAT = "disk-sanitizer/session";
    static constexpr int VERSION = 1;

    [[nodiscard]] static auto to_json(const WipeSession& session,
                                      const std::optional<AuditVerdict>& verdict = std::nullopt)
        -> nlohmann::json;

    [[nodiscard]] static auto serialize(const WipeSession& session,
                                        const std::optional<AuditVerdict>& verdict = std::nullopt)
        -> std::string;

    /**
     * @brief Parse and check a record
     * @return ConfigurationError on malformed JSON, wrong format or version,
     *         or a digest that does not match the body
     */
    [[nodiscard]] static auto deserialize(std::string_view text)
        -> std::expected<SessionRecord, util::Error>;

    [[nodiscard]] static auto save(const std::filesystem::path& path, const WipeSession& session,
                                   const std::optional<AuditVerdict>& verdict = std::nullopt)
        -> std::expected<void, util::Error>;

    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> std::expected<SessionRecord, util::Error>;

    [[nodiscard]] static auto verdict_to_json(const AuditVerdict& verdict) -> nlohmann::json;
};

}  // namespace audit
