/**
 * @file PatternGenerator.hpp
 * @brief Catalog of sanitization standards and their pass specifications
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace patterns {

/**
 * @class PatternGenerator
 * @brief Produces the ordered pass specification for a standard
 *
 * The built-in catalog is registered at construction. generate() is
 * deterministic for a given id except for the random-pass seeds, which are
 * drawn from the OpenSSL CSPRNG on every call.
 */
class PatternGenerator {
public:
    PatternGenerator();

    /**
     * @brief Ordered pass list for a standard, random passes freshly seeded
     * @param standard_id Catalog identifier (e.g. "BSI_VS_A")
     * @return Pass specs, or ConfigurationError for an unknown id
     */
    [[nodiscard]] auto generate(const std::string& standard_id) const
        -> std::expected<std::vector<PassSpec>, util::Error>;

    /**
     * @brief Catalog definition of a standard (passes carry no seeds)
     */
    [[nodiscard]] auto find(const std::string& standard_id) const
        -> std::expected<Standard, util::Error>;

    /**
     * @brief All registered standards ordered by id
     */
    [[nodiscard]] auto standards() const -> std::vector<Standard>;

    /**
     * @brief Add a custom standard
     * @return ConfigurationError if the id is taken or the pass list is invalid
     */
    auto register_standard(Standard standard) -> std::expected<void, util::Error>;

    /**
     * @brief Replace the seed of a RANDOM pass with fresh key material
     *
     * No-op for deterministic passes.
     */
    [[nodiscard]] static auto reseed(PassSpec& spec) -> std::expected<void, util::Error>;

private:
    void register_builtin_standards();
    [[nodiscard]] static auto validate(const Standard& standard) -> std::expected<void, util::Error>;

    std::map<std::string, Standard> catalog_;
    mutable std::mutex mutex_;
};

}  // namespace patterns
