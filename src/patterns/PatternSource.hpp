/**
 * @file PatternSource.hpp
 * @brief Produces the bytes a pass writes at any device offset
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>

struct evp_cipher_ctx_st;

namespace patterns {

/**
 * @class PatternSource
 * @brief Random-access generator for a pass's expected content
 *
 * Deterministic kinds produce a constant byte. RANDOM produces an
 * AES-256-CTR keystream keyed by the pass seed, so the same bytes can be
 * regenerated at any offset for verification without storing them.
 */
class PatternSource {
public:
    /**
     * @brief Create a source for a pass
     * @return ConfigurationError if a RANDOM pass carries no seed
     */
    [[nodiscard]] static auto create(const PassSpec& spec)
        -> std::expected<PatternSource, util::Error>;

    ~PatternSource();
    PatternSource(PatternSource&&) noexcept;
    PatternSource& operator=(PatternSource&&) noexcept;
    PatternSource(const PatternSource&) = delete;
    PatternSource& operator=(const PatternSource&) = delete;

    /**
     * @brief Write the pattern bytes for [offset, offset + out.size()) into out
     */
    [[nodiscard]] auto fill(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error>;

    /**
     * @brief Whether every byte equals uniform_value()
     */
    [[nodiscard]] auto is_uniform() const -> bool { return !seed_.has_value(); }

    [[nodiscard]] auto uniform_value() const -> uint8_t { return value_; }

private:
    struct CipherDeleter {
        void operator()(evp_cipher_ctx_st* ctx) const;
    };

    PatternSource() = default;

    uint8_t value_ = 0x00;
    std::optional<PatternSeed> seed_;
    std::unique_ptr<evp_cipher_ctx_st, CipherDeleter> ctx_;
};

}  // namespace patterns
