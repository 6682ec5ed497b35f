/**
 * @file PatternSource.cpp
 * @brief Constant and AES-256-CTR keystream pattern production
 */

#include "patterns/PatternSource.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <climits>
#include <cstring>

namespace patterns {

namespace {

constexpr size_t AES_BLOCK = 16;
constexpr size_t MAX_UPDATE = 1U << 30;

/**
 * @brief Big-endian add of a block index to the 128-bit initial counter
 */
auto counter_at(const std::array<uint8_t, 16>& iv, uint64_t block_index)
    -> std::array<uint8_t, 16> {
    auto counter = iv;
    uint64_t carry = block_index;
    for (int i = 15; i >= 0 && carry != 0; --i) {
        uint64_t sum = static_cast<uint64_t>(counter[static_cast<size_t>(i)]) + (carry & 0xFF);
        counter[static_cast<size_t>(i)] = static_cast<uint8_t>(sum & 0xFF);
        carry = (carry >> 8) + (sum >> 8);
    }
    return counter;
}

}  // namespace

void PatternSource::CipherDeleter::operator()(evp_cipher_ctx_st* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
}

PatternSource::~PatternSource() = default;
PatternSource::PatternSource(PatternSource&&) noexcept = default;
PatternSource& PatternSource::operator=(PatternSource&&) noexcept = default;

auto PatternSource::create(const PassSpec& spec) -> std::expected<PatternSource, util::Error> {
    PatternSource source;
    switch (spec.pattern) {
        case PatternKind::ZERO:
            source.value_ = 0x00;
            break;
        case PatternKind::ONE:
            source.value_ = 0xFF;
            break;
        case PatternKind::FIXED:
        case PatternKind::COMPLEMENT:
            source.value_ = spec.value;
            break;
        case PatternKind::RANDOM:
            if (!spec.seed) {
                return std::unexpected(
                    util::Error::configuration("Random pass has no seed material"));
            }
            source.seed_ = spec.seed;
            source.ctx_.reset(EVP_CIPHER_CTX_new());
            if (!source.ctx_) {
                return std::unexpected(
                    util::Error::configuration("Failed to allocate cipher context"));
            }
            break;
    }
    return source;
}

auto PatternSource::fill(uint64_t offset, std::span<uint8_t> out)
    -> std::expected<void, util::Error> {
    if (is_uniform()) {
        std::memset(out.data(), value_, out.size());
        return {};
    }

    auto counter = counter_at(seed_->iv, offset / AES_BLOCK);
    if (EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_ctr(), nullptr, seed_->key.data(),
                           counter.data()) != 1) {
        return std::unexpected(util::Error::configuration("AES-256-CTR initialisation failed"));
    }

    int produced = 0;
    if (const auto skip = static_cast<int>(offset % AES_BLOCK); skip > 0) {
        std::array<uint8_t, AES_BLOCK> discard{};
        if (EVP_EncryptUpdate(ctx_.get(), discard.data(), &produced, discard.data(), skip) != 1) {
            return std::unexpected(util::Error::configuration("Keystream generation failed"));
        }
    }

    // Keystream = encryption of zeros
    std::memset(out.data(), 0, out.size());
    size_t done = 0;
    while (done < out.size()) {
        const auto piece = std::min(out.size() - done, MAX_UPDATE);
        if (EVP_EncryptUpdate(ctx_.get(), out.data() + done, &produced, out.data() + done,
                              static_cast<int>(piece)) != 1) {
            return std::unexpected(util::Error::configuration("Keystream generation failed"));
        }
        done += piece;
    }
    return {};
}

}  // namespace patterns
