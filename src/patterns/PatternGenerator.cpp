/**
 * @file PatternGenerator.cpp
 * @brief Built-in standards and pass generation
 */

#include "patterns/PatternGenerator.hpp"

#include "util/Crypto.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <utility>

namespace patterns {

namespace {

auto fixed_pass(uint8_t value, VerificationMode verify = VerificationMode::NONE) -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::FIXED;
    spec.value = value;
    spec.verification = verify;
    return spec;
}

auto zero_pass(VerificationMode verify = VerificationMode::NONE) -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::ZERO;
    spec.verification = verify;
    return spec;
}

auto one_pass(VerificationMode verify = VerificationMode::NONE) -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::ONE;
    spec.value = 0xFF;
    spec.verification = verify;
    return spec;
}

auto complement_pass(size_t of, VerificationMode verify = VerificationMode::NONE) -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::COMPLEMENT;
    spec.complement_of = of;
    spec.verification = verify;
    return spec;
}

auto random_pass(VerificationMode verify = VerificationMode::NONE) -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::RANDOM;
    spec.verification = verify;
    return spec;
}

/**
 * @brief Fill in the byte value of ZERO/ONE/COMPLEMENT passes
 */
void resolve_values(Standard& standard) {
    for (auto& pass : standard.passes) {
        switch (pass.pattern) {
            case PatternKind::ZERO:
                pass.value = 0x00;
                break;
            case PatternKind::ONE:
                pass.value = 0xFF;
                break;
            case PatternKind::COMPLEMENT:
                pass.value = static_cast<uint8_t>(~standard.passes[*pass.complement_of].value);
                break;
            case PatternKind::FIXED:
            case PatternKind::RANDOM:
                break;
        }
    }
}

}  // namespace

PatternGenerator::PatternGenerator() {
    register_builtin_standards();
}

void PatternGenerator::register_builtin_standards() {
    using enum VerificationMode;

    std::vector<Standard> builtins;

    builtins.push_back({.id = "NIST_800_88",
                        .name = "NIST SP 800-88 Rev. 1 (Clear)",
                        .description = "Single overwrite of all addressable locations with zeros, "
                                       "verified by full read-back",
                        .passes = {zero_pass(FULL_SCAN)}});

    builtins.push_back({.id = "BSI_VS_A",
                        .name = "BSI VS-A",
                        .description = "Zeros, ones, then random data; final pass verified",
                        .passes = {zero_pass(), one_pass(), random_pass(FULL_SCAN)}});

    // ECE variant: the 3-pass E sequence, a fixed character, then E again
    builtins.push_back({.id = "DOD_5220_22_M",
                        .name = "DoD 5220.22-M ECE (7-pass)",
                        .description = "0x00, complement, random, 0x96, 0x00, complement, "
                                       "random; final pass verified",
                        .passes = {fixed_pass(0x00), complement_pass(0), random_pass(),
                                   fixed_pass(0x96), fixed_pass(0x00), complement_pass(4),
                                   random_pass(FULL_SCAN)}});

    builtins.push_back({.id = "DOD_5220_22_M_E",
                        .name = "DoD 5220.22-M E (3-pass)",
                        .description = "A character, its complement, then random data; final "
                                       "pass sample-verified",
                        .passes = {fixed_pass(0x55), complement_pass(0), random_pass(SAMPLED)}});

    builtins.push_back({.id = "VSITR",
                        .name = "BSI VSITR (7-pass)",
                        .description = "Alternating 0x00/0xFF for six passes, then 0xAA; final "
                                       "pass verified",
                        .passes = {zero_pass(), one_pass(), zero_pass(), one_pass(), zero_pass(),
                                   one_pass(), fixed_pass(0xAA, FULL_SCAN)}});

    builtins.push_back({.id = "GOST_R_50739_95",
                        .name = "GOST R 50739-95 (2-pass)",
                        .description = "Zeros, then random data; final pass sample-verified",
                        .passes = {zero_pass(), random_pass(SAMPLED)}});

    for (auto& standard : builtins) {
        if (auto registered = register_standard(std::move(standard)); !registered) {
            LOG_ERROR("PatternGenerator", "Built-in standard rejected: " +
                                              registered.error().message);
        }
    }
}

auto PatternGenerator::validate(const Standard& standard) -> std::expected<void, util::Error> {
    if (standard.id.empty()) {
        return std::unexpected(util::Error::configuration("Standard id is empty"));
    }
    if (standard.passes.empty()) {
        return std::unexpected(
            util::Error::configuration("Standard " + standard.id + " defines no passes"));
    }

    for (size_t i = 0; i < standard.passes.size(); ++i) {
        const auto& pass = standard.passes[i];
        if (pass.pattern != PatternKind::COMPLEMENT) {
            continue;
        }
        if (!pass.complement_of || *pass.complement_of >= i) {
            return std::unexpected(util::Error::configuration(
                "Standard " + standard.id + " pass " + std::to_string(i + 1) +
                ": complement must reference an earlier pass"));
        }
        if (!standard.passes[*pass.complement_of].is_deterministic()) {
            return std::unexpected(util::Error::configuration(
                "Standard " + standard.id + " pass " + std::to_string(i + 1) +
                ": cannot complement a random pass"));
        }
    }
    return {};
}

auto PatternGenerator::register_standard(Standard standard) -> std::expected<void, util::Error> {
    if (auto valid = validate(standard); !valid) {
        return valid;
    }

    resolve_values(standard);
    for (auto& pass : standard.passes) {
        pass.seed.reset();
        pass.seed_fingerprint.clear();
    }

    std::lock_guard lock(mutex_);
    if (catalog_.contains(standard.id)) {
        return std::unexpected(
            util::Error::configuration("Standard already registered: " + standard.id));
    }
    auto id = standard.id;
    catalog_.emplace(std::move(id), std::move(standard));
    return {};
}

auto PatternGenerator::find(const std::string& standard_id) const
    -> std::expected<Standard, util::Error> {
    std::lock_guard lock(mutex_);
    auto it = catalog_.find(standard_id);
    if (it == catalog_.end()) {
        return std::unexpected(util::Error::configuration("Unknown standard: " + standard_id));
    }
    return it->second;
}

auto PatternGenerator::standards() const -> std::vector<Standard> {
    std::lock_guard lock(mutex_);
    std::vector<Standard> result;
    result.reserve(catalog_.size());
    for (const auto& [id, standard] : catalog_) {
        result.push_back(standard);
    }
    return result;
}

auto PatternGenerator::generate(const std::string& standard_id) const
    -> std::expected<std::vector<PassSpec>, util::Error> {
    auto standard = find(standard_id);
    if (!standard) {
        return std::unexpected(standard.error());
    }

    auto passes = std::move(standard->passes);
    for (auto& pass : passes) {
        if (auto seeded = reseed(pass); !seeded) {
            return std::unexpected(seeded.error());
        }
    }
    return passes;
}

auto PatternGenerator::reseed(PassSpec& spec) -> std::expected<void, util::Error> {
    if (spec.is_deterministic()) {
        return {};
    }

    PatternSeed seed;
    if (auto key = util::secure_random_bytes(seed.key); !key) {
        return std::unexpected(key.error());
    }
    if (auto iv = util::secure_random_bytes(seed.iv); !iv) {
        return std::unexpected(iv.error());
    }

    std::array<uint8_t, 48> material{};
    std::copy(seed.key.begin(), seed.key.end(), material.begin());
    std::copy(seed.iv.begin(), seed.iv.end(), material.begin() + 32);
    auto digest = util::sha256(std::span<const uint8_t>(material));

    spec.seed = seed;
    spec.seed_fingerprint = util::to_hex(std::span<const uint8_t>(digest.data(), 16));
    return {};
}

}  // namespace patterns
