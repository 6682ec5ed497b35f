/**
 * @file Crypto.hpp
 * @brief OpenSSL-backed randomness and hashing helpers
 */

#pragma once

#include "util/Error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace util {

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 */
[[nodiscard]] auto secure_random_bytes(std::span<uint8_t> out) -> std::expected<void, Error>;

[[nodiscard]] auto sha256(std::span<const uint8_t> data) -> std::array<uint8_t, 32>;
[[nodiscard]] auto sha256(std::string_view data) -> std::array<uint8_t, 32>;

[[nodiscard]] auto to_hex(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Random identifier (hex) for sessions
 * @param bytes Entropy in bytes (hex output is twice as long)
 */
[[nodiscard]] auto random_hex_id(size_t bytes = 16) -> std::expected<std::string, Error>;

}  // namespace util
