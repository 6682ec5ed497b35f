/**
 * @file Crypto.cpp
 * @brief OpenSSL-backed randomness and hashing helpers
 */

#include "util/Crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <climits>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace util {

auto secure_random_bytes(std::span<uint8_t> out) -> std::expected<void, Error> {
    size_t done = 0;
    while (done < out.size()) {
        const auto piece = std::min<size_t>(out.size() - done, INT_MAX);
        if (RAND_bytes(out.data() + done, static_cast<int>(piece)) != 1) {
            char reason[256] = {};
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            return std::unexpected(
                Error::configuration(std::string("CSPRNG unavailable: ") + reason));
        }
        done += piece;
    }
    return {};
}

auto sha256(std::span<const uint8_t> data) -> std::array<uint8_t, 32> {
    std::array<uint8_t, 32> hash{};
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

auto sha256(std::string_view data) -> std::array<uint8_t, 32> {
    return sha256(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                           data.size()));
}

auto to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

auto random_hex_id(size_t bytes) -> std::expected<std::string, Error> {
    std::vector<uint8_t> buffer(bytes);
    if (auto filled = secure_random_bytes(buffer); !filled) {
        return std::unexpected(filled.error());
    }
    return to_hex(buffer);
}

}  // namespace util
