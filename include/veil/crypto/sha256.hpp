#pragma once

#include "veil/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace veil::transfer::crypto {

using Hash256 = std::array<uint8_t, kHash256Bytes>;

/**
 * @brief Incremental SHA-256 over libsodium's crypto_hash_sha256
 */
class Sha256 {
public:
    Sha256() noexcept {
        crypto_hash_sha256_init(&state_);
    }

    Sha256& Update(std::span<const uint8_t> data) noexcept {
        crypto_hash_sha256_update(&state_, data.data(), data.size());
        return *this;
    }

    Sha256& Update(std::string_view text) noexcept {
        crypto_hash_sha256_update(&state_, reinterpret_cast<const uint8_t*>(text.data()), text.size());
        return *this;
    }

    /**
     * @brief Appends a 4-byte big-endian length followed by the field bytes
     */
    Sha256& UpdateField(std::string_view field) noexcept {
        const auto len = static_cast<uint32_t>(field.size());
        const uint8_t prefix[kLengthPrefixBytes] = {
            static_cast<uint8_t>(len >> 24),
            static_cast<uint8_t>(len >> 16),
            static_cast<uint8_t>(len >> 8),
            static_cast<uint8_t>(len)
        };
        crypto_hash_sha256_update(&state_, prefix, sizeof(prefix));
        return Update(field);
    }

    [[nodiscard]] Hash256 Final() noexcept {
        Hash256 out{};
        crypto_hash_sha256_final(&state_, out.data());
        return out;
    }

    [[nodiscard]] static Hash256 Digest(std::span<const uint8_t> data) noexcept {
        Hash256 out{};
        crypto_hash_sha256(out.data(), data.data(), data.size());
        return out;
    }

private:
    crypto_hash_sha256_state state_{};
};

} // namespace veil::transfer::crypto
