#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace veil::transfer::crypto {

/**
 * @brief Context-separated encryption keys from wallet secret material
 *
 * key = HKDF-SHA256(ikm = secret, salt = kKeyDerivationSalt,
 *                   info = version(le32) || context)
 *
 * Same (secret, context) always yields the same key; distinct contexts yield
 * unrelated keys.
 */
class KeyDerivation {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> DeriveEncryptionKey(
        std::span<const uint8_t> secret_material,
        std::string_view context);

    /**
     * @brief Same derivation with the secret kept in secure memory
     *
     * The derived key is returned in secure memory as well.
     */
    [[nodiscard]] static Result<SecureMemoryHandle, TransferFailure> DeriveEncryptionKey(
        const SecureMemoryHandle& secret_material,
        std::string_view context);

private:
    static std::vector<uint8_t> BuildContextData(std::string_view context);

    static constexpr int32_t CURRENT_VERSION = 1;

    KeyDerivation() = delete;
};

} // namespace veil::transfer::crypto
