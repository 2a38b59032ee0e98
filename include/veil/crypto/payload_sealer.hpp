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
 * @brief X25519 key pair for receiving sealed payloads
 */
class SealingKeyPair {
public:
    static Result<SealingKeyPair, TransferFailure> Generate(std::string_view purpose);

    SealingKeyPair(SealingKeyPair&&) noexcept = default;
    SealingKeyPair& operator=(SealingKeyPair&&) noexcept = default;
    SealingKeyPair(const SealingKeyPair&) = delete;
    SealingKeyPair& operator=(const SealingKeyPair&) = delete;

    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const SecureMemoryHandle& SecretKey() const noexcept { return secret_key_; }

private:
    SealingKeyPair(SecureMemoryHandle secret_key, std::vector<uint8_t> public_key)
        : secret_key_(std::move(secret_key)), public_key_(std::move(public_key)) {}

    SecureMemoryHandle secret_key_;
    std::vector<uint8_t> public_key_;
};

/**
 * @brief Anonymous public-key encryption (libsodium sealed boxes)
 *
 * The sender needs only the recipient public key and leaves no identity in
 * the ciphertext. Opening fails with DecryptionFailed on any modification.
 */
class PayloadSealer {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> Seal(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> Open(
        const SealingKeyPair& recipient,
        std::span<const uint8_t> sealed);

private:
    PayloadSealer() = delete;
};

} // namespace veil::transfer::crypto
