#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace veil::transfer::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP).
 *
 * Stateless primitive: the caller owns nonce uniqueness per key. RecordCipher
 * draws a fresh random 96-bit nonce for every record, which stays well inside
 * the birthday bound for the number of records a single wallet key protects.
 *
 * Output layout of Encrypt is ciphertext || tag[16]. A tag mismatch on Decrypt
 * is reported as TransferFailureType::DecryptionFailed and no plaintext is
 * returned.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
