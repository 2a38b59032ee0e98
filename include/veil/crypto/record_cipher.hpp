#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::crypto {

/**
 * @brief At-rest encryption of serialized records
 *
 * Blob layout: base64(nonce[12] || ciphertext || tag[16]). Every Encrypt
 * draws a fresh nonce, so identical plaintexts produce different blobs.
 * A wrong key or any modified byte yields DecryptionFailed.
 */
class RecordCipher {
public:
    [[nodiscard]] static Result<std::string, TransferFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> Decrypt(
        std::string_view blob,
        std::span<const uint8_t> key,
        std::span<const uint8_t> associated_data = {});

private:
    RecordCipher() = delete;
};

} // namespace veil::transfer::crypto
