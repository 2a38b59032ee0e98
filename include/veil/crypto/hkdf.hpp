#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace veil::transfer::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 through OpenSSL's EVP_KDF
 */
class Hkdf {
public:
    /**
     * @brief Extract-and-expand into a caller-provided buffer
     *
     * @param ikm Input key material, must not be empty
     * @param output Filled with output.size() derived bytes
     * @param salt Optional salt
     * @param info Optional context binding
     */
    static Result<Unit, TransferFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, TransferFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace veil::transfer::crypto
