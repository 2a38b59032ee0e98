#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/crypto/sha256.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::crypto {

/**
 * @brief Ordered list of values bound by a commitment
 *
 * Ordered() and Number() fields keep their position. Unordered() collections
 * are sorted before encoding, so permutations of one set encode identically.
 * Every field carries a kind tag and a length prefix; adjacent fields cannot
 * be re-split into a different tuple with the same encoding.
 */
class CommitmentFields {
public:
    CommitmentFields& Ordered(std::string_view value);
    CommitmentFields& Number(uint64_t value);
    CommitmentFields& Unordered(std::vector<std::string> values);

    [[nodiscard]] const std::vector<std::string>& Encoded() const noexcept { return encoded_; }

private:
    std::vector<std::string> encoded_;
};

class Commitment {
public:
    /**
     * @brief SHA-256 over domain || fields
     */
    [[nodiscard]] static Hash256 HashCommitment(std::string_view domain, const CommitmentFields& fields);

    /**
     * @brief Recompute and compare in constant time
     *
     * Ok(false) on any difference, including length. Err only when the
     * comparison itself cannot run.
     */
    [[nodiscard]] static Result<bool, TransferFailure> VerifyCommitment(
        std::span<const uint8_t> commitment,
        std::string_view domain,
        const CommitmentFields& fields);

    /**
     * @brief Fresh 32 random bytes from the libsodium CSPRNG
     */
    [[nodiscard]] static Hash256 GenerateNonce();

private:
    Commitment() = delete;
};

} // namespace veil::transfer::crypto
