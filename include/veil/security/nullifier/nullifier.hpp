#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/core/clock.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace veil::transfer::security {

/**
 * @brief Single-use identifier recorded on first use of a proof or operation
 *
 * Identity is the nullifier value (64 lowercase hex characters).
 */
struct NullifierRecord {
    std::string nullifier;
    std::string proof_type;
    Timestamp used_at;
    Timestamp expires_at;
};

class Nullifier {
public:
    /**
     * @brief SHA-256 over (nonce, proof_type, extra), lowercase hex
     *
     * Deterministic. Changing any input changes the output. An absent extra
     * and an empty extra are distinct inputs.
     */
    [[nodiscard]] static std::string Generate(
        std::string_view nonce,
        std::string_view proof_type,
        std::optional<std::string_view> extra = std::nullopt);

    /**
     * @brief Recompute and compare in constant time
     */
    [[nodiscard]] static Result<bool, TransferFailure> Verify(
        std::string_view nullifier,
        std::string_view nonce,
        std::string_view proof_type,
        std::optional<std::string_view> extra = std::nullopt);

    /**
     * @return 64 lowercase hex characters of fresh randomness
     */
    [[nodiscard]] static std::string GenerateSecureNonce();

    [[nodiscard]] static bool IsWellFormed(std::string_view nullifier) noexcept;

private:
    Nullifier() = delete;
};

} // namespace veil::transfer::security
