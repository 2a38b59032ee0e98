#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/core/clock.hpp"
#include "veil/security/nullifier/nullifier_registry.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
namespace veil::transfer::security {

/**
 * @brief Replay-protection metadata carried alongside an opaque proof
 */
struct ProofReplayMetadata {
    std::string nonce;
    std::string proof_type;
    Timestamp timestamp;
    Timestamp expires_at;
    std::string nullifier;
};

/**
 * @brief Validity window and single-use enforcement for proofs
 *
 * Check order: expiry, then future timestamp beyond the allowed clock skew,
 * then nullifier reuse. Consume performs the same checks and then claims the
 * nullifier atomically, so two concurrent Consume calls on one proof cannot
 * both succeed.
 */
class ProofReplayGuard {
public:
    explicit ProofReplayGuard(NullifierRegistry& registry);

    [[nodiscard]] ProofReplayMetadata Issue(
        std::string_view proof_type,
        std::chrono::milliseconds validity = NullifierConstants::DEFAULT_PROOF_VALIDITY,
        std::optional<std::string_view> extra = std::nullopt) const;

    Result<Unit, TransferFailure> Check(const ProofReplayMetadata& metadata) const;
    Result<Unit, TransferFailure> Check(const ProofReplayMetadata& metadata, Timestamp now) const;

    Result<Unit, TransferFailure> Consume(const ProofReplayMetadata& metadata);

private:
    NullifierRegistry& registry_;
};
}
