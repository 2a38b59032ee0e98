#include "veil/security/nullifier/proof_replay_guard.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/format.hpp"
#include <algorithm>

namespace veil::transfer::security {
    using UnitResult = Result<Unit, TransferFailure>;

    ProofReplayGuard::ProofReplayGuard(NullifierRegistry &registry)
        : registry_(registry) {
    }

    ProofReplayMetadata ProofReplayGuard::Issue(
        const std::string_view proof_type,
        const std::chrono::milliseconds validity,
        const std::optional<std::string_view> extra) const {
        const Timestamp now = Now();
        std::string nonce = Nullifier::GenerateSecureNonce();
        std::string nullifier = Nullifier::Generate(nonce, proof_type, extra);
        return ProofReplayMetadata{
            .nonce = std::move(nonce),
            .proof_type = std::string(proof_type),
            .timestamp = now,
            .expires_at = now + validity,
            .nullifier = std::move(nullifier)
        };
    }

    UnitResult ProofReplayGuard::Check(const ProofReplayMetadata &metadata) const {
        return Check(metadata, Now());
    }

    UnitResult ProofReplayGuard::Check(const ProofReplayMetadata &metadata, const Timestamp now) const {
        if (metadata.nullifier.empty()) {
            return UnitResult::Err(TransferFailure::InvalidInput("Proof metadata has no nullifier"));
        }
        if (metadata.expires_at <= now) {
            return UnitResult::Err(TransferFailure::ProofExpired(
                compat::format("Proof expired at {}", ToUnixMillis(metadata.expires_at))));
        }
        if (metadata.timestamp > now + registry_.Config().MaxClockSkew()) {
            return UnitResult::Err(TransferFailure::InvalidInput(
                "Proof timestamp is too far in the future"));
        }
        auto used = registry_.IsUsed(metadata.nullifier);
        if (used.IsErr()) {
            return UnitResult::Err(used.UnwrapErr());
        }
        if (used.Unwrap()) {
            return UnitResult::Err(TransferFailure::ReplayDetected(
                "Proof replay detected - nullifier already used"));
        }
        return UnitResult::Ok(unit);
    }

    UnitResult ProofReplayGuard::Consume(const ProofReplayMetadata &metadata) {
        const Timestamp now = Now();
        if (auto checked = Check(metadata, now); checked.IsErr()) {
            return checked;
        }
        const Timestamp retain_until = now + registry_.Config().Retention();
        auto marked = registry_.MarkUsed(NullifierRecord{
            .nullifier = metadata.nullifier,
            .proof_type = metadata.proof_type.empty() ? std::string("proof") : metadata.proof_type,
            .used_at = now,
            .expires_at = std::max(metadata.expires_at, retain_until)
        });
        if (marked.IsErr()) {
            return UnitResult::Err(marked.UnwrapErr());
        }
        if (!marked.Unwrap().success) {
            VEIL_LOG_WARN("proof-guard", "Concurrent replay of {}", debug::Redact(metadata.nullifier));
            return UnitResult::Err(TransferFailure::ReplayDetected(
                "Proof replay detected - nullifier already used"));
        }
        return UnitResult::Ok(unit);
    }
}
