#include "veil/agents/authorization_strategies.hpp"
#include "veil/agents/permission_policy.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/format.hpp"

namespace veil::transfer::agents {

using interfaces::AuthorizationOutcome;
using interfaces::AuthorizationRequest;
using interfaces::AuthorizationVerdict;

namespace {
    AuthorizationOutcome Verdict(const AuthorizationVerdict verdict, const std::string_view strategy, std::string reason = {}) {
        return AuthorizationOutcome{
            .verdict = verdict,
            .strategy = std::string(strategy),
            .reason = std::move(reason),
            .refreshed_proof = std::nullopt
        };
    }
}

// ============================================================================
// AgentProofs
// ============================================================================

bool AgentProofs::IsReusable(
    const std::optional<CachedProof>& cached,
    const std::string_view merkle_root,
    const Timestamp now,
    const std::chrono::milliseconds validity) noexcept {
    if (!cached.has_value() || cached->merkle_root != merkle_root) {
        return false;
    }
    return now >= cached->generated_at && now - cached->generated_at < validity;
}

Result<CachedProof, TransferFailure> AgentProofs::Generate(
    interfaces::IAgentProofProvider& provider,
    const AgentRecord& record,
    const StoredAgentRecord& stored,
    const std::string& merkle_root,
    const Timestamp now) {
    std::vector<std::string> public_inputs = {
        record.agent_pubkey,
        stored.permissions_hash,
        merkle_root,
        stored.commitment_hash
    };
    auto proof = provider.GenerateProof(interfaces::AgentProofRequest{
        .commitment_hash = stored.commitment_hash,
        .nonce = record.nonce,
        .public_inputs = public_inputs
    });
    if (proof.IsErr()) {
        return Result<CachedProof, TransferFailure>::Err(proof.UnwrapErr());
    }
    return Result<CachedProof, TransferFailure>::Ok(CachedProof{
        .proof = std::move(proof).Unwrap(),
        .public_inputs = std::move(public_inputs),
        .merkle_root = merkle_root,
        .generated_at = now
    });
}

// ============================================================================
// Strategies
// ============================================================================

EnclaveAuthorizationStrategy::EnclaveAuthorizationStrategy(std::shared_ptr<interfaces::IDelegatedSigner> signer)
    : signer_(std::move(signer)) {}

AuthorizationOutcome EnclaveAuthorizationStrategy::Authorize(const AuthorizationRequest& request) {
    if (!signer_ || !request.stored.session_key_id.has_value()) {
        return Verdict(AuthorizationVerdict::Unavailable, Name(), "No signing session");
    }
    auto allowed = signer_->CheckPolicy(*request.stored.session_key_id, request.operation);
    if (allowed.IsErr()) {
        return Verdict(AuthorizationVerdict::Unavailable, Name(), allowed.UnwrapErr().message);
    }
    if (!allowed.Unwrap()) {
        return Verdict(AuthorizationVerdict::Denied, Name(), "Signing policy refused the operation");
    }
    return Verdict(AuthorizationVerdict::Granted, Name());
}

ProofAuthorizationStrategy::ProofAuthorizationStrategy(
    std::shared_ptr<interfaces::IAgentProofProvider> provider,
    const std::chrono::milliseconds proof_validity)
    : provider_(std::move(provider))
    , proof_validity_(proof_validity) {}

AuthorizationOutcome ProofAuthorizationStrategy::Authorize(const AuthorizationRequest& request) {
    if (!provider_) {
        return Verdict(AuthorizationVerdict::Unavailable, Name(), "No proof provider");
    }
    auto root = provider_->CurrentMerkleRoot();
    if (root.IsErr()) {
        return Verdict(AuthorizationVerdict::Unavailable, Name(), root.UnwrapErr().message);
    }
    const std::string& merkle_root = root.Unwrap();

    std::optional<CachedProof> refreshed;
    if (!AgentProofs::IsReusable(request.stored.cached_proof, merkle_root, request.now, proof_validity_)) {
        auto proof = AgentProofs::Generate(*provider_, request.record, request.stored, merkle_root, request.now);
        if (proof.IsErr()) {
            return Verdict(AuthorizationVerdict::Unavailable, Name(), proof.UnwrapErr().message);
        }
        refreshed = std::move(proof).Unwrap();
    }

    if (auto denial = PermissionPolicy::Evaluate(request.record.permissions, request.operation, request.now)) {
        return Verdict(AuthorizationVerdict::Denied, Name(), std::move(*denial));
    }
    AuthorizationOutcome outcome = Verdict(AuthorizationVerdict::Granted, Name());
    outcome.refreshed_proof = std::move(refreshed);
    return outcome;
}

AuthorizationOutcome PlaintextAuthorizationStrategy::Authorize(const AuthorizationRequest& request) {
    if (auto denial = PermissionPolicy::Evaluate(request.record.permissions, request.operation, request.now)) {
        return Verdict(AuthorizationVerdict::Denied, Name(), std::move(*denial));
    }
    return Verdict(AuthorizationVerdict::Granted, Name());
}

// ============================================================================
// AuthorizationChain
// ============================================================================

AuthorizationChain::AuthorizationChain(std::vector<std::shared_ptr<interfaces::IAuthorizationStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

AuthorizationChain& AuthorizationChain::Add(std::shared_ptr<interfaces::IAuthorizationStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
    return *this;
}

Result<AuthorizationOutcome, TransferFailure> AuthorizationChain::Authorize(const AuthorizationRequest& request) const {
    for (const auto& strategy : strategies_) {
        AuthorizationOutcome outcome = strategy->Authorize(request);
        switch (outcome.verdict) {
            case AuthorizationVerdict::Granted:
                VEIL_LOG_DEBUG("agents", "{} granted by {}", debug::Redact(request.stored.agent_id), outcome.strategy);
                return Result<AuthorizationOutcome, TransferFailure>::Ok(std::move(outcome));
            case AuthorizationVerdict::Denied:
                return Result<AuthorizationOutcome, TransferFailure>::Err(
                    TransferFailure::AuthorizationDenied(
                        compat::format("Denied by {} authorization: {}", outcome.strategy, outcome.reason)));
            case AuthorizationVerdict::Unavailable:
                VEIL_LOG_INFO("agents", "{} authorization unavailable, falling back", outcome.strategy);
                break;
        }
    }
    return Result<AuthorizationOutcome, TransferFailure>::Err(
        TransferFailure::AuthorizationDenied("No authorization path is available"));
}

} // namespace veil::transfer::agents
