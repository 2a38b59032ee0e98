#include "veil/agents/authorization_record_service.hpp"
#include "veil/agents/agent_commitment.hpp"
#include "veil/agents/agent_record_codec.hpp"
#include "veil/agents/permission_policy.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/secure_memory_handle.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/security/nullifier/nullifier.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/constants.hpp"
#include "veil/core/format.hpp"

namespace veil::transfer::agents {

using RecordResult = Result<AgentRecord, TransferFailure>;
using StoredResult = Result<StoredAgentRecord, TransferFailure>;
using OperationResult = Result<AgentOperationResult, TransferFailure>;
using UnitResult = Result<Unit, TransferFailure>;

namespace {
    AgentCommitmentInputs CommitmentInputs(const AgentRecord& record, const std::string& permissions_hash) {
        return AgentCommitmentInputs{
            .agent_pubkey = record.agent_pubkey,
            .wallet_pubkey = record.wallet_pubkey,
            .permissions_hash = permissions_hash,
            .nonce = record.nonce
        };
    }

    std::string GenerateAgentId() {
        return std::string(kAgentIdPrefix) +
               crypto::Encoding::ToHex(crypto::SodiumInterop::GetRandomBytes(kAgentIdRandomBytes));
    }

    TransferFailure RevokedFailure() {
        return TransferFailure::Revoked("Agent has been revoked");
    }
}

AuthorizationRecordService::AuthorizationRecordService(
    configuration::AgentConfig config,
    std::shared_ptr<interfaces::IAgentRecordStore> store,
    std::shared_ptr<interfaces::IWalletKeyProvider> keys,
    std::shared_ptr<interfaces::IDelegatedSigner> signer,
    std::shared_ptr<interfaces::IAgentProofProvider> prover,
    security::NullifierRegistry& registry,
    AuthorizationChain chain)
    : config_(config)
    , store_(std::move(store))
    , keys_(std::move(keys))
    , signer_(std::move(signer))
    , prover_(std::move(prover))
    , registry_(registry)
    , chain_(std::move(chain)) {}

// ============================================================================
// Lifecycle
// ============================================================================

RecordResult AuthorizationRecordService::Create(
    const std::string_view wallet_pubkey,
    const CreateAgentInputs& inputs) {
    if (wallet_pubkey.empty()) {
        return RecordResult::Err(TransferFailure::InvalidInput("Wallet public key is required"));
    }
    if (inputs.name.empty()) {
        return RecordResult::Err(TransferFailure::InvalidInput("Agent name is required"));
    }
    if (auto invalid = PermissionPolicy::ValidatePermissions(inputs.permissions)) {
        return RecordResult::Err(TransferFailure::InvalidInput(std::move(*invalid)));
    }

    std::string agent_pubkey;
    {
        // The agent's signing secret is held by the delegated signer, never here.
        auto keypair = crypto::SodiumInterop::GenerateEd25519KeyPair();
        if (keypair.IsErr()) {
            return RecordResult::Err(keypair.UnwrapErr());
        }
        agent_pubkey = crypto::Encoding::ToHex(keypair.Unwrap().second);
    }

    const Timestamp now = Now();
    AgentRecord record{
        .agent_id = GenerateAgentId(),
        .name = inputs.name,
        .description = inputs.description,
        .agent_pubkey = std::move(agent_pubkey),
        .wallet_pubkey = std::string(wallet_pubkey),
        .permissions = inputs.permissions,
        .nonce = AgentCommitment::GenerateAgentNonce(),
        .created_at = now,
        .updated_at = now,
        .status = AgentStatus::Creating
    };

    const std::string permissions_hash = AgentCommitment::ComputePermissionsHash(record.permissions);
    std::string commitment = AgentCommitment::ComputeAgentCommitment(CommitmentInputs(record, permissions_hash));

    auto secret = keys_->GetRecordSecret(record.wallet_pubkey);
    if (secret.IsErr()) {
        return RecordResult::Err(secret.UnwrapErr());
    }
    auto encrypted = AgentRecordCodec::Encrypt(record, secret.Unwrap());
    if (encrypted.IsErr()) {
        return RecordResult::Err(encrypted.UnwrapErr());
    }

    StoredAgentRecord stored;
    stored.agent_id = record.agent_id;
    stored.wallet_pubkey = record.wallet_pubkey;
    stored.encrypted_record = std::move(encrypted).Unwrap();
    stored.commitment_hash = std::move(commitment);
    stored.permissions_hash = permissions_hash;
    stored.status = AgentStatus::Creating;
    stored.created_at = now;
    stored.updated_at = now;

    if (auto inserted = store_->Insert(stored); inserted.IsErr()) {
        return RecordResult::Err(inserted.UnwrapErr());
    }

    if (inputs.request_signing_session && signer_) {
        auto session = signer_->CreateSession(record.agent_id, record.wallet_pubkey, record.permissions);
        if (session.IsErr()) {
            VEIL_LOG_WARN("agents", "Signing session for {} deferred: {}",
                          debug::Redact(record.agent_id), session.UnwrapErr().message);
        } else {
            stored.session_key_id = session.Unwrap().session_key_id;
            stored.policy_id = session.Unwrap().policy_id;
        }
    }

    stored.status = AgentStatus::Active;
    stored.updated_at = Now();
    if (auto activated = store_->Update(stored); activated.IsErr()) {
        return RecordResult::Err(activated.UnwrapErr());
    }
    record.status = AgentStatus::Active;

    VEIL_LOG_INFO("agents", "Agent {} active", debug::Redact(record.agent_id));
    NotifyStatus(record.agent_id, AgentStatus::Active);
    return RecordResult::Ok(std::move(record));
}

RecordResult AuthorizationRecordService::Update(const std::string_view agent_id, const AgentRecordPatch& patch) {
    std::lock_guard guard(mutation_lock_);

    auto stored_result = GetStored(agent_id);
    if (stored_result.IsErr()) {
        return RecordResult::Err(stored_result.UnwrapErr());
    }
    StoredAgentRecord stored = std::move(stored_result).Unwrap();
    if (stored.status == AgentStatus::Revoked) {
        return RecordResult::Err(RevokedFailure());
    }

    auto decrypted = Decrypt(stored);
    if (decrypted.IsErr()) {
        return decrypted;
    }
    AgentRecord record = std::move(decrypted).Unwrap();

    if (patch.name.has_value()) {
        if (patch.name->empty()) {
            return RecordResult::Err(TransferFailure::InvalidInput("Agent name cannot be empty"));
        }
        record.name = *patch.name;
    }
    if (patch.description.has_value()) {
        record.description = *patch.description;
    }
    if (patch.permissions.has_value()) {
        if (auto invalid = PermissionPolicy::ValidatePermissions(*patch.permissions)) {
            return RecordResult::Err(TransferFailure::InvalidInput(std::move(*invalid)));
        }
        record.permissions = *patch.permissions;
    }
    if (patch.agent_pubkey.has_value()) {
        if (patch.agent_pubkey->empty()) {
            return RecordResult::Err(TransferFailure::InvalidInput("Agent public key cannot be empty"));
        }
        record.agent_pubkey = *patch.agent_pubkey;
    }
    if (patch.rotate_nonce) {
        record.nonce = AgentCommitment::GenerateAgentNonce();
    }
    record.updated_at = Now();

    const std::string permissions_hash = AgentCommitment::ComputePermissionsHash(record.permissions);
    auto secret = keys_->GetRecordSecret(record.wallet_pubkey);
    if (secret.IsErr()) {
        return RecordResult::Err(secret.UnwrapErr());
    }
    auto encrypted = AgentRecordCodec::Encrypt(record, secret.Unwrap());
    if (encrypted.IsErr()) {
        return RecordResult::Err(encrypted.UnwrapErr());
    }

    stored.encrypted_record = std::move(encrypted).Unwrap();
    stored.commitment_hash = AgentCommitment::ComputeAgentCommitment(CommitmentInputs(record, permissions_hash));
    stored.permissions_hash = permissions_hash;
    stored.cached_proof.reset();
    stored.updated_at = record.updated_at;

    if (auto updated = store_->Update(stored); updated.IsErr()) {
        return RecordResult::Err(updated.UnwrapErr());
    }
    VEIL_LOG_DEBUG("agents", "Agent {} updated, cached proof cleared", debug::Redact(stored.agent_id));
    return RecordResult::Ok(std::move(record));
}

StoredResult AuthorizationRecordService::Suspend(const std::string_view agent_id) {
    return Transition(agent_id, AgentStatus::Active, AgentStatus::Suspended);
}

StoredResult AuthorizationRecordService::Resume(const std::string_view agent_id) {
    return Transition(agent_id, AgentStatus::Suspended, AgentStatus::Active);
}

RecordResult AuthorizationRecordService::Load(const std::string_view agent_id) {
    auto stored = GetStored(agent_id);
    if (stored.IsErr()) {
        return RecordResult::Err(stored.UnwrapErr());
    }
    return Decrypt(stored.Unwrap());
}

Result<std::vector<StoredAgentRecord>, TransferFailure> AuthorizationRecordService::ListByWallet(
    const std::string_view wallet_pubkey) {
    if (wallet_pubkey.empty()) {
        return Result<std::vector<StoredAgentRecord>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Wallet public key is required"));
    }
    return store_->ListByWallet(wallet_pubkey);
}

// ============================================================================
// Operations
// ============================================================================

OperationResult AuthorizationRecordService::ExecuteOperation(
    const std::string_view agent_id,
    const AgentOperation& operation) {
    if (operation.type.empty()) {
        return OperationResult::Err(TransferFailure::InvalidInput("Operation type is required"));
    }
    auto stored_result = GetStored(agent_id);
    if (stored_result.IsErr()) {
        return OperationResult::Err(stored_result.UnwrapErr());
    }
    const StoredAgentRecord stored = std::move(stored_result).Unwrap();
    if (stored.status == AgentStatus::Revoked) {
        return OperationResult::Err(RevokedFailure());
    }
    if (stored.status != AgentStatus::Active) {
        return OperationResult::Err(TransferFailure::InvalidState(
            compat::format("Agent is {}, not active", AgentStatusName(stored.status))));
    }
    if (!stored.session_key_id.has_value() || !signer_) {
        return OperationResult::Err(TransferFailure::InvalidState("Agent has no signing session"));
    }

    auto decrypted = Decrypt(stored);
    if (decrypted.IsErr()) {
        return OperationResult::Err(decrypted.UnwrapErr());
    }
    const AgentRecord record = std::move(decrypted).Unwrap();

    const Timestamp now = Now();
    if (auto denial = PermissionPolicy::Evaluate(record.permissions, operation, now)) {
        return OperationResult::Err(TransferFailure::AuthorizationDenied(std::move(*denial)));
    }

    auto granted = chain_.Authorize(interfaces::AuthorizationRequest{
        .record = record,
        .stored = stored,
        .operation = operation,
        .now = now
    });
    if (granted.IsErr()) {
        return OperationResult::Err(granted.UnwrapErr());
    }
    interfaces::AuthorizationOutcome outcome = std::move(granted).Unwrap();

    std::lock_guard guard(mutation_lock_);
    auto current = ReloadUnchangedLocked(stored);
    if (current.IsErr()) {
        return OperationResult::Err(current.UnwrapErr());
    }

    const std::string nullifier = security::Nullifier::Generate(
        security::Nullifier::GenerateSecureNonce(), kProofTypeAgentOperation, stored.agent_id);
    if (auto consumed = ConsumeNullifier(nullifier, kProofTypeAgentOperation); consumed.IsErr()) {
        return OperationResult::Err(consumed.UnwrapErr());
    }

    auto signature = signer_->Sign(*stored.session_key_id, operation.payload);
    if (signature.IsErr()) {
        return OperationResult::Err(TransferFailure::ExternalCallFailed(
            compat::format("Delegated signing failed: {}", signature.UnwrapErr().message)));
    }

    AgentOperationResult result{
        .nullifier = nullifier,
        .signature = std::move(signature).Unwrap(),
        .strategy = outcome.strategy,
        .proof = std::nullopt,
        .executed_at = now
    };

    if (outcome.refreshed_proof.has_value()) {
        StoredAgentRecord refreshed = std::move(current).Unwrap();
        refreshed.cached_proof = std::move(outcome.refreshed_proof);
        if (auto cached = store_->Update(refreshed); cached.IsErr()) {
            VEIL_LOG_WARN("agents", "Failed to cache proof for {}: {}",
                          debug::Redact(stored.agent_id), cached.UnwrapErr().message);
        }
    }

    if (auto logged = AppendOperationLog(stored, operation, result); logged.IsErr()) {
        return OperationResult::Err(logged.UnwrapErr());
    }
    VEIL_LOG_INFO("agents", "Operation {} for {} authorized by {}", operation.type,
                  debug::Redact(stored.agent_id), result.strategy);
    return OperationResult::Ok(std::move(result));
}

OperationResult AuthorizationRecordService::ExecuteOperationWithProof(
    const std::string_view agent_id,
    const AgentOperation& operation,
    const std::string& merkle_root) {
    if (operation.type.empty()) {
        return OperationResult::Err(TransferFailure::InvalidInput("Operation type is required"));
    }
    if (merkle_root.empty()) {
        return OperationResult::Err(TransferFailure::InvalidInput("Merkle root is required"));
    }
    if (!prover_) {
        return OperationResult::Err(TransferFailure::InvalidState("No proof provider is configured"));
    }

    auto stored_result = GetStored(agent_id);
    if (stored_result.IsErr()) {
        return OperationResult::Err(stored_result.UnwrapErr());
    }
    const StoredAgentRecord stored = std::move(stored_result).Unwrap();
    if (stored.status == AgentStatus::Revoked) {
        return OperationResult::Err(RevokedFailure());
    }
    if (stored.status != AgentStatus::Active) {
        return OperationResult::Err(TransferFailure::InvalidState(
            compat::format("Agent is {}, not active", AgentStatusName(stored.status))));
    }

    auto decrypted = Decrypt(stored);
    if (decrypted.IsErr()) {
        return OperationResult::Err(decrypted.UnwrapErr());
    }
    const AgentRecord record = std::move(decrypted).Unwrap();

    const Timestamp now = Now();
    if (auto denial = PermissionPolicy::Evaluate(record.permissions, operation, now)) {
        return OperationResult::Err(TransferFailure::AuthorizationDenied(std::move(*denial)));
    }

    CachedProof proof;
    const bool reused = AgentProofs::IsReusable(stored.cached_proof, merkle_root, now, config_.proof_validity);
    if (reused) {
        VEIL_LOG_DEBUG("agents", "Reusing cached proof for {}", debug::Redact(stored.agent_id));
        proof = *stored.cached_proof;
    } else {
        auto generated = AgentProofs::Generate(*prover_, record, stored, merkle_root, now);
        if (generated.IsErr()) {
            return OperationResult::Err(TransferFailure::ExternalCallFailed(
                compat::format("Proof generation failed: {}", generated.UnwrapErr().message)));
        }
        proof = std::move(generated).Unwrap();
    }

    std::lock_guard guard(mutation_lock_);
    auto current = ReloadUnchangedLocked(stored);
    if (current.IsErr()) {
        return OperationResult::Err(current.UnwrapErr());
    }
    if (!reused) {
        StoredAgentRecord refreshed = std::move(current).Unwrap();
        refreshed.cached_proof = proof;
        if (auto cached = store_->Update(refreshed); cached.IsErr()) {
            return OperationResult::Err(cached.UnwrapErr());
        }
    }

    const std::string nullifier = security::Nullifier::Generate(
        security::Nullifier::GenerateSecureNonce(), kProofTypeAgentProofOperation, stored.agent_id);
    if (auto consumed = ConsumeNullifier(nullifier, kProofTypeAgentProofOperation); consumed.IsErr()) {
        return OperationResult::Err(consumed.UnwrapErr());
    }

    AgentOperationResult result{
        .nullifier = nullifier,
        .signature = {},
        .strategy = "proof",
        .proof = std::move(proof),
        .executed_at = now
    };
    if (auto logged = AppendOperationLog(stored, operation, result); logged.IsErr()) {
        return OperationResult::Err(logged.UnwrapErr());
    }
    return OperationResult::Ok(std::move(result));
}

// ============================================================================
// Revocation
// ============================================================================

StoredResult AuthorizationRecordService::Revoke(const std::string_view agent_id) {
    auto stored = GetStored(agent_id);
    if (stored.IsErr()) {
        return stored;
    }
    if (stored.Unwrap().status == AgentStatus::Revoked) {
        return StoredResult::Err(TransferFailure::Revoked("Agent is already revoked"));
    }
    auto record = Decrypt(stored.Unwrap());
    if (record.IsErr()) {
        return StoredResult::Err(record.UnwrapErr());
    }
    const std::string nullifier = security::Nullifier::Generate(
        record.Unwrap().nonce, kProofTypeAgentRevocation, stored.Unwrap().agent_id);
    return Revoke(agent_id, nullifier);
}

StoredResult AuthorizationRecordService::Revoke(
    const std::string_view agent_id,
    const std::string_view revocation_nullifier) {
    if (!security::Nullifier::IsWellFormed(revocation_nullifier)) {
        return StoredResult::Err(TransferFailure::InvalidInput("Revocation nullifier is malformed"));
    }

    StoredAgentRecord stored;
    {
        std::lock_guard guard(mutation_lock_);
        auto stored_result = GetStored(agent_id);
        if (stored_result.IsErr()) {
            return stored_result;
        }
        stored = std::move(stored_result).Unwrap();
        if (stored.status == AgentStatus::Revoked) {
            return StoredResult::Err(TransferFailure::Revoked("Agent is already revoked"));
        }

        if (auto consumed = ConsumeNullifier(revocation_nullifier, kProofTypeAgentRevocation); consumed.IsErr()) {
            return StoredResult::Err(consumed.UnwrapErr());
        }

        if (stored.session_key_id.has_value() && signer_) {
            if (auto revoked = signer_->RevokeSession(*stored.session_key_id); revoked.IsErr()) {
                VEIL_LOG_WARN("agents", "Session revocation for {} failed: {}",
                              debug::Redact(stored.agent_id), revoked.UnwrapErr().message);
            }
        }

        const Timestamp now = Now();
        stored.status = AgentStatus::Revoked;
        stored.revocation_nullifier = std::string(revocation_nullifier);
        stored.revoked_at = now;
        stored.session_key_id.reset();
        stored.policy_id.reset();
        stored.cached_proof.reset();
        stored.updated_at = now;

        if (auto updated = store_->Update(stored); updated.IsErr()) {
            return StoredResult::Err(updated.UnwrapErr());
        }
    }

    VEIL_LOG_INFO("agents", "Agent {} revoked", debug::Redact(stored.agent_id));
    NotifyStatus(stored.agent_id, AgentStatus::Revoked);
    return StoredResult::Ok(std::move(stored));
}

void AuthorizationRecordService::SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler) {
    std::lock_guard guard(handler_lock_);
    event_handler_ = std::move(handler);
}

// ============================================================================
// Helpers
// ============================================================================

StoredResult AuthorizationRecordService::GetStored(const std::string_view agent_id) {
    if (agent_id.empty()) {
        return StoredResult::Err(TransferFailure::InvalidInput("Agent id is required"));
    }
    auto found = store_->Get(agent_id);
    if (found.IsErr()) {
        return StoredResult::Err(found.UnwrapErr());
    }
    if (!found.Unwrap().has_value()) {
        return StoredResult::Err(TransferFailure::NotFound(compat::format("Agent {} not found", agent_id)));
    }
    return StoredResult::Ok(std::move(*std::move(found).Unwrap()));
}

// Caller holds mutation_lock_.
StoredResult AuthorizationRecordService::ReloadUnchangedLocked(const StoredAgentRecord& authorized) {
    auto current = GetStored(authorized.agent_id);
    if (current.IsErr()) {
        return current;
    }
    const StoredAgentRecord& row = current.Unwrap();
    if (row.status == AgentStatus::Revoked) {
        return StoredResult::Err(RevokedFailure());
    }
    if (row.status != AgentStatus::Active ||
        row.commitment_hash != authorized.commitment_hash ||
        row.session_key_id != authorized.session_key_id) {
        return StoredResult::Err(TransferFailure::InvalidState(
            "Agent changed while the operation was being authorized"));
    }
    return current;
}

RecordResult AuthorizationRecordService::Decrypt(const StoredAgentRecord& stored) {
    auto secret = keys_->GetRecordSecret(stored.wallet_pubkey);
    if (secret.IsErr()) {
        return RecordResult::Err(secret.UnwrapErr());
    }
    auto decrypted = AgentRecordCodec::Decrypt(stored.agent_id, stored.encrypted_record, secret.Unwrap());
    if (decrypted.IsErr()) {
        return decrypted;
    }
    AgentRecord record = std::move(decrypted).Unwrap();

    if (record.wallet_pubkey != stored.wallet_pubkey) {
        return RecordResult::Err(TransferFailure::CommitmentMismatch(
            "Agent record is bound to a different wallet"));
    }
    const std::string permissions_hash = AgentCommitment::ComputePermissionsHash(record.permissions);
    auto verified = AgentCommitment::VerifyAgentCommitment(
        stored.commitment_hash, CommitmentInputs(record, permissions_hash));
    if (verified.IsErr()) {
        return RecordResult::Err(verified.UnwrapErr());
    }
    if (!verified.Unwrap()) {
        return RecordResult::Err(TransferFailure::CommitmentMismatch(
            "Agent record does not match its stored commitment"));
    }

    record.status = stored.status;
    return RecordResult::Ok(std::move(record));
}

StoredResult AuthorizationRecordService::Transition(
    const std::string_view agent_id,
    const AgentStatus from,
    const AgentStatus to) {
    StoredAgentRecord stored;
    {
        std::lock_guard guard(mutation_lock_);
        auto stored_result = GetStored(agent_id);
        if (stored_result.IsErr()) {
            return stored_result;
        }
        stored = std::move(stored_result).Unwrap();
        if (stored.status == AgentStatus::Revoked) {
            return StoredResult::Err(RevokedFailure());
        }
        if (stored.status != from) {
            return StoredResult::Err(TransferFailure::InvalidState(
                compat::format("Agent is {}, expected {}", AgentStatusName(stored.status), AgentStatusName(from))));
        }
        stored.status = to;
        stored.cached_proof.reset();
        stored.updated_at = Now();
        if (auto updated = store_->Update(stored); updated.IsErr()) {
            return StoredResult::Err(updated.UnwrapErr());
        }
    }
    NotifyStatus(stored.agent_id, to);
    return StoredResult::Ok(std::move(stored));
}

UnitResult AuthorizationRecordService::ConsumeNullifier(
    const std::string_view nullifier,
    const std::string_view proof_type) {
    auto marked = registry_.MarkUsed(nullifier, proof_type);
    if (marked.IsErr()) {
        return UnitResult::Err(marked.UnwrapErr());
    }
    if (marked.Unwrap().replay_detected) {
        return UnitResult::Err(TransferFailure::ReplayDetected(
            compat::format("Replay refused: {} nullifier already used", proof_type)));
    }
    return UnitResult::Ok(unit);
}

UnitResult AuthorizationRecordService::AppendOperationLog(
    const StoredAgentRecord& stored,
    const AgentOperation& operation,
    const AgentOperationResult& result) {
    auto owner_key = keys_->GetSealingPublicKey(stored.wallet_pubkey);
    if (owner_key.IsErr()) {
        return UnitResult::Err(owner_key.UnwrapErr());
    }
    auto sealed = AgentRecordCodec::SealOperation(stored.agent_id, operation, result, owner_key.Unwrap());
    if (sealed.IsErr()) {
        return UnitResult::Err(sealed.UnwrapErr());
    }
    return store_->AppendOperationLog(stored.agent_id, sealed.Unwrap());
}

void AuthorizationRecordService::NotifyStatus(const std::string& agent_id, const AgentStatus status) {
    std::shared_ptr<interfaces::ITransferEventHandler> handler;
    {
        std::lock_guard guard(handler_lock_);
        handler = event_handler_;
    }
    if (handler) {
        handler->OnAgentStatusChanged(agent_id, std::string(AgentStatusName(status)));
    }
}

} // namespace veil::transfer::agents
