#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/configuration/agent_config.hpp"
#include "veil/agents/agent_types.hpp"
#include "veil/agents/authorization_strategies.hpp"
#include "veil/interfaces/i_agent_proof_provider.hpp"
#include "veil/interfaces/i_agent_record_store.hpp"
#include "veil/interfaces/i_delegated_signer.hpp"
#include "veil/interfaces/i_transfer_event_handler.hpp"
#include "veil/interfaces/i_wallet_key_provider.hpp"
#include "veil/security/nullifier/nullifier_registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::agents {

/**
 * @brief Lifecycle of delegated-authorization (agent) records
 *
 * creating -> active -> {suspended, revoked}; suspended -> active; revoked is
 * terminal. The store only ever sees the encrypted record and the public
 * commitment and permissions hashes. The authoritative status lives on the
 * stored row, so revocation can leave the encrypted record untouched.
 *
 * Every mutating call clears the cached authorization proof. Every one-time
 * operation and every revocation registers a nullifier first, and a replay
 * refuses the call.
 */
class AuthorizationRecordService {
public:
    AuthorizationRecordService(
        configuration::AgentConfig config,
        std::shared_ptr<interfaces::IAgentRecordStore> store,
        std::shared_ptr<interfaces::IWalletKeyProvider> keys,
        std::shared_ptr<interfaces::IDelegatedSigner> signer,
        std::shared_ptr<interfaces::IAgentProofProvider> prover,
        security::NullifierRegistry& registry,
        AuthorizationChain chain);

    AuthorizationRecordService(const AuthorizationRecordService&) = delete;
    AuthorizationRecordService& operator=(const AuthorizationRecordService&) = delete;

    /**
     * @brief Generate keys and nonce, commit, encrypt, insert, activate
     *
     * A failed signing-session request leaves the agent active without a
     * session key; operations stay refused until one is attached.
     */
    Result<AgentRecord, TransferFailure> Create(std::string_view wallet_pubkey, const CreateAgentInputs& inputs);

    Result<AgentRecord, TransferFailure> Update(std::string_view agent_id, const AgentRecordPatch& patch);

    Result<StoredAgentRecord, TransferFailure> Suspend(std::string_view agent_id);
    Result<StoredAgentRecord, TransferFailure> Resume(std::string_view agent_id);

    /**
     * @brief Decrypt and check the record against its stored commitment
     */
    Result<AgentRecord, TransferFailure> Load(std::string_view agent_id);

    Result<std::vector<StoredAgentRecord>, TransferFailure> ListByWallet(std::string_view wallet_pubkey);

    /**
     * @brief Authorize through the strategy chain, consume a nullifier, sign
     */
    Result<AgentOperationResult, TransferFailure> ExecuteOperation(
        std::string_view agent_id,
        const AgentOperation& operation);

    /**
     * @brief Produce an authorization proof for an external verifier
     *
     * Reuses the cached proof when it was made for merkle_root and is still
     * within its validity, otherwise generates and caches a fresh one.
     */
    Result<AgentOperationResult, TransferFailure> ExecuteOperationWithProof(
        std::string_view agent_id,
        const AgentOperation& operation,
        const std::string& merkle_root);

    /**
     * @brief Revoke with the nullifier derived from the record nonce
     */
    Result<StoredAgentRecord, TransferFailure> Revoke(std::string_view agent_id);

    Result<StoredAgentRecord, TransferFailure> Revoke(
        std::string_view agent_id,
        std::string_view revocation_nullifier);

    void SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler);

private:
    Result<StoredAgentRecord, TransferFailure> GetStored(std::string_view agent_id);
    Result<AgentRecord, TransferFailure> Decrypt(const StoredAgentRecord& stored);
    Result<StoredAgentRecord, TransferFailure> ReloadUnchangedLocked(const StoredAgentRecord& authorized);
    Result<StoredAgentRecord, TransferFailure> Transition(
        std::string_view agent_id,
        AgentStatus from,
        AgentStatus to);
    Result<Unit, TransferFailure> ConsumeNullifier(std::string_view nullifier, std::string_view proof_type);
    Result<Unit, TransferFailure> AppendOperationLog(
        const StoredAgentRecord& stored,
        const AgentOperation& operation,
        const AgentOperationResult& result);
    void NotifyStatus(const std::string& agent_id, AgentStatus status);

    configuration::AgentConfig config_;
    std::shared_ptr<interfaces::IAgentRecordStore> store_;
    std::shared_ptr<interfaces::IWalletKeyProvider> keys_;
    std::shared_ptr<interfaces::IDelegatedSigner> signer_;
    std::shared_ptr<interfaces::IAgentProofProvider> prover_;
    security::NullifierRegistry& registry_;
    AuthorizationChain chain_;

    // Serializes read-modify-write of stored rows.
    std::mutex mutation_lock_;

    mutable std::mutex handler_lock_;
    std::shared_ptr<interfaces::ITransferEventHandler> event_handler_;
};

} // namespace veil::transfer::agents
