#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/configuration/transfer_config.hpp"
#include "veil/agents/authorization_record_service.hpp"
#include "veil/cashout/cashout_pipeline.hpp"
#include "veil/relay/stealth_relay_coordinator.hpp"
#include "veil/security/nullifier/nullifier_registry.hpp"
#include "veil/security/nullifier/proof_replay_guard.hpp"
#include "veil/interfaces/i_agent_proof_provider.hpp"
#include "veil/interfaces/i_agent_record_store.hpp"
#include "veil/interfaces/i_cashout_rails.hpp"
#include "veil/interfaces/i_cashout_state_store.hpp"
#include "veil/interfaces/i_compliance_provider.hpp"
#include "veil/interfaces/i_delegated_signer.hpp"
#include "veil/interfaces/i_ledger_client.hpp"
#include "veil/interfaces/i_nullifier_store.hpp"
#include "veil/interfaces/i_signer.hpp"
#include "veil/interfaces/i_transfer_event_handler.hpp"
#include "veil/interfaces/i_wallet_key_provider.hpp"

#include <memory>

namespace veil::transfer {

/**
 * @brief External collaborators a TransferContext is built from
 *
 * Optional: nullifier_store, delegated_signer, proof_provider,
 * cashout_state_store, event_handler. Everything else is required.
 */
struct TransferDependencies {
    std::shared_ptr<interfaces::ILedgerClient> ledger;
    std::shared_ptr<interfaces::ISigner> pool_signer;
    std::shared_ptr<interfaces::ICashoutRails> cashout_rails;
    std::shared_ptr<interfaces::IComplianceProvider> compliance;
    std::shared_ptr<interfaces::IAgentRecordStore> agent_store;
    std::shared_ptr<interfaces::IWalletKeyProvider> wallet_keys;

    std::shared_ptr<interfaces::INullifierStore> nullifier_store;
    std::shared_ptr<interfaces::IDelegatedSigner> delegated_signer;
    std::shared_ptr<interfaces::IAgentProofProvider> proof_provider;
    std::shared_ptr<interfaces::ICashoutStateStore> cashout_state_store;
    std::shared_ptr<interfaces::ITransferEventHandler> event_handler;
};

/**
 * @brief Owns one instance of every transfer component
 *
 * Built once at process start and handed to whatever needs it. Tests build
 * isolated contexts from fakes.
 */
class TransferContext {
public:
    [[nodiscard]] static Result<std::unique_ptr<TransferContext>, TransferFailure> Create(
        configuration::TransferConfig config,
        TransferDependencies dependencies);

    TransferContext(const TransferContext&) = delete;
    TransferContext& operator=(const TransferContext&) = delete;

    ~TransferContext();

    [[nodiscard]] security::NullifierRegistry& Nullifiers() noexcept { return *registry_; }
    [[nodiscard]] security::ProofReplayGuard& ReplayGuard() noexcept { return *replay_guard_; }
    [[nodiscard]] relay::StealthRelayCoordinator& Relay() noexcept { return *relay_; }
    [[nodiscard]] cashout::CashoutPipeline& Cashout() noexcept { return *cashout_; }
    [[nodiscard]] agents::AuthorizationRecordService& Agents() noexcept { return *agents_; }

    [[nodiscard]] const configuration::TransferConfig& Config() const noexcept { return config_; }

    /**
     * @brief Stops the nullifier sweep thread; the context stays usable
     */
    void Shutdown();

private:
    explicit TransferContext(configuration::TransferConfig config);

    configuration::TransferConfig config_;
    // Declared first so it outlives the components holding a reference to it.
    std::unique_ptr<security::NullifierRegistry> registry_;
    std::unique_ptr<security::ProofReplayGuard> replay_guard_;
    std::unique_ptr<relay::StealthRelayCoordinator> relay_;
    std::unique_ptr<cashout::CashoutPipeline> cashout_;
    std::unique_ptr<agents::AuthorizationRecordService> agents_;
};

} // namespace veil::transfer
