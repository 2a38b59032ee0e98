#pragma once
#include "veil/context/transfer_context.hpp"
#include "helpers/fake_agent_collaborators.hpp"
#include "helpers/fake_cashout_rails.hpp"
#include "helpers/fake_ledger.hpp"
#include "helpers/fake_nullifier_store.hpp"
#include <memory>

namespace veil::transfer::test_helpers {

/**
 * Every collaborator a TransferContext accepts, as fakes that tests can
 * script and inspect after handing them over.
 */
struct FakeTransferWorld {
    std::shared_ptr<FakeLedgerClient> ledger = std::make_shared<FakeLedgerClient>();
    std::shared_ptr<FakePoolSigner> pool_signer = std::make_shared<FakePoolSigner>();
    std::shared_ptr<FakeCashoutRails> rails = std::make_shared<FakeCashoutRails>();
    std::shared_ptr<FakeComplianceProvider> compliance = std::make_shared<FakeComplianceProvider>();
    std::shared_ptr<InMemoryAgentRecordStore> agent_store = std::make_shared<InMemoryAgentRecordStore>();
    std::shared_ptr<FakeWalletKeyProvider> wallet_keys = std::make_shared<FakeWalletKeyProvider>();
    std::shared_ptr<InMemoryNullifierStore> nullifier_store = std::make_shared<InMemoryNullifierStore>();
    std::shared_ptr<FakeDelegatedSigner> delegated_signer = std::make_shared<FakeDelegatedSigner>();
    std::shared_ptr<FakeAgentProofProvider> proof_provider = std::make_shared<FakeAgentProofProvider>();
    std::shared_ptr<InMemoryCashoutStateStore> cashout_store = std::make_shared<InMemoryCashoutStateStore>();
    std::shared_ptr<RecordingEventHandler> events = std::make_shared<RecordingEventHandler>();

    [[nodiscard]] TransferDependencies RequiredOnly() const {
        TransferDependencies dependencies;
        dependencies.ledger = ledger;
        dependencies.pool_signer = pool_signer;
        dependencies.cashout_rails = rails;
        dependencies.compliance = compliance;
        dependencies.agent_store = agent_store;
        dependencies.wallet_keys = wallet_keys;
        return dependencies;
    }

    [[nodiscard]] TransferDependencies All() const {
        TransferDependencies dependencies = RequiredOnly();
        dependencies.nullifier_store = nullifier_store;
        dependencies.delegated_signer = delegated_signer;
        dependencies.proof_provider = proof_provider;
        dependencies.cashout_state_store = cashout_store;
        dependencies.event_handler = events;
        return dependencies;
    }

    [[nodiscard]] std::unique_ptr<TransferContext> Build(
        configuration::TransferConfig config = configuration::TransferConfig::ForTesting()) const {
        return TransferContext::Create(std::move(config), All()).Unwrap();
    }
};

}
