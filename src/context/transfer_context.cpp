#include "veil/context/transfer_context.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/debug/transfer_logger.hpp"

namespace veil::transfer {

using ContextResult = Result<std::unique_ptr<TransferContext>, TransferFailure>;

namespace {
    Result<Unit, TransferFailure> RequirePresent(const TransferDependencies& dependencies) {
        const auto missing = [](const char* name) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(std::string("Missing required collaborator: ") + name));
        };
        if (!dependencies.ledger) {
            return missing("ledger");
        }
        if (!dependencies.pool_signer) {
            return missing("pool_signer");
        }
        if (!dependencies.cashout_rails) {
            return missing("cashout_rails");
        }
        if (!dependencies.compliance) {
            return missing("compliance");
        }
        if (!dependencies.agent_store) {
            return missing("agent_store");
        }
        if (!dependencies.wallet_keys) {
            return missing("wallet_keys");
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // Enclave first, then proof, then the local plaintext check.
    agents::AuthorizationChain BuildChain(
        const configuration::AgentConfig& config,
        const TransferDependencies& dependencies) {
        agents::AuthorizationChain chain;
        if (dependencies.delegated_signer) {
            chain.Add(std::make_shared<agents::EnclaveAuthorizationStrategy>(dependencies.delegated_signer));
        }
        if (dependencies.proof_provider) {
            chain.Add(std::make_shared<agents::ProofAuthorizationStrategy>(
                dependencies.proof_provider, config.proof_validity));
        }
        chain.Add(std::make_shared<agents::PlaintextAuthorizationStrategy>());
        return chain;
    }
}

TransferContext::TransferContext(configuration::TransferConfig config)
    : config_(std::move(config)) {}

TransferContext::~TransferContext() {
    Shutdown();
}

ContextResult TransferContext::Create(
    configuration::TransferConfig config,
    TransferDependencies dependencies) {
    if (auto initialized = crypto::SodiumInterop::Initialize(); initialized.IsErr()) {
        return ContextResult::Err(TransferFailure::FromSodiumFailure(initialized.UnwrapErr()));
    }
    if (auto present = RequirePresent(dependencies); present.IsErr()) {
        return ContextResult::Err(present.UnwrapErr());
    }

    std::unique_ptr<TransferContext> context(new TransferContext(std::move(config)));
    const configuration::TransferConfig& settings = context->config_;

    context->registry_ = std::make_unique<security::NullifierRegistry>(
        settings.nullifier, dependencies.nullifier_store);
    context->replay_guard_ = std::make_unique<security::ProofReplayGuard>(*context->registry_);
    context->relay_ = std::make_unique<relay::StealthRelayCoordinator>(
        settings.relay, dependencies.ledger, dependencies.pool_signer);
    context->cashout_ = std::make_unique<cashout::CashoutPipeline>(
        settings.cashout, dependencies.cashout_rails, dependencies.compliance, dependencies.cashout_state_store);
    context->agents_ = std::make_unique<agents::AuthorizationRecordService>(
        settings.agents,
        dependencies.agent_store,
        dependencies.wallet_keys,
        dependencies.delegated_signer,
        dependencies.proof_provider,
        *context->registry_,
        BuildChain(settings.agents, dependencies));

    if (dependencies.event_handler) {
        context->registry_->SetEventHandler(dependencies.event_handler);
        context->cashout_->SetEventHandler(dependencies.event_handler);
        context->agents_->SetEventHandler(dependencies.event_handler);
    }

    VEIL_LOG_INFO("context", "Transfer context ready (pool {})", debug::Redact(context->relay_->PoolAddress()));
    return ContextResult::Ok(std::move(context));
}

void TransferContext::Shutdown() {
    if (registry_) {
        registry_->Shutdown();
    }
}

} // namespace veil::transfer
