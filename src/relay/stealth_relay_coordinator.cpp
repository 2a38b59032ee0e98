#include "veil/relay/stealth_relay_coordinator.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/format.hpp"

#include <limits>
#include <optional>

namespace veil::transfer::relay {

using UnitResult = Result<Unit, TransferFailure>;

namespace {
    std::string DescribeAsset(const AssetRef& asset) {
        if (const auto* fungible = std::get_if<FungibleAsset>(&asset)) {
            return "asset " + fungible->mint;
        }
        return "native";
    }

    std::optional<uint64_t> CheckedAdd(const uint64_t a, const uint64_t b) {
        if (a > std::numeric_limits<uint64_t>::max() - b) {
            return std::nullopt;
        }
        return a + b;
    }

    TransferFailure LedgerFailure(const char* step, const TransferFailure& cause) {
        return TransferFailure::ExternalCallFailed(compat::format("{}: {}", step, cause.message));
    }
}

StealthRelayCoordinator::StealthRelayCoordinator(
    configuration::RelayConfig config,
    std::shared_ptr<interfaces::ILedgerClient> ledger,
    std::shared_ptr<interfaces::ISigner> pool_signer,
    ConfirmationPoller::Sleeper sleeper)
    : config_(config)
    , ledger_(std::move(ledger))
    , pool_signer_(std::move(pool_signer))
    , poller_(ledger_, config_, std::move(sleeper)) {
}

std::string StealthRelayCoordinator::PoolAddress() const {
    return pool_signer_->Address();
}

Result<RelayReceipt, TransferFailure> StealthRelayCoordinator::Relay(const StealthRelayRequest& request) {
    using RelayResult = Result<RelayReceipt, TransferFailure>;
    const std::string pool = PoolAddress();

    if (auto valid = ValidateRequest(request, pool); valid.IsErr()) {
        return RelayResult::Err(valid.UnwrapErr());
    }
    if (auto deposit = VerifyDeposit(request, pool); deposit.IsErr()) {
        VEIL_LOG_WARN("relay", "Deposit {} rejected: {}",
                      debug::Redact(request.deposit_proof_ref), deposit.UnwrapErr().message);
        return RelayResult::Err(deposit.UnwrapErr());
    }

    auto planned = PlanTransfer(request, pool);
    if (planned.IsErr()) {
        VEIL_LOG_WARN("relay", "Relay of {} ({}) refused: {}",
                      request.amount, DescribeAsset(request.asset), planned.UnwrapErr().message);
        return RelayResult::Err(planned.UnwrapErr());
    }

    auto submitted = SubmitSerialized(std::move(planned).Unwrap());
    if (submitted.IsErr()) {
        return RelayResult::Err(submitted.UnwrapErr());
    }
    const std::string signature = std::move(submitted).Unwrap();

    auto confirmed = poller_.WaitForConfirmation(signature);
    if (confirmed.IsErr()) {
        VEIL_LOG_ERROR("relay", "Relay {} not confirmed: {}", debug::Redact(signature), confirmed.UnwrapErr().message);
        return RelayResult::Err(confirmed.UnwrapErr());
    }

    VEIL_LOG_INFO("relay", "Relayed {} ({}) to {}", request.amount, DescribeAsset(request.asset),
                  debug::Redact(request.stealth_address));
    return RelayResult::Ok(RelayReceipt{
        .relay_signature = signature,
        .pool_address = pool
    });
}

UnitResult StealthRelayCoordinator::ValidateRequest(const StealthRelayRequest& request, const std::string& pool) const {
    if (request.stealth_address.empty()) {
        return UnitResult::Err(TransferFailure::InvalidInput("Stealth address is required"));
    }
    if (request.deposit_proof_ref.empty()) {
        return UnitResult::Err(TransferFailure::InvalidInput("Deposit proof reference is required"));
    }
    if (request.amount == 0) {
        return UnitResult::Err(TransferFailure::InvalidInput("Relay amount must be greater than zero"));
    }
    if (request.stealth_address == pool) {
        return UnitResult::Err(TransferFailure::InvalidInput("Stealth address must differ from the pool address"));
    }
    if (const auto* fungible = std::get_if<FungibleAsset>(&request.asset); fungible && fungible->mint.empty()) {
        return UnitResult::Err(TransferFailure::InvalidInput("Fungible asset requires a mint"));
    }
    return UnitResult::Ok(unit);
}

UnitResult StealthRelayCoordinator::VerifyDeposit(const StealthRelayRequest& request, const std::string& pool) const {
    auto fetched = ledger_->GetTransactionBySignature(request.deposit_proof_ref);
    if (fetched.IsErr()) {
        return UnitResult::Err(LedgerFailure("Deposit lookup failed", fetched.UnwrapErr()));
    }
    const auto& deposit = fetched.Unwrap();
    if (!deposit.has_value()) {
        return UnitResult::Err(TransferFailure::DepositUnconfirmed("Deposit transaction not found"));
    }
    if (deposit->status == TransactionStatus::Failed) {
        return UnitResult::Err(TransferFailure::DepositUnconfirmed("Deposit transaction failed on-chain"));
    }
    if (deposit->status == TransactionStatus::Pending) {
        return UnitResult::Err(TransferFailure::DepositUnconfirmed("Deposit transaction is not confirmed yet"));
    }

    uint64_t credited = 0;
    for (const auto& entry : deposit->transfers) {
        if (entry.destination == pool && entry.asset == request.asset) {
            const auto total = CheckedAdd(credited, entry.amount);
            if (!total.has_value()) {
                return UnitResult::Err(TransferFailure::InvalidInput("Deposit transfer amounts overflow"));
            }
            credited = *total;
        }
    }
    if (credited < request.amount) {
        return UnitResult::Err(TransferFailure::InsufficientDeposit(
            compat::format("Deposit credited {} to the pool, relay requires {}", credited, request.amount)));
    }
    return UnitResult::Ok(unit);
}

Result<UnsignedTransaction, TransferFailure> StealthRelayCoordinator::PlanTransfer(
    const StealthRelayRequest& request,
    const std::string& pool) const {
    using PlanResult = Result<UnsignedTransaction, TransferFailure>;

    auto native_balance = ledger_->GetBalance(pool);
    if (native_balance.IsErr()) {
        return PlanResult::Err(LedgerFailure("Pool balance lookup failed", native_balance.UnwrapErr()));
    }
    const uint64_t available_native = native_balance.Unwrap();

    UnsignedTransaction transaction;
    transaction.fee_payer = pool;

    if (IsNative(request.asset)) {
        const auto total = CheckedAdd(request.amount, config_.native_fee_buffer);
        if (!total.has_value()) {
            return PlanResult::Err(TransferFailure::InvalidInput("Relay amount plus fee buffer overflows"));
        }
        const uint64_t required = *total;
        if (available_native < required) {
            return PlanResult::Err(TransferFailure::InsufficientPoolBalance(
                compat::format("Relay rejected: insufficient pool balance (available {}, required {})",
                               available_native, required)));
        }
        transaction.instructions.emplace_back(NativeTransferInstruction{
            .from = pool,
            .to = request.stealth_address,
            .amount = request.amount
        });
        return PlanResult::Ok(std::move(transaction));
    }

    const auto& mint = std::get<FungibleAsset>(request.asset).mint;
    auto asset_balance = ledger_->GetAssetBalance(pool, mint);
    if (asset_balance.IsErr()) {
        return PlanResult::Err(LedgerFailure("Pool asset balance lookup failed", asset_balance.UnwrapErr()));
    }
    if (asset_balance.Unwrap() < request.amount) {
        return PlanResult::Err(TransferFailure::InsufficientPoolBalance(
            compat::format("Relay rejected: insufficient pool balance for {} (available {}, required {})",
                           mint, asset_balance.Unwrap(), request.amount)));
    }

    const std::string destination_account = ledger_->AssetAccountAddress(request.stealth_address, mint);
    auto exists = ledger_->AccountExists(destination_account);
    if (exists.IsErr()) {
        return PlanResult::Err(LedgerFailure("Destination account lookup failed", exists.UnwrapErr()));
    }
    const bool needs_account = !exists.Unwrap();
    const auto fees = CheckedAdd(config_.native_fee_buffer, needs_account ? config_.asset_account_reserve : 0);
    if (!fees.has_value()) {
        return PlanResult::Err(TransferFailure::InvalidInput("Fee buffer plus account reserve overflows"));
    }
    const uint64_t required_native = *fees;
    if (available_native < required_native) {
        return PlanResult::Err(TransferFailure::InsufficientPoolBalance(
            compat::format("Relay rejected: insufficient pool balance for fees (available {}, required {})",
                           available_native, required_native)));
    }

    if (needs_account) {
        transaction.instructions.emplace_back(CreateAssetAccountInstruction{
            .payer = pool,
            .owner = request.stealth_address,
            .mint = mint,
            .account = destination_account
        });
    }
    transaction.instructions.emplace_back(AssetTransferInstruction{
        .source_owner = pool,
        .destination_owner = request.stealth_address,
        .destination_account = destination_account,
        .mint = mint,
        .amount = request.amount
    });
    return PlanResult::Ok(std::move(transaction));
}

Result<std::string, TransferFailure> StealthRelayCoordinator::SubmitSerialized(UnsignedTransaction transaction) {
    using SubmitResult = Result<std::string, TransferFailure>;
    std::lock_guard guard(submit_lock_);

    auto sequence = ledger_->GetLatestSequencePoint();
    if (sequence.IsErr()) {
        return SubmitResult::Err(LedgerFailure("Sequence point lookup failed", sequence.UnwrapErr()));
    }
    transaction.sequence_point = std::move(sequence).Unwrap();

    auto signed_tx = pool_signer_->Sign(transaction);
    if (signed_tx.IsErr()) {
        return SubmitResult::Err(LedgerFailure("Pool signing failed", signed_tx.UnwrapErr()));
    }

    auto submitted = ledger_->SubmitTransaction(signed_tx.Unwrap());
    if (submitted.IsErr()) {
        return SubmitResult::Err(LedgerFailure("Relay submission failed", submitted.UnwrapErr()));
    }
    return submitted;
}

} // namespace veil::transfer::relay
