#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/configuration/relay_config.hpp"
#include "veil/interfaces/i_ledger_client.hpp"
#include "veil/interfaces/i_signer.hpp"
#include "veil/relay/confirmation_poller.hpp"
#include "veil/relay/relay_types.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace veil::transfer::relay {

/**
 * @brief Forwards deposited funds from the relay pool to a stealth address
 *
 * On-chain observers see pool -> stealth, never origin -> stealth.
 *
 * Relay() runs, in order:
 * 1. input validation, before any network call;
 * 2. deposit verification (exists, confirmed, credited the pool >= amount);
 * 3. pool liquidity pre-flight including the fee buffer;
 * 4. build, sign, submit, and wait for confirmation.
 *
 * Success is only reported after confirmation. The coordinator does not
 * deduplicate requests; callers track deposit_proof_ref. Pool balance checks
 * are advisory; submissions are serialized because the pool account orders
 * its transactions sequentially.
 */
class StealthRelayCoordinator {
public:
    StealthRelayCoordinator(
        configuration::RelayConfig config,
        std::shared_ptr<interfaces::ILedgerClient> ledger,
        std::shared_ptr<interfaces::ISigner> pool_signer,
        ConfirmationPoller::Sleeper sleeper = {});

    StealthRelayCoordinator(const StealthRelayCoordinator&) = delete;
    StealthRelayCoordinator& operator=(const StealthRelayCoordinator&) = delete;

    Result<RelayReceipt, TransferFailure> Relay(const StealthRelayRequest& request);

    [[nodiscard]] std::string PoolAddress() const;

private:
    Result<Unit, TransferFailure> ValidateRequest(const StealthRelayRequest& request, const std::string& pool) const;
    Result<Unit, TransferFailure> VerifyDeposit(const StealthRelayRequest& request, const std::string& pool) const;
    Result<UnsignedTransaction, TransferFailure> PlanTransfer(const StealthRelayRequest& request, const std::string& pool) const;
    Result<std::string, TransferFailure> SubmitSerialized(UnsignedTransaction transaction);

    configuration::RelayConfig config_;
    std::shared_ptr<interfaces::ILedgerClient> ledger_;
    std::shared_ptr<interfaces::ISigner> pool_signer_;
    ConfirmationPoller poller_;
    std::mutex submit_lock_;
};

} // namespace veil::transfer::relay
