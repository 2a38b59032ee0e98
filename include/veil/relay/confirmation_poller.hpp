#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/configuration/relay_config.hpp"
#include "veil/interfaces/i_ledger_client.hpp"
#include "veil/relay/relay_types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace veil::transfer::relay {

/**
 * @brief Waits for a submitted transaction to reach confirmation
 *
 * Polls GetTransactionBySignature with bounded exponential backoff. Never
 * blocks past the configured wait budget:
 * - confirmed or finalized: Ok(transaction)
 * - failed on-chain: TransactionRejected
 * - attempts or budget exhausted: ConfirmationTimeout
 *
 * Transport errors during polling count as an attempt and polling continues.
 */
class ConfirmationPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ConfirmationPoller(
        std::shared_ptr<interfaces::ILedgerClient> ledger,
        configuration::RelayConfig config,
        Sleeper sleeper = {});

    Result<LedgerTransaction, TransferFailure> WaitForConfirmation(std::string_view signature) const;

    Result<LedgerTransaction, TransferFailure> WaitForConfirmation(
        std::string_view signature,
        uint32_t max_attempts) const;

private:
    std::shared_ptr<interfaces::ILedgerClient> ledger_;
    configuration::RelayConfig config_;
    Sleeper sleeper_;
};

} // namespace veil::transfer::relay
