#include "veil/relay/confirmation_poller.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/format.hpp"

#include <algorithm>
#include <thread>

namespace veil::transfer::relay {

using TxResult = Result<LedgerTransaction, TransferFailure>;

ConfirmationPoller::ConfirmationPoller(
    std::shared_ptr<interfaces::ILedgerClient> ledger,
    configuration::RelayConfig config,
    Sleeper sleeper)
    : ledger_(std::move(ledger))
    , config_(config)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

TxResult ConfirmationPoller::WaitForConfirmation(const std::string_view signature) const {
    return WaitForConfirmation(signature, config_.confirmation_max_attempts);
}

TxResult ConfirmationPoller::WaitForConfirmation(
    const std::string_view signature,
    const uint32_t max_attempts) const {
    std::chrono::milliseconds backoff = config_.confirmation_initial_backoff;
    std::chrono::milliseconds waited{0};

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto fetched = ledger_->GetTransactionBySignature(signature);
        if (fetched.IsErr()) {
            VEIL_LOG_WARN("relay", "Confirmation poll {} for {} failed: {}",
                          attempt, debug::Redact(signature), fetched.UnwrapErr().message);
        } else if (const auto& transaction = fetched.Unwrap(); transaction.has_value()) {
            switch (transaction->status) {
                case TransactionStatus::Confirmed:
                case TransactionStatus::Finalized:
                    return TxResult::Ok(*transaction);
                case TransactionStatus::Failed:
                    return TxResult::Err(TransferFailure::TransactionRejected(
                        compat::format("Transaction rejected on-chain: {}",
                                       transaction->error.value_or("no reason given"))));
                case TransactionStatus::Pending:
                    break;
            }
        }

        if (attempt == max_attempts || waited + backoff > config_.confirmation_wait_budget) {
            break;
        }
        sleeper_(backoff);
        waited += backoff;
        backoff = std::min(backoff * 2, config_.confirmation_max_backoff);
    }

    return TxResult::Err(TransferFailure::ConfirmationTimeout(
        compat::format("Transaction {} not confirmed after waiting {} ms",
                       debug::Redact(signature), waited.count())));
}

} // namespace veil::transfer::relay
