#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/relay/relay_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace veil::transfer::interfaces {
/**
 * @brief Ledger network RPC
 *
 * Every call is a suspension point. Implementations report transport
 * failures as Err; "not found" is Ok(std::nullopt).
 */
class ILedgerClient {
public:
    virtual ~ILedgerClient() = default;
    virtual Result<uint64_t, TransferFailure> GetBalance(std::string_view account) = 0;
    virtual Result<uint64_t, TransferFailure> GetAssetBalance(std::string_view owner, std::string_view mint) = 0;
    virtual Result<std::string, TransferFailure> GetLatestSequencePoint() = 0;
    /**
     * @return transaction signature assigned by the network
     */
    virtual Result<std::string, TransferFailure> SubmitTransaction(const relay::SignedTransaction& transaction) = 0;
    virtual Result<std::optional<relay::LedgerTransaction>, TransferFailure> GetTransactionBySignature(
        std::string_view signature) = 0;
    virtual Result<bool, TransferFailure> AccountExists(std::string_view address) = 0;
    /**
     * @brief Address of the holding account for (owner, mint); pure derivation
     */
    virtual std::string AssetAccountAddress(std::string_view owner, std::string_view mint) = 0;
};
}
