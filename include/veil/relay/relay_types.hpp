#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace veil::transfer::relay {

struct NativeAsset {
    bool operator==(const NativeAsset&) const = default;
};

struct FungibleAsset {
    std::string mint;
    bool operator==(const FungibleAsset&) const = default;
};

using AssetRef = std::variant<NativeAsset, FungibleAsset>;

[[nodiscard]] inline bool IsNative(const AssetRef& asset) noexcept {
    return std::holds_alternative<NativeAsset>(asset);
}

/**
 * @brief Second hop of a two-hop transfer: pool -> stealth destination
 *
 * Transient. The caller persists the outcome and owns idempotency through
 * deposit_proof_ref.
 */
struct StealthRelayRequest {
    std::string stealth_address;
    uint64_t amount = 0;
    std::string deposit_proof_ref;
    AssetRef asset = NativeAsset{};
};

struct RelayReceipt {
    std::string relay_signature;
    std::string pool_address;
};

enum class TransactionStatus {
    Pending,
    Confirmed,
    Finalized,
    Failed
};

/**
 * @brief Value credited to one destination by a ledger transaction
 *
 * For fungible assets destination is the owner of the holding account.
 */
struct TransferEntry {
    std::string source;
    std::string destination;
    AssetRef asset;
    uint64_t amount = 0;
};

struct LedgerTransaction {
    std::string signature;
    TransactionStatus status = TransactionStatus::Pending;
    std::vector<TransferEntry> transfers;
    std::optional<std::string> error;
};

struct NativeTransferInstruction {
    std::string from;
    std::string to;
    uint64_t amount = 0;
};

struct CreateAssetAccountInstruction {
    std::string payer;
    std::string owner;
    std::string mint;
    std::string account;
};

struct AssetTransferInstruction {
    std::string source_owner;
    std::string destination_owner;
    std::string destination_account;
    std::string mint;
    uint64_t amount = 0;
};

using Instruction = std::variant<
    NativeTransferInstruction,
    CreateAssetAccountInstruction,
    AssetTransferInstruction>;

struct UnsignedTransaction {
    std::string fee_payer;
    std::string sequence_point;
    std::vector<Instruction> instructions;
};

struct SignedTransaction {
    UnsignedTransaction transaction;
    std::vector<uint8_t> signature;
};

} // namespace veil::transfer::relay
