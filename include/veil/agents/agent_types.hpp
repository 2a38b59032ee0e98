#pragma once

#include "veil/core/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::agents {

enum class AgentStatus {
    Creating,
    Active,
    Suspended,
    Revoked
};

[[nodiscard]] std::string_view AgentStatusName(AgentStatus status) noexcept;

[[nodiscard]] std::optional<AgentStatus> ParseAgentStatus(std::string_view name) noexcept;

/**
 * @brief Operation tokens an agent may be granted
 */
namespace permission {
    inline constexpr std::string_view kSignTransaction = "sign_transaction";
    inline constexpr std::string_view kReadBalance = "read_balance";
    inline constexpr std::string_view kFundCard = "fund_card";
    inline constexpr std::string_view kSwapTokens = "swap_tokens";
    inline constexpr std::string_view kTransferFunds = "transfer_funds";
    inline constexpr std::string_view kManageCards = "manage_cards";
    inline constexpr std::string_view kViewHistory = "view_history";
    inline constexpr std::string_view kCreateIntent = "create_intent";
    inline constexpr std::string_view kApproveIntent = "approve_intent";
    inline constexpr std::string_view kReadHoldings = "read_holdings";

    [[nodiscard]] bool IsKnown(std::string_view token) noexcept;
}

struct WalletScoping {
    std::vector<std::string> allowed_addresses;
    std::optional<uint64_t> max_transaction_amount;
    std::optional<uint64_t> daily_limit;
    std::optional<uint64_t> monthly_limit;
};

struct ActivityRestrictions {
    std::vector<std::string> allowed_mcc_codes;
};

struct TimeRestrictions {
    std::optional<int64_t> valid_from_ms;
    std::optional<int64_t> valid_until_ms;
    std::vector<uint32_t> allowed_hours;
};

struct AgentPermissions {
    std::vector<std::string> allowed;
    std::optional<WalletScoping> wallet_scoping;
    std::optional<ActivityRestrictions> activity_restrictions;
    std::optional<TimeRestrictions> time_restrictions;

    [[nodiscard]] bool Allows(std::string_view token) const;
};

/**
 * @brief Proof attesting the agent's permissions against a merkle root
 *
 * The proof bytes are opaque to this layer.
 */
struct CachedProof {
    std::vector<uint8_t> proof;
    std::vector<std::string> public_inputs;
    std::string merkle_root;
    Timestamp generated_at;
};

/**
 * @brief Plaintext agent record
 *
 * Exists only in memory. The persisted form is StoredAgentRecord.
 */
struct AgentRecord {
    std::string agent_id;
    std::string name;
    std::string description;
    std::string agent_pubkey;
    std::string wallet_pubkey;
    AgentPermissions permissions;
    std::string nonce;
    Timestamp created_at;
    Timestamp updated_at;
    AgentStatus status = AgentStatus::Creating;
};

/**
 * @brief Row in the agent record store
 *
 * Carries no plaintext permissions or keys.
 */
struct StoredAgentRecord {
    std::string agent_id;
    std::string wallet_pubkey;
    std::string encrypted_record;
    std::string commitment_hash;
    std::string permissions_hash;
    AgentStatus status = AgentStatus::Creating;
    std::optional<std::string> session_key_id;
    std::optional<std::string> policy_id;
    std::optional<CachedProof> cached_proof;
    std::optional<std::string> revocation_nullifier;
    std::optional<Timestamp> revoked_at;
    Timestamp created_at;
    Timestamp updated_at;
};

struct CreateAgentInputs {
    std::string name;
    std::string description;
    AgentPermissions permissions;
    bool request_signing_session = true;
};

/**
 * @brief Partial update, absent fields stay unchanged
 */
struct AgentRecordPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<AgentPermissions> permissions;
    std::optional<std::string> agent_pubkey;
    bool rotate_nonce = false;
};

struct AgentOperation {
    std::string type;
    std::optional<uint64_t> amount;
    std::optional<std::string> target;
    std::optional<std::string> mcc_code;
    std::vector<uint8_t> payload;
};

/**
 * @brief Outcome of an authorized operation
 *
 * signature is empty on the proof path, where the caller hands the proof to
 * an external verifier instead.
 */
struct AgentOperationResult {
    std::string nullifier;
    std::vector<uint8_t> signature;
    std::string strategy;
    std::optional<CachedProof> proof;
    Timestamp executed_at;
};

} // namespace veil::transfer::agents
