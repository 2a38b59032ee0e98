#pragma once

#include "veil/core/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace veil::transfer::cashout {

/**
 * Working phases are listed in the order of the full path. The first and
 * last three entries are not working phases.
 */
enum class CashoutPhase {
    Idle,
    CompliancePrescreen,
    CreatingSwapAddress,
    Swapping,
    SwapComplete,
    Shielding,
    CreatingCashoutAddress,
    Unshielding,
    SendingToPayoutProvider,
    AwaitingSettlement,
    Completed,
    Error,
    Cancelled
};

enum class CashoutPath {
    XstockFull,
    UsdcWallet,
    UsdcPool
};

struct CashoutAsset {
    std::string mint;
    std::string symbol;
    uint32_t decimals = 0;
    // Settlement asset already held in the shielded pool.
    bool is_shielded = false;
};

struct ComplianceResult {
    bool passed = false;
    std::optional<std::string> reason;
    bool is_terminal = false;
};

struct CashoutRequest {
    std::string user_id;
    std::string wallet_address;
    CashoutAsset asset;
    uint64_t amount_base_units = 0;
    uint64_t amount_usd_cents = 0;
    std::string fiat_currency;
};

/**
 * @brief One user's cashout run
 *
 * Mutated only by the pipeline. Persisted after every transition.
 */
struct CashoutState {
    std::string pipeline_id;
    std::string user_id;
    std::string wallet_address;
    CashoutPhase phase = CashoutPhase::Idle;
    CashoutPath path = CashoutPath::XstockFull;
    CashoutAsset asset;
    uint64_t amount_base_units = 0;
    uint64_t amount_usd_cents = 0;
    std::string fiat_currency;

    std::optional<uint64_t> jitter_delay_ms;
    std::optional<uint64_t> jitter_remaining_ms;
    std::optional<CashoutPhase> failed_at_phase;
    std::optional<std::string> error;
    std::optional<ComplianceResult> compliance;

    std::optional<std::string> swap_output_address;
    std::optional<std::string> swap_session_key_id;
    std::optional<std::string> swap_tx_signature;
    std::optional<uint64_t> settlement_amount;
    std::optional<std::string> shield_tx_signature;
    std::optional<std::string> cashout_address;
    std::optional<std::string> unshield_tx_signature;
    std::optional<std::string> payout_ref;

    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> completed_at;

    // Settlement-asset amount moved by the phases after the swap.
    [[nodiscard]] uint64_t SettlementAmount() const noexcept {
        return settlement_amount.value_or(amount_base_units);
    }
};

enum class AddressPurpose {
    SwapOutput,
    Cashout
};

struct CreateAddressParams {
    AddressPurpose purpose = AddressPurpose::SwapOutput;
};

struct SwapParams {
    std::string input_mint;
    std::string output_mint;
    uint64_t amount = 0;
    std::string source_address;
    std::string output_address;
};

struct ShieldParams {
    std::string source_address;
    std::string mint;
    uint64_t amount = 0;
};

struct UnshieldParams {
    std::string destination_address;
    std::string mint;
    uint64_t amount = 0;
};

struct PayoutParams {
    std::string source_address;
    std::string mint;
    uint64_t amount = 0;
    std::string fiat_currency;
};

using PhaseRequest = std::variant<
    CreateAddressParams,
    SwapParams,
    ShieldParams,
    UnshieldParams,
    PayoutParams>;

/**
 * @brief What a rail call produced
 *
 * reference is the reserved address for CreateAddressParams, the transaction
 * signature for value movements, and the payout reference for PayoutParams.
 */
struct PhaseReceipt {
    std::string reference;
    std::optional<std::string> session_key_id;
    std::optional<uint64_t> amount_out;
};

struct CashoutProgress {
    double percent = 0.0;
    std::string estimated_time_remaining;
    std::string label;
};

} // namespace veil::transfer::cashout
