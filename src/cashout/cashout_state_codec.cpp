#include "veil/cashout/cashout_state_codec.hpp"
#include "veil/core/format.hpp"
#include "cashout/cashout_state.pb.h"

namespace veil::transfer::cashout {

namespace {
    // The proto enums share declaration order with the C++ enums.
    proto::cashout::CashoutPhase ToProto(const CashoutPhase phase) {
        return static_cast<proto::cashout::CashoutPhase>(static_cast<int>(phase));
    }

    CashoutPhase FromProto(const proto::cashout::CashoutPhase phase) {
        return static_cast<CashoutPhase>(static_cast<int>(phase));
    }

    proto::cashout::CashoutPath ToProto(const CashoutPath path) {
        switch (path) {
            case CashoutPath::UsdcWallet: return proto::cashout::CASHOUT_PATH_USDC_WALLET;
            case CashoutPath::UsdcPool: return proto::cashout::CASHOUT_PATH_USDC_POOL;
            case CashoutPath::XstockFull: break;
        }
        return proto::cashout::CASHOUT_PATH_XSTOCK_FULL;
    }

    CashoutPath FromProto(const proto::cashout::CashoutPath path) {
        switch (path) {
            case proto::cashout::CASHOUT_PATH_USDC_WALLET: return CashoutPath::UsdcWallet;
            case proto::cashout::CASHOUT_PATH_USDC_POOL: return CashoutPath::UsdcPool;
            default: return CashoutPath::XstockFull;
        }
    }

    template<typename Setter>
    void SetIfPresent(const std::optional<std::string>& value, Setter&& setter) {
        if (value.has_value()) {
            setter(*value);
        }
    }
}

Result<std::string, TransferFailure> CashoutStateCodec::Serialize(const CashoutState& state) {
    proto::cashout::CashoutState message;
    message.set_pipeline_id(state.pipeline_id);
    message.set_user_id(state.user_id);
    message.set_wallet_address(state.wallet_address);
    message.set_phase(ToProto(state.phase));
    message.set_path(ToProto(state.path));

    auto* asset = message.mutable_asset();
    asset->set_mint(state.asset.mint);
    asset->set_symbol(state.asset.symbol);
    asset->set_decimals(state.asset.decimals);
    asset->set_is_shielded(state.asset.is_shielded);

    message.set_amount_base_units(state.amount_base_units);
    message.set_amount_usd_cents(state.amount_usd_cents);
    message.set_fiat_currency(state.fiat_currency);

    if (state.jitter_delay_ms.has_value()) {
        message.set_jitter_delay_ms(*state.jitter_delay_ms);
    }
    if (state.jitter_remaining_ms.has_value()) {
        message.set_jitter_remaining_ms(*state.jitter_remaining_ms);
    }
    if (state.failed_at_phase.has_value()) {
        message.set_failed_at_phase(ToProto(*state.failed_at_phase));
    }
    SetIfPresent(state.error, [&](const std::string& v) { message.set_error(v); });
    if (state.compliance.has_value()) {
        auto* compliance = message.mutable_compliance();
        compliance->set_passed(state.compliance->passed);
        compliance->set_reason(state.compliance->reason.value_or(""));
        compliance->set_is_terminal(state.compliance->is_terminal);
    }

    SetIfPresent(state.swap_output_address, [&](const std::string& v) { message.set_swap_output_address(v); });
    SetIfPresent(state.swap_session_key_id, [&](const std::string& v) { message.set_swap_session_key_id(v); });
    SetIfPresent(state.swap_tx_signature, [&](const std::string& v) { message.set_swap_tx_signature(v); });
    if (state.settlement_amount.has_value()) {
        message.set_settlement_amount(*state.settlement_amount);
    }
    SetIfPresent(state.shield_tx_signature, [&](const std::string& v) { message.set_shield_tx_signature(v); });
    SetIfPresent(state.cashout_address, [&](const std::string& v) { message.set_cashout_address(v); });
    SetIfPresent(state.unshield_tx_signature, [&](const std::string& v) { message.set_unshield_tx_signature(v); });
    SetIfPresent(state.payout_ref, [&](const std::string& v) { message.set_payout_ref(v); });

    message.set_created_at_ms(ToUnixMillis(state.created_at));
    message.set_updated_at_ms(ToUnixMillis(state.updated_at));
    if (state.completed_at.has_value()) {
        message.set_completed_at_ms(ToUnixMillis(*state.completed_at));
    }

    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::Encode("Failed to serialize CashoutState to protobuf"));
    }
    return Result<std::string, TransferFailure>::Ok(std::move(bytes));
}

Result<CashoutState, TransferFailure> CashoutStateCodec::Parse(const std::string_view bytes) {
    proto::cashout::CashoutState message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<CashoutState, TransferFailure>::Err(
            TransferFailure::Decode("Failed to parse CashoutState from protobuf"));
    }
    if (!proto::cashout::CashoutPhase_IsValid(message.phase())) {
        return Result<CashoutState, TransferFailure>::Err(
            TransferFailure::Decode(compat::format("Unknown cashout phase {}", static_cast<int>(message.phase()))));
    }
    if (message.has_failed_at_phase() && !proto::cashout::CashoutPhase_IsValid(message.failed_at_phase())) {
        return Result<CashoutState, TransferFailure>::Err(
            TransferFailure::Decode(compat::format("Unknown failed-at phase {}",
                                                   static_cast<int>(message.failed_at_phase()))));
    }
    if (!proto::cashout::CashoutPath_IsValid(message.path())) {
        return Result<CashoutState, TransferFailure>::Err(
            TransferFailure::Decode(compat::format("Unknown cashout path {}", static_cast<int>(message.path()))));
    }

    CashoutState state;
    state.pipeline_id = message.pipeline_id();
    state.user_id = message.user_id();
    state.wallet_address = message.wallet_address();
    state.phase = FromProto(message.phase());
    state.path = FromProto(message.path());
    state.asset = CashoutAsset{
        .mint = message.asset().mint(),
        .symbol = message.asset().symbol(),
        .decimals = message.asset().decimals(),
        .is_shielded = message.asset().is_shielded()
    };
    state.amount_base_units = message.amount_base_units();
    state.amount_usd_cents = message.amount_usd_cents();
    state.fiat_currency = message.fiat_currency();

    if (message.has_jitter_delay_ms()) {
        state.jitter_delay_ms = message.jitter_delay_ms();
    }
    if (message.has_jitter_remaining_ms()) {
        state.jitter_remaining_ms = message.jitter_remaining_ms();
    }
    if (message.has_failed_at_phase()) {
        state.failed_at_phase = FromProto(message.failed_at_phase());
    }
    if (message.has_error()) {
        state.error = message.error();
    }
    if (message.has_compliance()) {
        const auto& compliance = message.compliance();
        state.compliance = ComplianceResult{
            .passed = compliance.passed(),
            .reason = compliance.reason().empty() ? std::nullopt : std::optional<std::string>(compliance.reason()),
            .is_terminal = compliance.is_terminal()
        };
    }
    if (message.has_swap_output_address()) {
        state.swap_output_address = message.swap_output_address();
    }
    if (message.has_swap_session_key_id()) {
        state.swap_session_key_id = message.swap_session_key_id();
    }
    if (message.has_swap_tx_signature()) {
        state.swap_tx_signature = message.swap_tx_signature();
    }
    if (message.has_settlement_amount()) {
        state.settlement_amount = message.settlement_amount();
    }
    if (message.has_shield_tx_signature()) {
        state.shield_tx_signature = message.shield_tx_signature();
    }
    if (message.has_cashout_address()) {
        state.cashout_address = message.cashout_address();
    }
    if (message.has_unshield_tx_signature()) {
        state.unshield_tx_signature = message.unshield_tx_signature();
    }
    if (message.has_payout_ref()) {
        state.payout_ref = message.payout_ref();
    }

    state.created_at = FromUnixMillis(message.created_at_ms());
    state.updated_at = FromUnixMillis(message.updated_at_ms());
    if (message.has_completed_at_ms()) {
        state.completed_at = FromUnixMillis(message.completed_at_ms());
    }
    return Result<CashoutState, TransferFailure>::Ok(std::move(state));
}

} // namespace veil::transfer::cashout
