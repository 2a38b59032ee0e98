#include "veil/cashout/phase_table.hpp"

#include <algorithm>
#include <array>

namespace veil::transfer::cashout {

namespace {
    constexpr std::array kXstockFull = {
        CashoutPhase::CompliancePrescreen,
        CashoutPhase::CreatingSwapAddress,
        CashoutPhase::Swapping,
        CashoutPhase::SwapComplete,
        CashoutPhase::Shielding,
        CashoutPhase::CreatingCashoutAddress,
        CashoutPhase::Unshielding,
        CashoutPhase::SendingToPayoutProvider,
        CashoutPhase::AwaitingSettlement
    };

    constexpr std::array kUsdcWallet = {
        CashoutPhase::CompliancePrescreen,
        CashoutPhase::Shielding,
        CashoutPhase::CreatingCashoutAddress,
        CashoutPhase::Unshielding,
        CashoutPhase::SendingToPayoutProvider,
        CashoutPhase::AwaitingSettlement
    };

    // Funds are already in the pool; no prescreen.
    constexpr std::array kUsdcPool = {
        CashoutPhase::CreatingCashoutAddress,
        CashoutPhase::Unshielding,
        CashoutPhase::SendingToPayoutProvider,
        CashoutPhase::AwaitingSettlement
    };

    struct PhaseInfo {
        CashoutPhase phase;
        std::string_view name;
        std::string_view label;
    };

    constexpr std::array kPhaseInfo = {
        PhaseInfo{CashoutPhase::Idle, "idle", "Ready"},
        PhaseInfo{CashoutPhase::CompliancePrescreen, "compliance_prescreen", "Compliance check"},
        PhaseInfo{CashoutPhase::CreatingSwapAddress, "creating_swap_address", "Creating private address"},
        PhaseInfo{CashoutPhase::Swapping, "swapping", "Swapping to settlement asset"},
        PhaseInfo{CashoutPhase::SwapComplete, "swap_complete", "Applying privacy delay"},
        PhaseInfo{CashoutPhase::Shielding, "shielding", "Shielding funds"},
        PhaseInfo{CashoutPhase::CreatingCashoutAddress, "creating_cashout_address", "Creating cashout address"},
        PhaseInfo{CashoutPhase::Unshielding, "unshielding", "Preparing cashout"},
        PhaseInfo{CashoutPhase::SendingToPayoutProvider, "sending_to_payout_provider", "Sending to payout provider"},
        PhaseInfo{CashoutPhase::AwaitingSettlement, "awaiting_settlement", "Awaiting fiat settlement"},
        PhaseInfo{CashoutPhase::Completed, "completed", "Complete"},
        PhaseInfo{CashoutPhase::Error, "error", "Error"},
        PhaseInfo{CashoutPhase::Cancelled, "cancelled", "Cancelled"}
    };

    const PhaseInfo* FindInfo(const CashoutPhase phase) noexcept {
        const auto it = std::find_if(kPhaseInfo.begin(), kPhaseInfo.end(),
                                     [phase](const PhaseInfo& info) { return info.phase == phase; });
        return it == kPhaseInfo.end() ? nullptr : &*it;
    }
}

std::span<const CashoutPhase> PhaseTable::Sequence(const CashoutPath path) noexcept {
    switch (path) {
        case CashoutPath::UsdcPool: return kUsdcPool;
        case CashoutPath::UsdcWallet: return kUsdcWallet;
        case CashoutPath::XstockFull: return kXstockFull;
    }
    return kXstockFull;
}

std::optional<size_t> PhaseTable::IndexOf(const CashoutPath path, const CashoutPhase phase) noexcept {
    const auto sequence = Sequence(path);
    const auto it = std::find(sequence.begin(), sequence.end(), phase);
    if (it == sequence.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - sequence.begin());
}

RetryPolicy PhaseTable::RetryPolicyFor(const CashoutPhase phase) noexcept {
    switch (phase) {
        case CashoutPhase::Swapping:
        case CashoutPhase::Unshielding:
        case CashoutPhase::SendingToPayoutProvider:
            return RetryPolicy::RestartRequired;
        default:
            return RetryPolicy::RetryInPlace;
    }
}

CashoutPath PhaseTable::DetectPath(const CashoutAsset& asset, const std::string_view settlement_mint) noexcept {
    if (asset.is_shielded) {
        return CashoutPath::UsdcPool;
    }
    if (asset.mint == settlement_mint) {
        return CashoutPath::UsdcWallet;
    }
    return CashoutPath::XstockFull;
}

bool PhaseTable::IsWorking(const CashoutPhase phase) noexcept {
    return phase != CashoutPhase::Idle &&
           phase != CashoutPhase::Completed &&
           phase != CashoutPhase::Error &&
           phase != CashoutPhase::Cancelled;
}

bool PhaseTable::IsTerminal(const CashoutPhase phase) noexcept {
    return phase == CashoutPhase::Completed || phase == CashoutPhase::Cancelled;
}

bool PhaseTable::IsActive(const CashoutPhase phase) noexcept {
    return phase != CashoutPhase::Idle && !IsTerminal(phase);
}

std::string_view PhaseTable::Name(const CashoutPhase phase) noexcept {
    const PhaseInfo* info = FindInfo(phase);
    return info ? info->name : "unknown";
}

std::optional<CashoutPhase> PhaseTable::ParseName(const std::string_view name) noexcept {
    for (const auto& info : kPhaseInfo) {
        if (info.name == name) {
            return info.phase;
        }
    }
    return std::nullopt;
}

std::string_view PhaseTable::Label(const CashoutPhase phase) noexcept {
    const PhaseInfo* info = FindInfo(phase);
    return info ? info->label : "Unknown";
}

std::string_view PhaseTable::PathName(const CashoutPath path) noexcept {
    switch (path) {
        case CashoutPath::UsdcPool: return "usdc_pool";
        case CashoutPath::UsdcWallet: return "usdc_wallet";
        case CashoutPath::XstockFull: return "xstock_full";
    }
    return "unknown";
}

double PhaseTable::ProgressPercent(const CashoutState& state) noexcept {
    if (state.phase == CashoutPhase::Completed) {
        return 100.0;
    }
    const auto index = IndexOf(state.path, state.phase);
    if (!index.has_value()) {
        return 0.0;
    }
    const double steps = static_cast<double>(Sequence(state.path).size() + 1);
    const double base = 100.0 * static_cast<double>(*index + 1) / steps;

    if (state.phase == CashoutPhase::SwapComplete &&
        state.jitter_delay_ms.value_or(0) > 0 &&
        state.jitter_remaining_ms.has_value()) {
        const double next = 100.0 * static_cast<double>(*index + 2) / steps;
        const double elapsed = 1.0 - static_cast<double>(*state.jitter_remaining_ms) /
                                     static_cast<double>(*state.jitter_delay_ms);
        return base + std::clamp(elapsed, 0.0, 1.0) * (next - base);
    }
    return base;
}

std::string PhaseTable::EstimatedTimeRemaining(const CashoutState& state, const std::string_view settlement_eta) {
    if (state.phase == CashoutPhase::SwapComplete && state.jitter_remaining_ms.has_value()) {
        const uint64_t seconds = (*state.jitter_remaining_ms + 999) / 1000;
        return std::to_string(seconds) + "s";
    }
    if (state.phase == CashoutPhase::AwaitingSettlement) {
        return std::string(settlement_eta);
    }
    return {};
}

} // namespace veil::transfer::cashout
