#pragma once

#include "veil/cashout/cashout_types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace veil::transfer::cashout {

/**
 * @brief How a failed phase may be resumed
 *
 * RetryInPlace phases either have no external effect or an idempotent one.
 * RestartRequired phases move value and are not safe to repeat blindly; the
 * run has to be cancelled and a new one started.
 */
enum class RetryPolicy {
    RetryInPlace,
    RestartRequired
};

class PhaseTable {
public:
    /**
     * @brief Working phases of a path, in execution order
     *
     * Every path ends with AwaitingSettlement.
     */
    [[nodiscard]] static std::span<const CashoutPhase> Sequence(CashoutPath path) noexcept;

    [[nodiscard]] static std::optional<size_t> IndexOf(CashoutPath path, CashoutPhase phase) noexcept;

    [[nodiscard]] static RetryPolicy RetryPolicyFor(CashoutPhase phase) noexcept;

    /**
     * @brief Shielded settlement asset -> usdc_pool, settlement asset in the
     * wallet -> usdc_wallet, anything else -> xstock_full
     */
    [[nodiscard]] static CashoutPath DetectPath(const CashoutAsset& asset, std::string_view settlement_mint) noexcept;

    [[nodiscard]] static bool IsWorking(CashoutPhase phase) noexcept;

    /**
     * @brief completed and cancelled
     */
    [[nodiscard]] static bool IsTerminal(CashoutPhase phase) noexcept;

    /**
     * @brief Anything but idle, completed and cancelled
     */
    [[nodiscard]] static bool IsActive(CashoutPhase phase) noexcept;

    [[nodiscard]] static std::string_view Name(CashoutPhase phase) noexcept;
    [[nodiscard]] static std::optional<CashoutPhase> ParseName(std::string_view name) noexcept;
    [[nodiscard]] static std::string_view Label(CashoutPhase phase) noexcept;
    [[nodiscard]] static std::string_view PathName(CashoutPath path) noexcept;

    /**
     * @brief 100 * (index + 1) / (phases + 1) for the current path
     *
     * completed is 100; idle, error and cancelled are 0. During swap_complete
     * the value moves toward the next phase as the jitter counts down.
     */
    [[nodiscard]] static double ProgressPercent(const CashoutState& state) noexcept;

    /**
     * @brief "<n>s" during the jitter, the settlement ETA while awaiting
     * settlement, empty otherwise
     */
    [[nodiscard]] static std::string EstimatedTimeRemaining(const CashoutState& state, std::string_view settlement_eta);

private:
    PhaseTable() = delete;
};

} // namespace veil::transfer::cashout
