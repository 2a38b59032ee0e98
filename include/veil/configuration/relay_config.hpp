#pragma once

#include "veil/core/constants.hpp"

#include <chrono>
#include <cstdint>

namespace veil::transfer::configuration {

/**
 * @brief Liquidity and confirmation settings for the stealth relay
 *
 * Confirmation polling backs off exponentially from initial_backoff up to
 * max_backoff and stops at max_attempts or once wait_budget has been spent,
 * whichever comes first.
 */
struct RelayConfig {
    uint64_t native_fee_buffer = RelayConstants::NATIVE_FEE_BUFFER;
    uint64_t asset_account_reserve = RelayConstants::ASSET_ACCOUNT_RESERVE;
    uint32_t confirmation_max_attempts = RelayConstants::CONFIRMATION_MAX_ATTEMPTS;
    std::chrono::milliseconds confirmation_initial_backoff = RelayConstants::CONFIRMATION_INITIAL_BACKOFF;
    std::chrono::milliseconds confirmation_max_backoff = RelayConstants::CONFIRMATION_MAX_BACKOFF;
    std::chrono::milliseconds confirmation_wait_budget = RelayConstants::CONFIRMATION_WAIT_BUDGET;

    [[nodiscard]] static RelayConfig Default() noexcept {
        return RelayConfig{};
    }

    [[nodiscard]] bool operator==(const RelayConfig& other) const noexcept = default;
};

} // namespace veil::transfer::configuration
