#pragma once

#include "veil/core/constants.hpp"

#include <chrono>
#include <string>

namespace veil::transfer::configuration {

/**
 * @brief Timing and settlement settings for the cashout pipeline
 *
 * The jitter inserted after a swap is drawn uniformly from [0, max_jitter].
 * Only the delay itself matters for unlinkability; the countdown published
 * through jitterRemainingMs is informational.
 */
struct CashoutConfig {
    std::chrono::milliseconds max_jitter = CashoutConstants::MAX_JITTER;
    std::chrono::milliseconds jitter_tick = CashoutConstants::JITTER_TICK;
    std::string settlement_eta = std::string(CashoutConstants::SETTLEMENT_ETA);
    std::string settlement_mint = std::string(CashoutConstants::SETTLEMENT_MINT);

    [[nodiscard]] static CashoutConfig Default() {
        return CashoutConfig{};
    }

    [[nodiscard]] static CashoutConfig WithoutJitter() {
        CashoutConfig config;
        config.max_jitter = std::chrono::milliseconds(0);
        return config;
    }
};

} // namespace veil::transfer::configuration
