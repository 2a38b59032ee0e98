#pragma once

#include "veil/configuration/agent_config.hpp"
#include "veil/configuration/cashout_config.hpp"
#include "veil/configuration/nullifier_config.hpp"
#include "veil/configuration/relay_config.hpp"

namespace veil::transfer::configuration {

/// Settings for every component owned by a TransferContext.
struct TransferConfig {
    NullifierConfig nullifier = NullifierConfig::Default();
    RelayConfig relay = RelayConfig::Default();
    CashoutConfig cashout = CashoutConfig::Default();
    AgentConfig agents = AgentConfig::Default();

    [[nodiscard]] static TransferConfig Default() {
        return TransferConfig{};
    }

    /// No sweep thread, no jitter, short retention.
    [[nodiscard]] static TransferConfig ForTesting() {
        TransferConfig config;
        config.nullifier = NullifierConfig::ForTesting();
        config.cashout = CashoutConfig::WithoutJitter();
        return config;
    }
};

} // namespace veil::transfer::configuration
