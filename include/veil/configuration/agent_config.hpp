#pragma once

#include "veil/core/constants.hpp"

#include <chrono>

namespace veil::transfer::configuration {

/**
 * @brief Settings for the authorization record service
 */
struct AgentConfig {
    // A cached authorization proof is reused for at most this long.
    std::chrono::milliseconds proof_validity = NullifierConstants::DEFAULT_PROOF_VALIDITY;

    [[nodiscard]] static AgentConfig Default() noexcept {
        return AgentConfig{};
    }

    [[nodiscard]] bool operator==(const AgentConfig& other) const noexcept = default;
};

} // namespace veil::transfer::configuration
