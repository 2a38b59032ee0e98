#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/agents/agent_types.hpp"

#include <string>
#include <string_view>

namespace veil::transfer::agents {

struct AgentCommitmentInputs {
    std::string agent_pubkey;
    std::string wallet_pubkey;
    std::string permissions_hash;
    std::string nonce;
};

/**
 * @brief Commitments binding an agent to its wallet and permission set
 *
 * ComputePermissionsHash is independent of the order of allowed tokens,
 * scoped addresses and MCC codes. ComputeAgentCommitment is order-sensitive
 * over (agent_pubkey, wallet_pubkey, permissions_hash, nonce) and changes when
 * any single field changes.
 */
class AgentCommitment {
public:
    /**
     * @return 64 lowercase hex characters
     */
    [[nodiscard]] static std::string ComputePermissionsHash(const AgentPermissions& permissions);

    /**
     * @return "0x" followed by 64 lowercase hex characters
     */
    [[nodiscard]] static std::string ComputeAgentCommitment(const AgentCommitmentInputs& inputs);

    /**
     * @brief Constant-time check of a stored commitment against claimed inputs
     *
     * Accepts the commitment with or without "0x" and in either case.
     * Err(InvalidInput) when the commitment is not 32 bytes of hex.
     */
    [[nodiscard]] static Result<bool, TransferFailure> VerifyAgentCommitment(
        std::string_view commitment,
        const AgentCommitmentInputs& inputs);

    /**
     * @return "0x" followed by 64 hex characters of fresh randomness
     */
    [[nodiscard]] static std::string GenerateAgentNonce();

private:
    AgentCommitment() = delete;
};

} // namespace veil::transfer::agents
