#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/agents/agent_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace veil::transfer::interfaces {
struct DelegatedSession {
    std::string session_key_id;
    std::optional<std::string> policy_id;
};
/**
 * @brief Remote signer holding agent session keys behind a spending policy
 */
class IDelegatedSigner {
public:
    virtual ~IDelegatedSigner() = default;
    virtual Result<DelegatedSession, TransferFailure> CreateSession(
        std::string_view agent_id,
        std::string_view wallet_pubkey,
        const agents::AgentPermissions& permissions) = 0;
    /**
     * @return Ok(false) when the policy refuses the operation
     */
    virtual Result<bool, TransferFailure> CheckPolicy(
        std::string_view session_key_id,
        const agents::AgentOperation& operation) = 0;
    virtual Result<std::vector<uint8_t>, TransferFailure> Sign(
        std::string_view session_key_id,
        std::span<const uint8_t> payload) = 0;
    virtual Result<Unit, TransferFailure> RevokeSession(std::string_view session_key_id) = 0;
};
}
