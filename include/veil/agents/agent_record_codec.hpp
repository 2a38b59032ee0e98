#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/crypto/secure_memory_handle.hpp"
#include "veil/agents/agent_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace veil::transfer::agents {

/**
 * @brief Wire and at-rest forms of agent records
 *
 * Records are serialized as veil.proto.agents.AgentRecord and encrypted with
 * AES-256-GCM under a key derived from the owning wallet's secret and
 * kAgentRecordContext. The agent id is bound as associated data, so a blob
 * moved to another row fails to decrypt.
 */
class AgentRecordCodec {
public:
    [[nodiscard]] static Result<std::string, TransferFailure> Serialize(const AgentRecord& record);

    [[nodiscard]] static Result<AgentRecord, TransferFailure> Parse(std::string_view bytes);

    [[nodiscard]] static Result<std::string, TransferFailure> Encrypt(
        const AgentRecord& record,
        const crypto::SecureMemoryHandle& wallet_secret);

    [[nodiscard]] static Result<AgentRecord, TransferFailure> Decrypt(
        std::string_view agent_id,
        std::string_view encrypted_record,
        const crypto::SecureMemoryHandle& wallet_secret);

    /**
     * @brief Operation log entry, sealed to the wallet owner's public key
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> SealOperation(
        std::string_view agent_id,
        const AgentOperation& operation,
        const AgentOperationResult& result,
        std::span<const uint8_t> owner_public_key);

private:
    AgentRecordCodec() = delete;
};

} // namespace veil::transfer::agents
