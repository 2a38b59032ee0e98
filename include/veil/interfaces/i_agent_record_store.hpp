#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/agents/agent_types.hpp"
#include <optional>
#include <string_view>
#include <vector>
namespace veil::transfer::interfaces {
/**
 * @brief agent_records table keyed by agent id
 *
 * Rows hold only the encrypted record, the public hashes, status and
 * revocation metadata.
 */
class IAgentRecordStore {
public:
    virtual ~IAgentRecordStore() = default;
    virtual Result<Unit, TransferFailure> Insert(const agents::StoredAgentRecord& record) = 0;
    /**
     * @return Err(NotFound) when no row exists for record.agent_id
     */
    virtual Result<Unit, TransferFailure> Update(const agents::StoredAgentRecord& record) = 0;
    virtual Result<std::optional<agents::StoredAgentRecord>, TransferFailure> Get(std::string_view agent_id) = 0;
    virtual Result<std::vector<agents::StoredAgentRecord>, TransferFailure> ListByWallet(std::string_view wallet_pubkey) = 0;
    virtual Result<Unit, TransferFailure> AppendOperationLog(std::string_view agent_id, const std::vector<uint8_t>& sealed_entry) = 0;
};
}
