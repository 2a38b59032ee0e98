#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace veil::transfer::interfaces {
struct AgentProofRequest {
    std::string commitment_hash;
    std::string nonce;
    std::vector<std::string> public_inputs;
};
/**
 * @brief Zero-knowledge prover for agent authorization
 */
class IAgentProofProvider {
public:
    virtual ~IAgentProofProvider() = default;
    virtual Result<std::string, TransferFailure> CurrentMerkleRoot() = 0;
    virtual Result<std::vector<uint8_t>, TransferFailure> GenerateProof(const AgentProofRequest& request) = 0;
};
}
