#pragma once
#include <cstddef>
#include <string>
namespace veil::transfer::interfaces {
class ITransferEventHandler {
public:
    virtual ~ITransferEventHandler() = default;
    virtual void OnReplayDetected(const std::string& proof_type) = 0;
    virtual void OnNullifiersExpired(size_t removed) = 0;
    virtual void OnRegistryFault(const std::string& reason) = 0;
    virtual void OnCashoutPhaseChanged(const std::string& user_id, const std::string& phase) = 0;
    virtual void OnAgentStatusChanged(const std::string& agent_id, const std::string& status) = 0;
};
}
