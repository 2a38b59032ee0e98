#include "veil/agents/agent_types.hpp"

#include <algorithm>
#include <array>

namespace veil::transfer::agents {

std::string_view AgentStatusName(const AgentStatus status) noexcept {
    switch (status) {
        case AgentStatus::Creating: return "creating";
        case AgentStatus::Active: return "active";
        case AgentStatus::Suspended: return "suspended";
        case AgentStatus::Revoked: return "revoked";
    }
    return "unknown";
}

std::optional<AgentStatus> ParseAgentStatus(const std::string_view name) noexcept {
    for (const auto status : {AgentStatus::Creating, AgentStatus::Active,
                              AgentStatus::Suspended, AgentStatus::Revoked}) {
        if (AgentStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

namespace permission {

bool IsKnown(const std::string_view token) noexcept {
    constexpr std::array<std::string_view, 10> known = {
        kSignTransaction, kReadBalance, kFundCard, kSwapTokens, kTransferFunds,
        kManageCards, kViewHistory, kCreateIntent, kApproveIntent, kReadHoldings
    };
    return std::find(known.begin(), known.end(), token) != known.end();
}

}

bool AgentPermissions::Allows(const std::string_view token) const {
    return std::find(allowed.begin(), allowed.end(), token) != allowed.end();
}

} // namespace veil::transfer::agents
