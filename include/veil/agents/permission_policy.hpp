#pragma once

#include "veil/core/clock.hpp"
#include "veil/agents/agent_types.hpp"

#include <optional>
#include <string>

namespace veil::transfer::agents {

/**
 * @brief Local evaluation of an operation against an agent's permissions
 *
 * Checks the operation token, the per-transaction amount cap, scoped target
 * addresses, MCC codes and the validity window (hours are UTC). Daily and
 * monthly limits need spend history and are enforced by the delegated
 * signer's policy.
 */
class PermissionPolicy {
public:
    /**
     * @return std::nullopt when permitted, otherwise the denial reason
     */
    [[nodiscard]] static std::optional<std::string> Evaluate(
        const AgentPermissions& permissions,
        const AgentOperation& operation,
        Timestamp now);

    /**
     * @return std::nullopt when every token is known and the set is non-empty
     */
    [[nodiscard]] static std::optional<std::string> ValidatePermissions(const AgentPermissions& permissions);

private:
    PermissionPolicy() = delete;
};

} // namespace veil::transfer::agents
