#pragma once
#include "veil/core/clock.hpp"
#include "veil/agents/agent_types.hpp"
#include <optional>
#include <string>
#include <string_view>
namespace veil::transfer::interfaces {
enum class AuthorizationVerdict {
    Granted,
    Denied,
    // The path cannot decide (backend down, no session); the next strategy is tried.
    Unavailable
};
struct AuthorizationRequest {
    const agents::AgentRecord& record;
    const agents::StoredAgentRecord& stored;
    const agents::AgentOperation& operation;
    Timestamp now;
};
struct AuthorizationOutcome {
    AuthorizationVerdict verdict = AuthorizationVerdict::Unavailable;
    std::string strategy;
    std::string reason;
    // Set when the strategy produced a proof that should replace the cached one.
    std::optional<agents::CachedProof> refreshed_proof;
};
class IAuthorizationStrategy {
public:
    virtual ~IAuthorizationStrategy() = default;
    [[nodiscard]] virtual std::string_view Name() const = 0;
    virtual AuthorizationOutcome Authorize(const AuthorizationRequest& request) = 0;
};
}
