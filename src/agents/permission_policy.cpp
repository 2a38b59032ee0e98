#include "veil/agents/permission_policy.hpp"
#include "veil/core/format.hpp"

#include <algorithm>

namespace veil::transfer::agents {

namespace {
    template<typename Container, typename Value>
    bool Contains(const Container& container, const Value& value) {
        return std::find(container.begin(), container.end(), value) != container.end();
    }

    uint32_t UtcHour(const Timestamp now) {
        const auto since_epoch = std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch());
        return static_cast<uint32_t>(since_epoch.count() % 24);
    }
}

std::optional<std::string> PermissionPolicy::Evaluate(
    const AgentPermissions& permissions,
    const AgentOperation& operation,
    const Timestamp now) {
    if (!permissions.Allows(operation.type)) {
        return compat::format("Operation {} is not permitted for this agent", operation.type);
    }

    if (permissions.wallet_scoping.has_value()) {
        const auto& scoping = *permissions.wallet_scoping;
        if (operation.amount.has_value() && scoping.max_transaction_amount.has_value() &&
            *operation.amount > *scoping.max_transaction_amount) {
            return compat::format("Amount {} exceeds the per-transaction limit of {}",
                                  *operation.amount, *scoping.max_transaction_amount);
        }
        if (operation.target.has_value() && !scoping.allowed_addresses.empty() &&
            !Contains(scoping.allowed_addresses, *operation.target)) {
            return std::string("Target address is outside the agent's wallet scope");
        }
    }

    if (permissions.activity_restrictions.has_value() && operation.mcc_code.has_value()) {
        const auto& codes = permissions.activity_restrictions->allowed_mcc_codes;
        if (!codes.empty() && !Contains(codes, *operation.mcc_code)) {
            return compat::format("Merchant category {} is not allowed", *operation.mcc_code);
        }
    }

    if (permissions.time_restrictions.has_value()) {
        const auto& window = *permissions.time_restrictions;
        const int64_t now_ms = ToUnixMillis(now);
        if (window.valid_from_ms.has_value() && now_ms < *window.valid_from_ms) {
            return std::string("Agent permissions are not yet valid");
        }
        if (window.valid_until_ms.has_value() && now_ms >= *window.valid_until_ms) {
            return std::string("Agent permissions have expired");
        }
        if (!window.allowed_hours.empty() && !Contains(window.allowed_hours, UtcHour(now))) {
            return std::string("Operation is outside the agent's allowed hours");
        }
    }
    return std::nullopt;
}

std::optional<std::string> PermissionPolicy::ValidatePermissions(const AgentPermissions& permissions) {
    if (permissions.allowed.empty()) {
        return std::string("At least one permission must be granted");
    }
    for (const auto& token : permissions.allowed) {
        if (!permission::IsKnown(token)) {
            return compat::format("Unknown permission token: {}", token);
        }
    }
    if (permissions.time_restrictions.has_value()) {
        const auto& window = *permissions.time_restrictions;
        for (const uint32_t hour : window.allowed_hours) {
            if (hour > 23) {
                return compat::format("Allowed hour {} is out of range", hour);
            }
        }
        if (window.valid_from_ms.has_value() && window.valid_until_ms.has_value() &&
            *window.valid_from_ms >= *window.valid_until_ms) {
            return std::string("Permission window ends before it starts");
        }
    }
    return std::nullopt;
}

} // namespace veil::transfer::agents
