#include "veil/agents/agent_commitment.hpp"
#include "veil/crypto/commitment.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/core/constants.hpp"

#include <algorithm>
#include <vector>

namespace veil::transfer::agents {

using crypto::Commitment;
using crypto::CommitmentFields;
using crypto::Encoding;

namespace {
    // Absent optionals encode as an empty field so that "no limit" and a
    // limit of zero never collide.
    void AddOptionalNumber(CommitmentFields& fields, const std::optional<uint64_t>& value) {
        if (value.has_value()) {
            fields.Ordered("some").Number(*value);
        } else {
            fields.Ordered("none");
        }
    }

    void AddOptionalTime(CommitmentFields& fields, const std::optional<int64_t>& value) {
        AddOptionalNumber(fields, value.has_value()
            ? std::optional<uint64_t>(static_cast<uint64_t>(*value))
            : std::nullopt);
    }

    CommitmentFields BuildCommitmentFields(const AgentCommitmentInputs& inputs) {
        CommitmentFields fields;
        fields.Ordered(inputs.agent_pubkey)
              .Ordered(inputs.wallet_pubkey)
              .Ordered(inputs.permissions_hash)
              .Ordered(inputs.nonce);
        return fields;
    }
}

std::string AgentCommitment::ComputePermissionsHash(const AgentPermissions& permissions) {
    CommitmentFields fields;
    fields.Unordered(permissions.allowed);

    if (permissions.wallet_scoping.has_value()) {
        const auto& scoping = *permissions.wallet_scoping;
        fields.Ordered("wallet_scoping").Unordered(scoping.allowed_addresses);
        AddOptionalNumber(fields, scoping.max_transaction_amount);
        AddOptionalNumber(fields, scoping.daily_limit);
        AddOptionalNumber(fields, scoping.monthly_limit);
    } else {
        fields.Ordered("");
    }

    if (permissions.activity_restrictions.has_value()) {
        fields.Ordered("activity_restrictions")
              .Unordered(permissions.activity_restrictions->allowed_mcc_codes);
    } else {
        fields.Ordered("");
    }

    if (permissions.time_restrictions.has_value()) {
        const auto& window = *permissions.time_restrictions;
        fields.Ordered("time_restrictions");
        AddOptionalTime(fields, window.valid_from_ms);
        AddOptionalTime(fields, window.valid_until_ms);
        std::vector<uint32_t> hours = window.allowed_hours;
        std::sort(hours.begin(), hours.end());
        hours.erase(std::unique(hours.begin(), hours.end()), hours.end());
        fields.Number(hours.size());
        for (const uint32_t hour : hours) {
            fields.Number(hour);
        }
    } else {
        fields.Ordered("");
    }

    const auto digest = Commitment::HashCommitment(kPermissionsDomain, fields);
    return Encoding::ToHex(digest);
}

std::string AgentCommitment::ComputeAgentCommitment(const AgentCommitmentInputs& inputs) {
    const auto digest = Commitment::HashCommitment(kAgentCommitmentDomain, BuildCommitmentFields(inputs));
    return Encoding::ToPrefixedHex(digest);
}

Result<bool, TransferFailure> AgentCommitment::VerifyAgentCommitment(
    const std::string_view commitment,
    const AgentCommitmentInputs& inputs) {
    auto decoded = Encoding::FromHex(commitment);
    if (decoded.IsErr()) {
        return Result<bool, TransferFailure>::Err(decoded.UnwrapErr());
    }
    const std::vector<uint8_t> bytes = std::move(decoded).Unwrap();
    if (bytes.size() != kHash256Bytes) {
        return Result<bool, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                "Commitment must be " + std::to_string(kHash256Bytes) + " bytes, got " +
                std::to_string(bytes.size())));
    }
    return Commitment::VerifyCommitment(bytes, kAgentCommitmentDomain, BuildCommitmentFields(inputs));
}

std::string AgentCommitment::GenerateAgentNonce() {
    const auto nonce = Commitment::GenerateNonce();
    return Encoding::ToPrefixedHex(nonce);
}

} // namespace veil::transfer::agents
