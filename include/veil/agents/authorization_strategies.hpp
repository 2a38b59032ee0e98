#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/interfaces/i_agent_proof_provider.hpp"
#include "veil/interfaces/i_authorization_strategy.hpp"
#include "veil/interfaces/i_delegated_signer.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

namespace veil::transfer::agents {

/**
 * @brief Cached-proof reuse and fresh proof generation
 */
class AgentProofs {
public:
    /**
     * @brief A cached proof is reusable for the same merkle root within its validity
     */
    [[nodiscard]] static bool IsReusable(
        const std::optional<CachedProof>& cached,
        std::string_view merkle_root,
        Timestamp now,
        std::chrono::milliseconds validity) noexcept;

    /**
     * Public inputs: agent pubkey, permissions hash, merkle root, commitment.
     */
    [[nodiscard]] static Result<CachedProof, TransferFailure> Generate(
        interfaces::IAgentProofProvider& provider,
        const AgentRecord& record,
        const StoredAgentRecord& stored,
        const std::string& merkle_root,
        Timestamp now);

private:
    AgentProofs() = delete;
};

/**
 * @brief Confidential-compute path: the delegated signer's policy decides
 */
class EnclaveAuthorizationStrategy final : public interfaces::IAuthorizationStrategy {
public:
    explicit EnclaveAuthorizationStrategy(std::shared_ptr<interfaces::IDelegatedSigner> signer);

    [[nodiscard]] std::string_view Name() const override { return "enclave"; }
    interfaces::AuthorizationOutcome Authorize(const interfaces::AuthorizationRequest& request) override;

private:
    std::shared_ptr<interfaces::IDelegatedSigner> signer_;
};

/**
 * @brief Zero-knowledge path: a proof over the agent commitment plus the local check
 */
class ProofAuthorizationStrategy final : public interfaces::IAuthorizationStrategy {
public:
    ProofAuthorizationStrategy(
        std::shared_ptr<interfaces::IAgentProofProvider> provider,
        std::chrono::milliseconds proof_validity);

    [[nodiscard]] std::string_view Name() const override { return "proof"; }
    interfaces::AuthorizationOutcome Authorize(const interfaces::AuthorizationRequest& request) override;

private:
    std::shared_ptr<interfaces::IAgentProofProvider> provider_;
    std::chrono::milliseconds proof_validity_;
};

/**
 * @brief Decides from the decrypted permissions alone; never Unavailable
 */
class PlaintextAuthorizationStrategy final : public interfaces::IAuthorizationStrategy {
public:
    [[nodiscard]] std::string_view Name() const override { return "plaintext"; }
    interfaces::AuthorizationOutcome Authorize(const interfaces::AuthorizationRequest& request) override;
};

/**
 * @brief Ordered fallback over authorization strategies
 *
 * The first Granted or Denied verdict is final. Unavailable moves on to the
 * next strategy; when every strategy is unavailable the operation is denied.
 */
class AuthorizationChain {
public:
    AuthorizationChain() = default;
    explicit AuthorizationChain(std::vector<std::shared_ptr<interfaces::IAuthorizationStrategy>> strategies);

    AuthorizationChain& Add(std::shared_ptr<interfaces::IAuthorizationStrategy> strategy);

    /**
     * @return Ok(granting outcome) or Err(AuthorizationDenied)
     */
    Result<interfaces::AuthorizationOutcome, TransferFailure> Authorize(
        const interfaces::AuthorizationRequest& request) const;

    [[nodiscard]] bool Empty() const noexcept { return strategies_.empty(); }
    [[nodiscard]] size_t Size() const noexcept { return strategies_.size(); }

private:
    std::vector<std::shared_ptr<interfaces::IAuthorizationStrategy>> strategies_;
};

} // namespace veil::transfer::agents
