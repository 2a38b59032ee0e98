#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/configuration/cashout_config.hpp"
#include "veil/interfaces/i_cashout_rails.hpp"
#include "veil/interfaces/i_cashout_state_store.hpp"
#include "veil/interfaces/i_compliance_provider.hpp"
#include "veil/interfaces/i_transfer_event_handler.hpp"
#include "veil/cashout/cashout_types.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace veil::transfer::cashout {

/**
 * @brief Resumable, single-flight cashout state machine per user
 *
 * Start() drives the path's phases on the calling thread until the run
 * reaches awaiting_settlement, error or cancelled. Each phase begins only
 * after the previous phase's external call returned successfully, and every
 * transition is persisted before the next external call.
 *
 * External-call failures never escape as Err from Start/Retry: they move the
 * run to error with failed_at_phase and the reason. Err is returned only for
 * requests the pipeline refuses (invalid input, busy, wrong state).
 *
 * Cancellation is cooperative. Cancel() flags the run, wakes the jitter wait
 * and takes effect at the next phase boundary; it never aborts an in-flight
 * external call.
 */
class CashoutPipeline {
public:
    using StateObserver = std::function<void(const CashoutState&)>;
    // Returns a delay in [0, max_ms].
    using JitterSource = std::function<uint64_t(uint64_t max_ms)>;

    CashoutPipeline(
        configuration::CashoutConfig config,
        std::shared_ptr<interfaces::ICashoutRails> rails,
        std::shared_ptr<interfaces::IComplianceProvider> compliance,
        std::shared_ptr<interfaces::ICashoutStateStore> store,
        JitterSource jitter_source = {});

    CashoutPipeline(const CashoutPipeline&) = delete;
    CashoutPipeline& operator=(const CashoutPipeline&) = delete;

    /**
     * @return final state of this run; PipelineBusy if the user already has
     *         an active run
     */
    Result<CashoutState, TransferFailure> Start(const CashoutRequest& request);

    /**
     * @brief Re-enter the failed phase of an errored run
     */
    Result<CashoutState, TransferFailure> Retry(std::string_view user_id);

    Result<CashoutState, TransferFailure> Cancel(std::string_view user_id);

    /**
     * @brief awaiting_settlement -> completed, called when the payout settles
     */
    Result<CashoutState, TransferFailure> MarkComplete(
        std::string_view user_id,
        std::optional<std::string> payout_ref = std::nullopt);

    /**
     * @brief Forget a run that is idle, completed, cancelled or errored
     */
    Result<Unit, TransferFailure> Reset(std::string_view user_id);

    /**
     * @brief Load a persisted run after a restart
     *
     * A run persisted in a working phase other than awaiting_settlement was
     * interrupted mid-flight; it is turned into error at that phase so the
     * caller can retry or cancel.
     */
    Result<std::optional<CashoutState>, TransferFailure> RecoverInterrupted(std::string_view user_id);

    /**
     * @brief Current run for the user, loading persisted state on first access
     *
     * Returns nullopt when there is no run or the state store cannot be read.
     */
    [[nodiscard]] std::optional<CashoutState> GetState(std::string_view user_id);

    [[nodiscard]] bool CanRetry(std::string_view user_id);
    [[nodiscard]] bool CanCancel(std::string_view user_id);
    [[nodiscard]] bool IsActive(std::string_view user_id);

    [[nodiscard]] CashoutProgress GetProgress(std::string_view user_id);

    /**
     * @brief Called with a snapshot after every phase transition
     */
    void SetStateObserver(StateObserver observer);

    void SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler);

    [[nodiscard]] static bool IsRetryable(const CashoutState& state) noexcept;

private:
    struct Session {
        std::mutex lock;
        std::condition_variable wake;
        std::optional<CashoutState> state;
        bool running = false;
        bool cancel_requested = false;
    };

    using SessionPtr = std::shared_ptr<Session>;

    SessionPtr GetOrCreateSession(std::string_view user_id);
    Result<SessionPtr, TransferFailure> ResolveSession(std::string_view user_id);

    CashoutState Drive(const SessionPtr& session, size_t start_index);
    Result<Unit, TransferFailure> ExecutePhase(CashoutPhase phase, CashoutState& working);
    void RunJitter(const SessionPtr& session);

    void EnterPhaseLocked(Session& session, CashoutPhase phase);
    void FailLocked(Session& session, CashoutPhase phase, const TransferFailure& failure);
    void CancelLocked(Session& session);
    Result<Unit, TransferFailure> Persist(const CashoutState& state) const;
    Result<Unit, TransferFailure> LoadPersistedLocked(Session& session, std::string_view user_id);

    void Publish(const CashoutState& snapshot) const;

    configuration::CashoutConfig config_;
    std::shared_ptr<interfaces::ICashoutRails> rails_;
    std::shared_ptr<interfaces::IComplianceProvider> compliance_;
    std::shared_ptr<interfaces::ICashoutStateStore> store_;
    JitterSource jitter_source_;

    mutable std::mutex sessions_lock_;
    std::unordered_map<std::string, SessionPtr> sessions_;

    mutable std::mutex observer_lock_;
    StateObserver observer_;
    std::shared_ptr<interfaces::ITransferEventHandler> event_handler_;
};

} // namespace veil::transfer::cashout
