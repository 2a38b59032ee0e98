#include "veil/cashout/cashout_pipeline.hpp"
#include "veil/cashout/cashout_state_codec.hpp"
#include "veil/cashout/phase_table.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/constants.hpp"
#include "veil/core/format.hpp"

#include <algorithm>
#include <chrono>

namespace veil::transfer::cashout {

using StateResult = Result<CashoutState, TransferFailure>;
using UnitResult = Result<Unit, TransferFailure>;

namespace {
    std::string GeneratePipelineId() {
        return std::string(kPipelineIdPrefix) +
               crypto::Encoding::ToHex(crypto::SodiumInterop::GetRandomBytes(kPipelineIdRandomBytes));
    }

    TransferFailure PhaseFailure(const CashoutPhase phase, const TransferFailure& cause) {
        return TransferFailure{
            cause.type,
            compat::format("{} failed: {}", PhaseTable::Label(phase), cause.message)
        };
    }

    TransferFailure MissingArtifact(const CashoutPhase phase, const char* artifact) {
        return TransferFailure::InvalidState(
            compat::format("{} requires {} from an earlier phase", PhaseTable::Name(phase), artifact));
    }

    bool IsTerminalFailure(const CashoutState& state) {
        if (state.failed_at_phase == CashoutPhase::CompliancePrescreen &&
            state.compliance.has_value() && state.compliance->is_terminal) {
            return true;
        }
        return state.error.has_value() &&
               state.error->find(CashoutConstants::QUARANTINE_MARKER) != std::string::npos;
    }
}

CashoutPipeline::CashoutPipeline(
    configuration::CashoutConfig config,
    std::shared_ptr<interfaces::ICashoutRails> rails,
    std::shared_ptr<interfaces::IComplianceProvider> compliance,
    std::shared_ptr<interfaces::ICashoutStateStore> store,
    JitterSource jitter_source)
    : config_(std::move(config))
    , rails_(std::move(rails))
    , compliance_(std::move(compliance))
    , store_(std::move(store))
    , jitter_source_(std::move(jitter_source)) {
    if (!jitter_source_) {
        jitter_source_ = [](const uint64_t max_ms) -> uint64_t {
            return crypto::SodiumInterop::RandomUniform(static_cast<uint32_t>(max_ms + 1));
        };
    }
}

// ============================================================================
// Public operations
// ============================================================================

StateResult CashoutPipeline::Start(const CashoutRequest& request) {
    if (request.user_id.empty()) {
        return StateResult::Err(TransferFailure::InvalidInput("User id is required"));
    }
    if (request.wallet_address.empty()) {
        return StateResult::Err(TransferFailure::InvalidInput("Wallet address is required"));
    }
    if (request.asset.mint.empty()) {
        return StateResult::Err(TransferFailure::InvalidInput("Asset mint is required"));
    }
    if (request.amount_base_units == 0) {
        return StateResult::Err(TransferFailure::InvalidInput("Cashout amount must be greater than zero"));
    }

    const SessionPtr session = GetOrCreateSession(request.user_id);
    {
        std::lock_guard guard(session->lock);
        if (!session->state.has_value()) {
            if (auto loaded = LoadPersistedLocked(*session, request.user_id); loaded.IsErr()) {
                return StateResult::Err(loaded.UnwrapErr());
            }
        }
        if (session->running ||
            (session->state.has_value() && PhaseTable::IsActive(session->state->phase))) {
            return StateResult::Err(TransferFailure::PipelineBusy(
                "A cashout is already in progress for this user"));
        }

        const Timestamp now = Now();
        CashoutState state;
        state.pipeline_id = GeneratePipelineId();
        state.user_id = request.user_id;
        state.wallet_address = request.wallet_address;
        state.path = PhaseTable::DetectPath(request.asset, config_.settlement_mint);
        state.asset = request.asset;
        state.amount_base_units = request.amount_base_units;
        state.amount_usd_cents = request.amount_usd_cents;
        state.fiat_currency = request.fiat_currency.empty()
            ? std::string(CashoutConstants::DEFAULT_FIAT_CURRENCY)
            : request.fiat_currency;
        state.created_at = now;
        state.updated_at = now;

        VEIL_LOG_INFO("cashout", "Starting {} for {} on path {}", state.pipeline_id,
                      debug::Redact(state.user_id), PhaseTable::PathName(state.path));

        session->state = std::move(state);
        session->running = true;
        session->cancel_requested = false;
    }
    return StateResult::Ok(Drive(session, 0));
}

StateResult CashoutPipeline::Retry(const std::string_view user_id) {
    const SessionPtr session = GetOrCreateSession(user_id);
    size_t resume_index = 0;
    {
        std::lock_guard guard(session->lock);
        if (!session->state.has_value()) {
            if (auto loaded = LoadPersistedLocked(*session, user_id); loaded.IsErr()) {
                return StateResult::Err(loaded.UnwrapErr());
            }
        }
        if (!session->state.has_value()) {
            return StateResult::Err(TransferFailure::NotFound("No cashout to retry"));
        }
        if (session->running) {
            return StateResult::Err(TransferFailure::PipelineBusy("Cashout is still running"));
        }
        const CashoutState& state = *session->state;
        if (state.phase != CashoutPhase::Error || !state.failed_at_phase.has_value()) {
            return StateResult::Err(TransferFailure::InvalidState(
                compat::format("Only a failed cashout can be retried (phase is {})", PhaseTable::Name(state.phase))));
        }
        if (IsTerminalFailure(state)) {
            return StateResult::Err(TransferFailure::InvalidState(
                "This failure is terminal and cannot be retried; cancel the cashout"));
        }
        const CashoutPhase failed = *state.failed_at_phase;
        if (PhaseTable::RetryPolicyFor(failed) == RetryPolicy::RestartRequired) {
            return StateResult::Err(TransferFailure::InvalidState(
                compat::format("Phase {} cannot be retried in place; cancel and start a new cashout",
                               PhaseTable::Name(failed))));
        }
        const auto index = PhaseTable::IndexOf(state.path, failed);
        if (!index.has_value()) {
            return StateResult::Err(TransferFailure::InvalidState(
                compat::format("Phase {} is not part of path {}", PhaseTable::Name(failed),
                               PhaseTable::PathName(state.path))));
        }
        resume_index = *index;
        session->running = true;
        session->cancel_requested = false;
        VEIL_LOG_INFO("cashout", "Retrying {} from {}", state.pipeline_id, PhaseTable::Name(failed));
    }
    return StateResult::Ok(Drive(session, resume_index));
}

StateResult CashoutPipeline::Cancel(const std::string_view user_id) {
    const SessionPtr session = GetOrCreateSession(user_id);
    CashoutState snapshot;
    {
        std::unique_lock lock(session->lock);
        if (!session->state.has_value()) {
            if (auto loaded = LoadPersistedLocked(*session, user_id); loaded.IsErr()) {
                return StateResult::Err(loaded.UnwrapErr());
            }
        }
        if (!session->state.has_value()) {
            return StateResult::Err(TransferFailure::NotFound("No cashout to cancel"));
        }
        if (!PhaseTable::IsActive(session->state->phase)) {
            return StateResult::Err(TransferFailure::InvalidState(
                compat::format("Cannot cancel a cashout in phase {}", PhaseTable::Name(session->state->phase))));
        }

        if (session->running) {
            session->cancel_requested = true;
            session->wake.notify_all();
            session->wake.wait(lock, [&session] { return !session->running; });
            snapshot = *session->state;
        } else {
            CancelLocked(*session);
            snapshot = *session->state;
        }
    }
    Publish(snapshot);
    if (snapshot.phase != CashoutPhase::Cancelled) {
        return StateResult::Err(TransferFailure::InvalidState(
            compat::format("Cashout finished in phase {} before the cancel took effect",
                           PhaseTable::Name(snapshot.phase))));
    }
    return StateResult::Ok(std::move(snapshot));
}

StateResult CashoutPipeline::MarkComplete(const std::string_view user_id, std::optional<std::string> payout_ref) {
    auto resolved = ResolveSession(user_id);
    if (resolved.IsErr()) {
        return StateResult::Err(resolved.UnwrapErr());
    }
    const SessionPtr session = resolved.Unwrap();
    CashoutState next;
    {
        std::lock_guard guard(session->lock);
        if (!session->state.has_value()) {
            return StateResult::Err(TransferFailure::NotFound("No cashout to complete"));
        }
        if (session->state->phase != CashoutPhase::AwaitingSettlement) {
            return StateResult::Err(TransferFailure::InvalidState(
                "Only a cashout awaiting settlement can be completed"));
        }
        next = *session->state;
        const Timestamp now = Now();
        next.phase = CashoutPhase::Completed;
        next.completed_at = now;
        next.updated_at = now;
        if (payout_ref.has_value()) {
            next.payout_ref = std::move(payout_ref);
        }
        if (auto persisted = Persist(next); persisted.IsErr()) {
            return StateResult::Err(persisted.UnwrapErr());
        }
        session->state = next;
    }
    Publish(next);
    return StateResult::Ok(std::move(next));
}

UnitResult CashoutPipeline::Reset(const std::string_view user_id) {
    auto resolved = ResolveSession(user_id);
    if (resolved.IsErr()) {
        return UnitResult::Err(resolved.UnwrapErr());
    }
    {
        const SessionPtr session = resolved.Unwrap();
        std::lock_guard guard(session->lock);
        if (session->running ||
            (session->state.has_value() && PhaseTable::IsWorking(session->state->phase))) {
            return UnitResult::Err(TransferFailure::PipelineBusy(
                "Cancel the active cashout before resetting"));
        }
        session->state.reset();
    }
    if (store_) {
        if (auto removed = store_->Remove(user_id); removed.IsErr()) {
            return UnitResult::Err(TransferFailure::StorageFailure(
                compat::format("Failed to remove cashout state: {}", removed.UnwrapErr().message)));
        }
    }
    return UnitResult::Ok(unit);
}

Result<std::optional<CashoutState>, TransferFailure> CashoutPipeline::RecoverInterrupted(const std::string_view user_id) {
    using RecoverResult = Result<std::optional<CashoutState>, TransferFailure>;
    const SessionPtr session = GetOrCreateSession(user_id);
    std::lock_guard guard(session->lock);
    if (session->running) {
        return RecoverResult::Err(TransferFailure::PipelineBusy("Cashout is still running"));
    }
    if (!session->state.has_value()) {
        if (auto loaded = LoadPersistedLocked(*session, user_id); loaded.IsErr()) {
            return RecoverResult::Err(loaded.UnwrapErr());
        }
    }
    return RecoverResult::Ok(session->state);
}

std::optional<CashoutState> CashoutPipeline::GetState(const std::string_view user_id) {
    auto resolved = ResolveSession(user_id);
    if (resolved.IsErr()) {
        VEIL_LOG_ERROR("cashout", "Cannot read cashout for {}: {}", debug::Redact(user_id),
                       resolved.UnwrapErr().message);
        return std::nullopt;
    }
    const SessionPtr session = resolved.Unwrap();
    std::lock_guard guard(session->lock);
    return session->state;
}

bool CashoutPipeline::CanRetry(const std::string_view user_id) {
    const auto state = GetState(user_id);
    return state.has_value() && IsRetryable(*state);
}

bool CashoutPipeline::CanCancel(const std::string_view user_id) {
    const auto state = GetState(user_id);
    return state.has_value() && PhaseTable::IsActive(state->phase);
}

bool CashoutPipeline::IsActive(const std::string_view user_id) {
    return CanCancel(user_id);
}

CashoutProgress CashoutPipeline::GetProgress(const std::string_view user_id) {
    const auto state = GetState(user_id);
    if (!state.has_value()) {
        return CashoutProgress{.percent = 0.0, .estimated_time_remaining = {},
                               .label = std::string(PhaseTable::Label(CashoutPhase::Idle))};
    }
    return CashoutProgress{
        .percent = PhaseTable::ProgressPercent(*state),
        .estimated_time_remaining = PhaseTable::EstimatedTimeRemaining(*state, config_.settlement_eta),
        .label = std::string(PhaseTable::Label(state->phase))
    };
}

void CashoutPipeline::SetStateObserver(StateObserver observer) {
    std::lock_guard guard(observer_lock_);
    observer_ = std::move(observer);
}

void CashoutPipeline::SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler) {
    std::lock_guard guard(observer_lock_);
    event_handler_ = std::move(handler);
}

bool CashoutPipeline::IsRetryable(const CashoutState& state) noexcept {
    if (state.phase != CashoutPhase::Error || !state.failed_at_phase.has_value()) {
        return false;
    }
    if (IsTerminalFailure(state)) {
        return false;
    }
    return PhaseTable::RetryPolicyFor(*state.failed_at_phase) == RetryPolicy::RetryInPlace &&
           PhaseTable::IndexOf(state.path, *state.failed_at_phase).has_value();
}

// ============================================================================
// Driver
// ============================================================================

CashoutState CashoutPipeline::Drive(const SessionPtr& session, const size_t start_index) {
    CashoutPath path;
    {
        std::lock_guard guard(session->lock);
        path = session->state->path;
    }
    const auto sequence = PhaseTable::Sequence(path);

    for (size_t index = start_index; index < sequence.size(); ++index) {
        const CashoutPhase phase = sequence[index];
        CashoutState working;
        {
            std::lock_guard guard(session->lock);
            if (session->cancel_requested) {
                break;
            }
            EnterPhaseLocked(*session, phase);
            working = *session->state;
        }
        Publish(working);
        if (working.phase == CashoutPhase::Error || phase == CashoutPhase::AwaitingSettlement) {
            break;
        }

        if (phase == CashoutPhase::SwapComplete) {
            RunJitter(session);
            continue;
        }

        auto executed = ExecutePhase(phase, working);

        std::lock_guard guard(session->lock);
        if (executed.IsErr()) {
            session->state->compliance = working.compliance;
            FailLocked(*session, phase, executed.UnwrapErr());
            break;
        }
        working.updated_at = Now();
        if (auto persisted = Persist(working); persisted.IsErr()) {
            FailLocked(*session, phase, persisted.UnwrapErr());
            break;
        }
        session->state = std::move(working);
    }

    CashoutState final_state;
    {
        std::lock_guard guard(session->lock);
        if (session->cancel_requested && PhaseTable::IsActive(session->state->phase)) {
            CancelLocked(*session);
        }
        session->running = false;
        session->cancel_requested = false;
        final_state = *session->state;
    }
    session->wake.notify_all();
    Publish(final_state);
    return final_state;
}

UnitResult CashoutPipeline::ExecutePhase(const CashoutPhase phase, CashoutState& working) {
    const std::string& mint = config_.settlement_mint;

    auto run = [&](const PhaseRequest& request) -> Result<PhaseReceipt, TransferFailure> {
        auto receipt = rails_->Execute(request);
        if (receipt.IsErr()) {
            return Result<PhaseReceipt, TransferFailure>::Err(PhaseFailure(phase, receipt.UnwrapErr()));
        }
        return receipt;
    };

    switch (phase) {
        case CashoutPhase::CompliancePrescreen: {
            auto checked = compliance_->CheckCompliance(interfaces::ComplianceCheck{
                .sender = working.wallet_address,
                .recipient = std::nullopt,
                .amount_usd_cents = working.amount_usd_cents
            });
            if (checked.IsErr()) {
                return UnitResult::Err(PhaseFailure(phase, checked.UnwrapErr()));
            }
            working.compliance = checked.Unwrap();
            if (!working.compliance->passed) {
                return UnitResult::Err(TransferFailure::ComplianceRejected(
                    working.compliance->reason.value_or("Compliance check failed")));
            }
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::CreatingSwapAddress: {
            auto receipt = run(CreateAddressParams{.purpose = AddressPurpose::SwapOutput});
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.swap_output_address = receipt.Unwrap().reference;
            working.swap_session_key_id = receipt.Unwrap().session_key_id;
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::Swapping: {
            if (!working.swap_output_address.has_value()) {
                return UnitResult::Err(MissingArtifact(phase, "a swap output address"));
            }
            auto receipt = run(SwapParams{
                .input_mint = working.asset.mint,
                .output_mint = mint,
                .amount = working.amount_base_units,
                .source_address = working.wallet_address,
                .output_address = *working.swap_output_address
            });
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.swap_tx_signature = receipt.Unwrap().reference;
            if (receipt.Unwrap().amount_out.has_value()) {
                working.settlement_amount = receipt.Unwrap().amount_out;
            }
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::Shielding: {
            std::string source = working.wallet_address;
            if (working.path == CashoutPath::XstockFull) {
                if (!working.swap_output_address.has_value()) {
                    return UnitResult::Err(MissingArtifact(phase, "a swap output address"));
                }
                source = *working.swap_output_address;
            }
            auto receipt = run(ShieldParams{
                .source_address = std::move(source),
                .mint = mint,
                .amount = working.SettlementAmount()
            });
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.shield_tx_signature = receipt.Unwrap().reference;
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::CreatingCashoutAddress: {
            auto receipt = run(CreateAddressParams{.purpose = AddressPurpose::Cashout});
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.cashout_address = receipt.Unwrap().reference;
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::Unshielding: {
            if (!working.cashout_address.has_value()) {
                return UnitResult::Err(MissingArtifact(phase, "a cashout address"));
            }
            auto receipt = run(UnshieldParams{
                .destination_address = *working.cashout_address,
                .mint = mint,
                .amount = working.SettlementAmount()
            });
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.unshield_tx_signature = receipt.Unwrap().reference;
            return UnitResult::Ok(unit);
        }
        case CashoutPhase::SendingToPayoutProvider: {
            if (!working.cashout_address.has_value()) {
                return UnitResult::Err(MissingArtifact(phase, "a cashout address"));
            }
            auto receipt = run(PayoutParams{
                .source_address = *working.cashout_address,
                .mint = mint,
                .amount = working.SettlementAmount(),
                .fiat_currency = working.fiat_currency
            });
            if (receipt.IsErr()) {
                return UnitResult::Err(receipt.UnwrapErr());
            }
            working.payout_ref = receipt.Unwrap().reference;
            return UnitResult::Ok(unit);
        }
        default:
            return UnitResult::Ok(unit);
    }
}

void CashoutPipeline::RunJitter(const SessionPtr& session) {
    const auto max_ms = static_cast<uint64_t>(std::max<int64_t>(config_.max_jitter.count(), 0));
    const uint64_t delay_ms = max_ms == 0 ? 0 : std::min(jitter_source_(max_ms), max_ms);
    const auto tick = std::max(config_.jitter_tick, std::chrono::milliseconds(1));

    std::unique_lock lock(session->lock);
    session->state->jitter_delay_ms = delay_ms;
    session->state->jitter_remaining_ms = delay_ms;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    while (!session->cancel_requested) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        session->state->jitter_remaining_ms = static_cast<uint64_t>(remaining.count());
        session->wake.wait_for(lock, std::min(remaining, tick),
                               [&session] { return session->cancel_requested; });
    }
    if (!session->cancel_requested) {
        session->state->jitter_remaining_ms = 0;
    }
}

// ============================================================================
// State transitions (caller holds session.lock)
// ============================================================================

void CashoutPipeline::EnterPhaseLocked(Session& session, const CashoutPhase phase) {
    CashoutState next = *session.state;
    next.phase = phase;
    next.failed_at_phase.reset();
    next.error.reset();
    next.updated_at = Now();
    if (auto persisted = Persist(next); persisted.IsErr()) {
        FailLocked(session, phase, persisted.UnwrapErr());
        return;
    }
    session.state = std::move(next);
    VEIL_LOG_DEBUG("cashout", "{} entered {}", session.state->pipeline_id, PhaseTable::Name(phase));
}

void CashoutPipeline::FailLocked(Session& session, const CashoutPhase phase, const TransferFailure& failure) {
    CashoutState& state = *session.state;
    state.phase = CashoutPhase::Error;
    state.failed_at_phase = phase;
    state.error = failure.message;
    state.updated_at = Now();
    VEIL_LOG_WARN("cashout", "{} failed at {}: {}", state.pipeline_id, PhaseTable::Name(phase), failure.message);
    if (auto persisted = Persist(state); persisted.IsErr()) {
        state.error = compat::format("{} (state not persisted: {})", failure.message, persisted.UnwrapErr().message);
    }
}

void CashoutPipeline::CancelLocked(Session& session) {
    CashoutState& state = *session.state;
    std::vector<std::string> release_failures;
    for (const auto* address : {&state.swap_output_address, &state.cashout_address}) {
        if (!address->has_value()) {
            continue;
        }
        if (auto released = rails_->ReleaseAddress(**address); released.IsErr()) {
            release_failures.push_back(released.UnwrapErr().message);
        }
    }

    state.phase = CashoutPhase::Cancelled;
    state.jitter_remaining_ms.reset();
    state.updated_at = Now();
    if (!release_failures.empty()) {
        state.error = compat::format("Failed to release reserved address: {}", release_failures.front());
    }
    VEIL_LOG_INFO("cashout", "{} cancelled", state.pipeline_id);
    if (auto persisted = Persist(state); persisted.IsErr()) {
        state.error = compat::format("Cancelled; state not persisted: {}", persisted.UnwrapErr().message);
    }
}

UnitResult CashoutPipeline::Persist(const CashoutState& state) const {
    if (!store_) {
        return UnitResult::Ok(unit);
    }
    auto serialized = CashoutStateCodec::Serialize(state);
    if (serialized.IsErr()) {
        return UnitResult::Err(serialized.UnwrapErr());
    }
    if (auto saved = store_->Save(state.user_id, serialized.Unwrap()); saved.IsErr()) {
        return UnitResult::Err(TransferFailure::StorageFailure(
            compat::format("Failed to persist cashout state: {}", saved.UnwrapErr().message)));
    }
    return UnitResult::Ok(unit);
}

UnitResult CashoutPipeline::LoadPersistedLocked(Session& session, const std::string_view user_id) {
    if (!store_) {
        return UnitResult::Ok(unit);
    }
    auto loaded = store_->Load(user_id);
    if (loaded.IsErr()) {
        return UnitResult::Err(TransferFailure::StorageFailure(
            compat::format("Failed to load cashout state: {}", loaded.UnwrapErr().message)));
    }
    if (!loaded.Unwrap().has_value()) {
        return UnitResult::Ok(unit);
    }
    auto parsed = CashoutStateCodec::Parse(*loaded.Unwrap());
    if (parsed.IsErr()) {
        return UnitResult::Err(parsed.UnwrapErr());
    }
    CashoutState state = std::move(parsed).Unwrap();

    if (PhaseTable::IsWorking(state.phase) && state.phase != CashoutPhase::AwaitingSettlement) {
        VEIL_LOG_WARN("cashout", "Recovered interrupted {} at {}", state.pipeline_id, PhaseTable::Name(state.phase));
        state.failed_at_phase = state.phase;
        state.phase = CashoutPhase::Error;
        state.error = std::string(ErrorMessages::PIPELINE_INTERRUPTED);
        state.jitter_remaining_ms.reset();
        state.updated_at = Now();
        if (auto persisted = Persist(state); persisted.IsErr()) {
            return UnitResult::Err(persisted.UnwrapErr());
        }
    }
    session.state = std::move(state);
    return UnitResult::Ok(unit);
}

// ============================================================================
// Sessions and notifications
// ============================================================================


CashoutPipeline::SessionPtr CashoutPipeline::GetOrCreateSession(const std::string_view user_id) {
    std::lock_guard guard(sessions_lock_);
    auto [it, inserted] = sessions_.try_emplace(std::string(user_id));
    if (inserted) {
        it->second = std::make_shared<Session>();
    }
    return it->second;
}

Result<CashoutPipeline::SessionPtr, TransferFailure> CashoutPipeline::ResolveSession(const std::string_view user_id) {
    SessionPtr session = GetOrCreateSession(user_id);
    std::lock_guard guard(session->lock);
    if (!session->state.has_value() && !session->running) {
        if (auto loaded = LoadPersistedLocked(*session, user_id); loaded.IsErr()) {
            return Result<SessionPtr, TransferFailure>::Err(loaded.UnwrapErr());
        }
    }
    return Result<SessionPtr, TransferFailure>::Ok(std::move(session));
}

void CashoutPipeline::Publish(const CashoutState& snapshot) const {
    StateObserver observer;
    std::shared_ptr<interfaces::ITransferEventHandler> handler;
    {
        std::lock_guard guard(observer_lock_);
        observer = observer_;
        handler = event_handler_;
    }
    if (observer) {
        observer(snapshot);
    }
    if (handler) {
        handler->OnCashoutPhaseChanged(snapshot.user_id, std::string(PhaseTable::Name(snapshot.phase)));
    }
}

} // namespace veil::transfer::cashout
