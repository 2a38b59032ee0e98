#include <catch2/catch_test_macros.hpp>
#include "veil/cashout/cashout_pipeline.hpp"
#include "veil/cashout/cashout_state_codec.hpp"
#include "veil/cashout/phase_table.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "helpers/fake_cashout_rails.hpp"
#include "helpers/fake_nullifier_store.hpp"
#include <memory>
#include <mutex>
#include <vector>
using namespace veil::transfer;
using namespace veil::transfer::cashout;
using namespace veil::transfer::configuration;
using namespace veil::transfer::test_helpers;
namespace {
const std::string kSettlementMint(CashoutConstants::SETTLEMENT_MINT);
struct PipelineFixture {
    std::shared_ptr<FakeCashoutRails> rails = std::make_shared<FakeCashoutRails>();
    std::shared_ptr<FakeComplianceProvider> compliance = std::make_shared<FakeComplianceProvider>();
    std::shared_ptr<InMemoryCashoutStateStore> store = std::make_shared<InMemoryCashoutStateStore>();
    CashoutPipeline pipeline{CashoutConfig::WithoutJitter(), rails, compliance, store};
    std::mutex seen_lock;
    std::vector<CashoutPhase> seen;
    PipelineFixture() {
        REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
        pipeline.SetStateObserver([this](const CashoutState& state) {
            std::lock_guard guard(seen_lock);
            if (seen.empty() || seen.back() != state.phase) {
                seen.push_back(state.phase);
            }
        });
    }
};
CashoutRequest StockRequest(const std::string& user = "user-1") {
    return CashoutRequest{
        .user_id = user,
        .wallet_address = "wallet-" + user,
        .asset = CashoutAsset{.mint = "xTSLA", .symbol = "TSLAx", .decimals = 8, .is_shielded = false},
        .amount_base_units = 100'000'000,
        .amount_usd_cents = 25'000,
        .fiat_currency = ""
    };
}
CashoutRequest SettlementRequest(bool shielded, const std::string& user = "user-1") {
    return CashoutRequest{
        .user_id = user,
        .wallet_address = "wallet-" + user,
        .asset = CashoutAsset{.mint = kSettlementMint, .symbol = "USDC", .decimals = 6, .is_shielded = shielded},
        .amount_base_units = 50'000'000,
        .amount_usd_cents = 5'000,
        .fiat_currency = "EUR"
    };
}
template<typename T>
std::vector<T> RequestsOf(const FakeCashoutRails& rails) {
    std::vector<T> out;
    for (const auto& request : rails.Requests()) {
        if (const auto* typed = std::get_if<T>(&request)) {
            out.push_back(*typed);
        }
    }
    return out;
}
}
TEST_CASE("CashoutPipeline - Full path", "[cashout][pipeline]") {
    PipelineFixture f;
    f.rails->SetSwapOutput(24'900'000);
    auto result = f.pipeline.Start(StockRequest());
    REQUIRE(result.IsOk());
    const CashoutState& state = result.Unwrap();
    REQUIRE(state.phase == CashoutPhase::AwaitingSettlement);
    REQUIRE(state.path == CashoutPath::XstockFull);
    REQUIRE(state.fiat_currency == "USD");
    REQUIRE(state.pipeline_id.rfind("cashout_", 0) == 0);
    SECTION("Phases are entered in path order") {
        const auto sequence = PhaseTable::Sequence(CashoutPath::XstockFull);
        const std::vector<CashoutPhase> expected(sequence.begin(), sequence.end());
        REQUIRE(f.seen == expected);
    }
    SECTION("Rails are called once per working phase") {
        const std::vector<RailCall> expected{
            RailCall::CreateSwapAddress, RailCall::Swap, RailCall::Shield,
            RailCall::CreateCashoutAddress, RailCall::Unshield, RailCall::Payout};
        REQUIRE(f.rails->Calls() == expected);
        REQUIRE(f.compliance->CheckCount() == 1);
    }
    SECTION("Artifacts flow between phases") {
        const auto swaps = RequestsOf<SwapParams>(*f.rails);
        REQUIRE(swaps.size() == 1);
        REQUIRE(swaps[0].output_address == state.swap_output_address.value());
        REQUIRE(swaps[0].output_mint == kSettlementMint);
        const auto shields = RequestsOf<ShieldParams>(*f.rails);
        REQUIRE(shields[0].source_address == state.swap_output_address.value());
        REQUIRE(shields[0].amount == 24'900'000);
        const auto payouts = RequestsOf<PayoutParams>(*f.rails);
        REQUIRE(payouts[0].source_address == state.cashout_address.value());
        REQUIRE(payouts[0].fiat_currency == "USD");
        REQUIRE(state.swap_tx_signature.has_value());
        REQUIRE(state.shield_tx_signature.has_value());
        REQUIRE(state.unshield_tx_signature.has_value());
        REQUIRE(state.payout_ref.has_value());
        REQUIRE(state.jitter_delay_ms == 0u);
    }
    SECTION("Settlement completes the run") {
        REQUIRE(f.pipeline.GetProgress("user-1").estimated_time_remaining == std::string(CashoutConstants::SETTLEMENT_ETA));
        auto completed = f.pipeline.MarkComplete("user-1", std::string("payout-final"));
        REQUIRE(completed.IsOk());
        REQUIRE(completed.Unwrap().phase == CashoutPhase::Completed);
        REQUIRE(completed.Unwrap().payout_ref == "payout-final");
        REQUIRE(completed.Unwrap().completed_at.has_value());
        REQUIRE(f.pipeline.GetProgress("user-1").percent == 100.0);
        REQUIRE_FALSE(f.pipeline.IsActive("user-1"));
    }
    SECTION("Every transition is persisted") {
        REQUIRE(f.store->SaveCount() >= 2 * PhaseTable::Sequence(CashoutPath::XstockFull).size() - 2);
        auto row = f.store->Load("user-1").Unwrap();
        REQUIRE(row.has_value());
        REQUIRE(CashoutStateCodec::Parse(*row).Unwrap().phase == CashoutPhase::AwaitingSettlement);
    }
}
TEST_CASE("CashoutPipeline - Settlement asset paths", "[cashout][pipeline]") {
    PipelineFixture f;
    SECTION("Wallet path skips swap and shields from the wallet") {
        auto result = f.pipeline.Start(SettlementRequest(false));
        REQUIRE(result.Unwrap().path == CashoutPath::UsdcWallet);
        const std::vector<RailCall> expected{
            RailCall::Shield, RailCall::CreateCashoutAddress, RailCall::Unshield, RailCall::Payout};
        REQUIRE(f.rails->Calls() == expected);
        REQUIRE(RequestsOf<ShieldParams>(*f.rails)[0].source_address == "wallet-user-1");
        REQUIRE(RequestsOf<PayoutParams>(*f.rails)[0].fiat_currency == "EUR");
        REQUIRE(f.compliance->CheckCount() == 1);
    }
    SECTION("Pool path skips prescreen") {
        auto result = f.pipeline.Start(SettlementRequest(true));
        REQUIRE(result.Unwrap().path == CashoutPath::UsdcPool);
        REQUIRE(result.Unwrap().phase == CashoutPhase::AwaitingSettlement);
        REQUIRE(f.compliance->CheckCount() == 0);
        REQUIRE(f.rails->CountOf(RailCall::Shield) == 0);
        REQUIRE(RequestsOf<UnshieldParams>(*f.rails)[0].amount == 50'000'000);
    }
}
TEST_CASE("CashoutPipeline - Request validation", "[cashout][pipeline]") {
    PipelineFixture f;
    auto request = StockRequest();
    SECTION("Missing user") {
        request.user_id.clear();
    }
    SECTION("Missing wallet") {
        request.wallet_address.clear();
    }
    SECTION("Missing mint") {
        request.asset.mint.clear();
    }
    SECTION("Zero amount") {
        request.amount_base_units = 0;
    }
    auto result = f.pipeline.Start(request);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    REQUIRE(f.rails->Calls().empty());
}
TEST_CASE("CashoutPipeline - Single flight per user", "[cashout][pipeline]") {
    PipelineFixture f;
    REQUIRE(f.pipeline.Start(StockRequest()).IsOk());
    SECTION("Second start while awaiting settlement is busy") {
        auto again = f.pipeline.Start(StockRequest());
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == TransferFailureType::PipelineBusy);
    }
    SECTION("Other users are independent") {
        REQUIRE(f.pipeline.Start(StockRequest("user-2")).IsOk());
    }
    SECTION("Reset is refused while a phase is working") {
        auto reset = f.pipeline.Reset("user-1");
        REQUIRE(reset.IsErr());
        REQUIRE(reset.UnwrapErr().type == TransferFailureType::PipelineBusy);
    }
    SECTION("A completed run can be reset and started again") {
        REQUIRE(f.pipeline.MarkComplete("user-1").IsOk());
        REQUIRE(f.pipeline.Start(StockRequest()).IsOk());
        REQUIRE(f.pipeline.MarkComplete("user-1").IsOk());
        REQUIRE(f.pipeline.Reset("user-1").IsOk());
        REQUIRE_FALSE(f.pipeline.GetState("user-1").has_value());
        REQUIRE_FALSE(f.store->Contains("user-1"));
    }
}
TEST_CASE("CashoutPipeline - Retry in place", "[cashout][pipeline][retry]") {
    PipelineFixture f;
    f.rails->FailNext(RailCall::CreateSwapAddress, TransferFailure::ExternalCallFailed("wallet service 503"));
    auto failed = f.pipeline.Start(StockRequest());
    REQUIRE(failed.IsOk());
    REQUIRE(failed.Unwrap().phase == CashoutPhase::Error);
    REQUIRE(failed.Unwrap().failed_at_phase == CashoutPhase::CreatingSwapAddress);
    REQUIRE(failed.Unwrap().error == "Creating private address failed: wallet service 503");
    REQUIRE(f.pipeline.CanRetry("user-1"));
    REQUIRE(f.pipeline.CanCancel("user-1"));
    REQUIRE(f.pipeline.GetProgress("user-1").percent == 0.0);
    SECTION("Retry resumes at the failed phase") {
        auto retried = f.pipeline.Retry("user-1");
        REQUIRE(retried.IsOk());
        REQUIRE(retried.Unwrap().phase == CashoutPhase::AwaitingSettlement);
        REQUIRE_FALSE(retried.Unwrap().error.has_value());
        REQUIRE(f.compliance->CheckCount() == 1);
        REQUIRE(f.rails->CountOf(RailCall::CreateSwapAddress) == 2);
        REQUIRE(f.rails->CountOf(RailCall::Swap) == 1);
    }
    SECTION("Start is busy while the failed run exists") {
        REQUIRE(f.pipeline.Start(StockRequest()).UnwrapErr().type == TransferFailureType::PipelineBusy);
    }
    SECTION("Reset clears the failed run") {
        REQUIRE(f.pipeline.Reset("user-1").IsOk());
        REQUIRE(f.pipeline.Start(StockRequest()).IsOk());
    }
}
TEST_CASE("CashoutPipeline - Value-moving failures require a restart", "[cashout][pipeline][retry]") {
    PipelineFixture f;
    f.rails->FailNext(RailCall::Swap, TransferFailure::ExternalCallFailed("route expired"));
    auto failed = f.pipeline.Start(StockRequest());
    REQUIRE(failed.Unwrap().phase == CashoutPhase::Error);
    REQUIRE(failed.Unwrap().failed_at_phase == CashoutPhase::Swapping);
    REQUIRE_FALSE(f.pipeline.CanRetry("user-1"));
    auto retried = f.pipeline.Retry("user-1");
    REQUIRE(retried.IsErr());
    REQUIRE(retried.UnwrapErr().type == TransferFailureType::InvalidState);
    REQUIRE(f.rails->CountOf(RailCall::Swap) == 1);
    SECTION("Cancel releases the reserved address") {
        auto cancelled = f.pipeline.Cancel("user-1");
        REQUIRE(cancelled.IsOk());
        REQUIRE(cancelled.Unwrap().phase == CashoutPhase::Cancelled);
        REQUIRE(f.rails->Released() == std::vector<std::string>{failed.Unwrap().swap_output_address.value()});
        REQUIRE(f.pipeline.Start(StockRequest()).IsOk());
    }
    SECTION("Release failure is recorded on the cancelled run") {
        f.rails->FailRelease(true);
        auto cancelled = f.pipeline.Cancel("user-1");
        REQUIRE(cancelled.IsOk());
        REQUIRE(cancelled.Unwrap().error.value().find("release refused") != std::string::npos);
    }
}
TEST_CASE("CashoutPipeline - Payout failure is not retried", "[cashout][pipeline][retry]") {
    PipelineFixture f;
    f.rails->FailNext(RailCall::Payout, TransferFailure::ExternalCallFailed("kyc pending"));
    auto failed = f.pipeline.Start(SettlementRequest(true));
    REQUIRE(failed.Unwrap().failed_at_phase == CashoutPhase::SendingToPayoutProvider);
    REQUIRE(failed.Unwrap().error.value().rfind("Sending to payout provider failed:", 0) == 0);
    REQUIRE(f.pipeline.Retry("user-1").IsErr());
    REQUIRE(f.rails->CountOf(RailCall::Payout) == 1);
}
TEST_CASE("CashoutPipeline - Compliance", "[cashout][pipeline][compliance]") {
    PipelineFixture f;
    SECTION("Rejection stops before any rail call") {
        f.compliance->SetResult(ComplianceResult{.passed = false, .reason = "sanctioned counterparty", .is_terminal = false});
        auto result = f.pipeline.Start(StockRequest());
        REQUIRE(result.Unwrap().phase == CashoutPhase::Error);
        REQUIRE(result.Unwrap().failed_at_phase == CashoutPhase::CompliancePrescreen);
        REQUIRE(result.Unwrap().error == "sanctioned counterparty");
        REQUIRE(result.Unwrap().compliance.has_value());
        REQUIRE_FALSE(result.Unwrap().compliance->passed);
        REQUIRE(f.rails->Calls().empty());
        REQUIRE(f.pipeline.CanRetry("user-1"));
    }
    SECTION("Terminal rejection cannot be retried") {
        f.compliance->SetResult(ComplianceResult{.passed = false, .reason = "blocked", .is_terminal = true});
        REQUIRE(f.pipeline.Start(StockRequest()).Unwrap().phase == CashoutPhase::Error);
        REQUIRE_FALSE(f.pipeline.CanRetry("user-1"));
        REQUIRE(f.pipeline.Retry("user-1").UnwrapErr().type == TransferFailureType::InvalidState);
        REQUIRE(f.pipeline.Cancel("user-1").IsOk());
    }
    SECTION("Quarantined funds cannot be retried") {
        f.compliance->SetResult(ComplianceResult{.passed = false, .reason = "funds under quarantine", .is_terminal = false});
        REQUIRE(f.pipeline.Start(StockRequest()).Unwrap().phase == CashoutPhase::Error);
        REQUIRE_FALSE(f.pipeline.CanRetry("user-1"));
    }
    SECTION("Provider outage fails closed and is retryable") {
        f.compliance->SetFailure(TransferFailure::ExternalCallFailed("screening timeout"));
        auto result = f.pipeline.Start(StockRequest());
        REQUIRE(result.Unwrap().phase == CashoutPhase::Error);
        REQUIRE(result.Unwrap().error == "Compliance check failed: screening timeout");
        REQUIRE(f.rails->Calls().empty());
        f.compliance->SetResult(ComplianceResult{.passed = true, .reason = std::nullopt, .is_terminal = false});
        REQUIRE(f.pipeline.Retry("user-1").Unwrap().phase == CashoutPhase::AwaitingSettlement);
    }
}
TEST_CASE("CashoutPipeline - Persistence failure", "[cashout][pipeline][storage]") {
    PipelineFixture f;
    f.store->FailSaves(true);
    auto result = f.pipeline.Start(StockRequest());
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap().phase == CashoutPhase::Error);
    REQUIRE(result.Unwrap().failed_at_phase == CashoutPhase::CompliancePrescreen);
    REQUIRE(f.compliance->CheckCount() == 0);
    REQUIRE(f.rails->Calls().empty());
}
TEST_CASE("CashoutPipeline - Cancel and complete preconditions", "[cashout][pipeline]") {
    PipelineFixture f;
    SECTION("Nothing to cancel") {
        REQUIRE(f.pipeline.Cancel("nobody").UnwrapErr().type == TransferFailureType::NotFound);
    }
    SECTION("Nothing to complete") {
        REQUIRE(f.pipeline.MarkComplete("nobody").UnwrapErr().type == TransferFailureType::NotFound);
    }
    SECTION("Completed run cannot be cancelled") {
        REQUIRE(f.pipeline.Start(StockRequest()).IsOk());
        REQUIRE(f.pipeline.MarkComplete("user-1").IsOk());
        REQUIRE(f.pipeline.Cancel("user-1").UnwrapErr().type == TransferFailureType::InvalidState);
    }
    SECTION("Errored run cannot be completed") {
        f.rails->FailNext(RailCall::Shield, TransferFailure::ExternalCallFailed("pool paused"));
        REQUIRE(f.pipeline.Start(StockRequest()).Unwrap().phase == CashoutPhase::Error);
        REQUIRE(f.pipeline.MarkComplete("user-1").UnwrapErr().type == TransferFailureType::InvalidState);
    }
    SECTION("Awaiting settlement can still be cancelled") {
        REQUIRE(f.pipeline.Start(SettlementRequest(true)).IsOk());
        auto cancelled = f.pipeline.Cancel("user-1");
        REQUIRE(cancelled.IsOk());
        REQUIRE(f.rails->Released().size() == 1);
    }
}
TEST_CASE("CashoutPipeline - Recovery after restart", "[cashout][pipeline][storage]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    auto rails = std::make_shared<FakeCashoutRails>();
    auto compliance = std::make_shared<FakeComplianceProvider>();
    auto store = std::make_shared<InMemoryCashoutStateStore>();
    auto persist_at = [&](CashoutPhase phase) {
        CashoutState state;
        state.pipeline_id = "cashout-restored";
        state.user_id = "user-1";
        state.wallet_address = "wallet-user-1";
        state.phase = phase;
        state.path = CashoutPath::UsdcPool;
        state.asset = CashoutAsset{.mint = kSettlementMint, .symbol = "USDC", .decimals = 6, .is_shielded = true};
        state.amount_base_units = 1'000'000;
        state.fiat_currency = "USD";
        state.cashout_address = "cashout-address-0";
        state.created_at = Now();
        state.updated_at = Now();
        store->Put("user-1", CashoutStateCodec::Serialize(state).Unwrap());
    };
    SECTION("Run interrupted mid-phase becomes an error") {
        persist_at(CashoutPhase::Unshielding);
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto recovered = pipeline.RecoverInterrupted("user-1");
        REQUIRE(recovered.IsOk());
        REQUIRE(recovered.Unwrap().has_value());
        const CashoutState& state = *recovered.Unwrap();
        REQUIRE(state.phase == CashoutPhase::Error);
        REQUIRE(state.failed_at_phase == CashoutPhase::Unshielding);
        REQUIRE(state.error == std::string(ErrorMessages::PIPELINE_INTERRUPTED));
        REQUIRE(CashoutStateCodec::Parse(*store->Load("user-1").Unwrap()).Unwrap().phase == CashoutPhase::Error);
        REQUIRE_FALSE(pipeline.CanRetry("user-1"));
        REQUIRE(pipeline.Cancel("user-1").IsOk());
        REQUIRE(rails->Released() == std::vector<std::string>{"cashout-address-0"});
        REQUIRE(rails->Calls().empty());
    }
    SECTION("Interrupted address creation can be retried") {
        persist_at(CashoutPhase::CreatingCashoutAddress);
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        REQUIRE(pipeline.RecoverInterrupted("user-1").IsOk());
        REQUIRE(pipeline.CanRetry("user-1"));
        auto retried = pipeline.Retry("user-1");
        REQUIRE(retried.Unwrap().phase == CashoutPhase::AwaitingSettlement);
        REQUIRE(retried.Unwrap().pipeline_id == "cashout-restored");
    }
    SECTION("Awaiting settlement survives a restart untouched") {
        persist_at(CashoutPhase::AwaitingSettlement);
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto recovered = pipeline.RecoverInterrupted("user-1");
        REQUIRE(recovered.Unwrap()->phase == CashoutPhase::AwaitingSettlement);
        REQUIRE(pipeline.MarkComplete("user-1").IsOk());
    }
    SECTION("Settlement completes after a restart without explicit recovery") {
        persist_at(CashoutPhase::AwaitingSettlement);
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto state = pipeline.GetState("user-1");
        REQUIRE(state.has_value());
        REQUIRE(state->phase == CashoutPhase::AwaitingSettlement);
        REQUIRE(pipeline.IsActive("user-1"));
        REQUIRE(pipeline.CanCancel("user-1"));
        REQUIRE(pipeline.GetProgress("user-1").label ==
                std::string(PhaseTable::Label(CashoutPhase::AwaitingSettlement)));
        auto reset = pipeline.Reset("user-1");
        REQUIRE(reset.IsErr());
        REQUIRE(reset.UnwrapErr().type == TransferFailureType::PipelineBusy);
        auto completed = pipeline.MarkComplete("user-1", "ach-2210");
        REQUIRE(completed.IsOk());
        REQUIRE(completed.Unwrap().phase == CashoutPhase::Completed);
        REQUIRE(completed.Unwrap().payout_ref == "ach-2210");
        REQUIRE(completed.Unwrap().pipeline_id == "cashout-restored");
        REQUIRE_FALSE(pipeline.IsActive("user-1"));
        REQUIRE(CashoutStateCodec::Parse(*store->Load("user-1").Unwrap()).Unwrap().phase == CashoutPhase::Completed);
    }
    SECTION("Completing a fresh process with nothing persisted") {
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto completed = pipeline.MarkComplete("user-1");
        REQUIRE(completed.IsErr());
        REQUIRE(completed.UnwrapErr().type == TransferFailureType::NotFound);
        REQUIRE_FALSE(pipeline.IsActive("user-1"));
    }
    SECTION("Nothing persisted") {
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto recovered = pipeline.RecoverInterrupted("user-1");
        REQUIRE(recovered.IsOk());
        REQUIRE_FALSE(recovered.Unwrap().has_value());
    }
    SECTION("Start after restart sees the persisted run") {
        persist_at(CashoutPhase::Shielding);
        CashoutPipeline pipeline(CashoutConfig::WithoutJitter(), rails, compliance, store);
        auto started = pipeline.Start(SettlementRequest(true));
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().type == TransferFailureType::PipelineBusy);
    }
}
TEST_CASE("CashoutPipeline - Event handler", "[cashout][pipeline]") {
    PipelineFixture f;
    auto events = std::make_shared<RecordingEventHandler>();
    f.pipeline.SetEventHandler(events);
    REQUIRE(f.pipeline.Start(SettlementRequest(true)).IsOk());
    const auto phases = events->Phases();
    REQUIRE_FALSE(phases.empty());
    REQUIRE(phases.front() == std::make_pair(std::string("user-1"), std::string("creating_cashout_address")));
    REQUIRE(phases.back().second == "awaiting_settlement");
}
