#include <catch2/catch_test_macros.hpp>
#include "veil/context/transfer_context.hpp"
#include "veil/cashout/cashout_state_codec.hpp"
#include "veil/cashout/phase_table.hpp"
#include "helpers/fake_transfer_dependencies.hpp"
#include <algorithm>
#include <string>

using namespace veil::transfer;
using namespace veil::transfer::cashout;
using namespace veil::transfer::configuration;
using namespace veil::transfer::test_helpers;

namespace {
    CashoutRequest StockCashout(const std::string& user) {
        return CashoutRequest{
            .user_id = user,
            .wallet_address = "wallet-" + user,
            .asset = CashoutAsset{.mint = "xAAPL", .symbol = "AAPLx", .decimals = 8, .is_shielded = false},
            .amount_base_units = 200'000'000,
            .amount_usd_cents = 45'000,
            .fiat_currency = ""
        };
    }

    CashoutRequest PoolCashout(const std::string& user) {
        return CashoutRequest{
            .user_id = user,
            .wallet_address = "wallet-" + user,
            .asset = CashoutAsset{
                .mint = std::string(CashoutConstants::SETTLEMENT_MINT), .symbol = "USDC", .decimals = 6,
                .is_shielded = true},
            .amount_base_units = 75'000'000,
            .amount_usd_cents = 7'500,
            .fiat_currency = "GBP"
        };
    }
}

TEST_CASE("Cashout workflow - Stock cashout to settlement", "[integration][cashout]") {
    FakeTransferWorld world;
    world.rails->SetSwapOutput(449'000'000);
    auto context = world.Build();
    CashoutPipeline& pipeline = context->Cashout();

    auto started = pipeline.Start(StockCashout("alice"));
    REQUIRE(started.IsOk());
    const CashoutState& state = started.Unwrap();
    REQUIRE(state.phase == CashoutPhase::AwaitingSettlement);
    REQUIRE(state.settlement_amount == 449'000'000u);
    REQUIRE(state.payout_ref.has_value());
    REQUIRE(world.compliance->CheckCount() == 1);
    REQUIRE(world.cashout_store->Contains("alice"));

    const CashoutProgress waiting = pipeline.GetProgress("alice");
    REQUIRE(waiting.percent < 100.0);
    REQUIRE(waiting.estimated_time_remaining == std::string(CashoutConstants::SETTLEMENT_ETA));

    auto completed = pipeline.MarkComplete("alice", std::string("ach-7781"));
    REQUIRE(completed.IsOk());
    REQUIRE(completed.Unwrap().phase == CashoutPhase::Completed);
    REQUIRE(completed.Unwrap().payout_ref == "ach-7781");
    REQUIRE(pipeline.GetProgress("alice").percent == 100.0);

    const auto phases = world.events->Phases();
    REQUIRE_FALSE(phases.empty());
    REQUIRE(std::all_of(phases.begin(), phases.end(), [](const auto& entry) { return entry.first == "alice"; }));
    REQUIRE(phases.back().second == PhaseTable::Name(CashoutPhase::Completed));

    SECTION("A finished run can be replaced by a new one") {
        REQUIRE(pipeline.Reset("alice").IsOk());
        REQUIRE_FALSE(world.cashout_store->Contains("alice"));
        auto again = pipeline.Start(StockCashout("alice"));
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().pipeline_id != state.pipeline_id);
    }
}

TEST_CASE("Cashout workflow - Shielded pool balance skips the swap", "[integration][cashout]") {
    FakeTransferWorld world;
    auto context = world.Build();

    auto started = context->Cashout().Start(PoolCashout("bob"));
    REQUIRE(started.IsOk());
    REQUIRE(started.Unwrap().path == CashoutPath::UsdcPool);
    REQUIRE(started.Unwrap().phase == CashoutPhase::AwaitingSettlement);
    REQUIRE(started.Unwrap().fiat_currency == "GBP");
    REQUIRE(world.rails->CountOf(RailCall::Swap) == 0);
    REQUIRE(world.rails->CountOf(RailCall::Shield) == 0);
    REQUIRE(world.rails->CountOf(RailCall::Unshield) == 1);
    REQUIRE(world.rails->CountOf(RailCall::Payout) == 1);
}

TEST_CASE("Cashout workflow - Compliance rejection blocks until reset", "[integration][cashout]") {
    FakeTransferWorld world;
    auto context = world.Build();
    CashoutPipeline& pipeline = context->Cashout();
    world.compliance->SetResult(ComplianceResult{
        .passed = false, .reason = std::string("sanctions list match"), .is_terminal = true});

    auto rejected = pipeline.Start(StockCashout("carol"));
    REQUIRE(rejected.IsOk());
    REQUIRE(rejected.Unwrap().phase == CashoutPhase::Error);
    REQUIRE(rejected.Unwrap().failed_at_phase == CashoutPhase::CompliancePrescreen);
    REQUIRE(rejected.Unwrap().error == "sanctions list match");
    REQUIRE_FALSE(pipeline.CanRetry("carol"));
    REQUIRE(world.rails->Calls().empty());

    REQUIRE(pipeline.Start(StockCashout("carol")).UnwrapErr().type == TransferFailureType::PipelineBusy);
    REQUIRE(pipeline.Reset("carol").IsOk());
    world.compliance->SetResult(ComplianceResult{.passed = true, .reason = std::nullopt, .is_terminal = false});
    REQUIRE(pipeline.Start(StockCashout("carol")).Unwrap().phase == CashoutPhase::AwaitingSettlement);
}

TEST_CASE("Cashout workflow - Resume in a new process", "[integration][cashout][recovery]") {
    FakeTransferWorld world;
    world.rails->FailNext(RailCall::CreateCashoutAddress, TransferFailure::ExternalCallFailed("wallet service 502"));
    {
        auto first = world.Build();
        auto failed = first->Cashout().Start(StockCashout("dave"));
        REQUIRE(failed.IsOk());
        REQUIRE(failed.Unwrap().phase == CashoutPhase::Error);
        REQUIRE(failed.Unwrap().failed_at_phase == CashoutPhase::CreatingCashoutAddress);
    }

    SECTION("Errored run is retried where it stopped") {
        auto second = world.Build();
        auto recovered = second->Cashout().RecoverInterrupted("dave");
        REQUIRE(recovered.IsOk());
        REQUIRE(recovered.Unwrap().has_value());
        REQUIRE(recovered.Unwrap()->phase == CashoutPhase::Error);
        REQUIRE(second->Cashout().CanRetry("dave"));

        auto retried = second->Cashout().Retry("dave");
        REQUIRE(retried.IsOk());
        REQUIRE(retried.Unwrap().phase == CashoutPhase::AwaitingSettlement);
        REQUIRE(world.rails->CountOf(RailCall::Swap) == 1);
        REQUIRE(world.rails->CountOf(RailCall::Shield) == 1);
        REQUIRE(world.rails->CountOf(RailCall::CreateCashoutAddress) == 2);
    }

    SECTION("Run persisted mid-unshield is surfaced as interrupted") {
        auto persisted = world.cashout_store->Load("dave");
        REQUIRE(persisted.IsOk());
        CashoutState state = CashoutStateCodec::Parse(*persisted.Unwrap()).Unwrap();
        state.phase = CashoutPhase::Unshielding;
        state.failed_at_phase.reset();
        state.error.reset();
        state.cashout_address = "cashout-address-restart";
        world.cashout_store->Put("dave", CashoutStateCodec::Serialize(state).Unwrap());

        auto second = world.Build();
        auto recovered = second->Cashout().RecoverInterrupted("dave");
        REQUIRE(recovered.IsOk());
        const CashoutState& interrupted = *recovered.Unwrap();
        REQUIRE(interrupted.phase == CashoutPhase::Error);
        REQUIRE(interrupted.failed_at_phase == CashoutPhase::Unshielding);
        REQUIRE(interrupted.error == std::string(ErrorMessages::PIPELINE_INTERRUPTED));
        REQUIRE_FALSE(second->Cashout().CanRetry("dave"));

        auto cancelled = second->Cashout().Cancel("dave");
        REQUIRE(cancelled.IsOk());
        const auto released = world.rails->Released();
        REQUIRE(std::find(released.begin(), released.end(), "cashout-address-restart") != released.end());
    }
}
