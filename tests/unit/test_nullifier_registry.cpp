#include <catch2/catch_test_macros.hpp>
#include "veil/security/nullifier/nullifier_registry.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "helpers/fake_nullifier_store.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <thread>
using namespace veil::transfer;
using namespace veil::transfer::security;
using namespace veil::transfer::configuration;
using namespace veil::transfer::test_helpers;
using namespace std::chrono_literals;
namespace {
NullifierRecord MakeRecord(const std::string& nonce, Timestamp used_at, std::chrono::milliseconds ttl) {
    return NullifierRecord{
        .nullifier = Nullifier::Generate(nonce, "spending_limit"),
        .proof_type = "spending_limit",
        .used_at = used_at,
        .expires_at = used_at + ttl
    };
}
class ReentrantEventHandler final : public veil::transfer::interfaces::ITransferEventHandler {
public:
    explicit ReentrantEventHandler(NullifierRegistry* registry) : registry_(registry) {}
    void OnReplayDetected(const std::string&) override {
        observed_count_ = registry_->GetStats().active_count;
        ++replays_;
    }
    void OnNullifiersExpired(size_t) override {}
    void OnRegistryFault(const std::string&) override {
        observed_count_ = registry_->GetStats().active_count;
        ++faults_;
    }
    void OnCashoutPhaseChanged(const std::string&, const std::string&) override {}
    void OnAgentStatusChanged(const std::string&, const std::string&) override {}
    size_t observed_count_ = 0;
    int replays_ = 0;
    int faults_ = 0;
private:
    NullifierRegistry* registry_;
};
}
TEST_CASE("NullifierRegistry - First use and replay", "[nullifier_registry]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    NullifierRegistry registry(NullifierConfig::ForTesting());
    const auto value = Nullifier::Generate("n1", "spending_limit");
    SECTION("First mark succeeds") {
        auto outcome = registry.MarkUsed(value, "spending_limit");
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().success);
        REQUIRE_FALSE(outcome.Unwrap().replay_detected);
        REQUIRE(registry.IsUsed(value).Unwrap());
    }
    SECTION("Second mark reports replay, not an error") {
        REQUIRE(registry.MarkUsed(value, "spending_limit").Unwrap().success);
        auto again = registry.MarkUsed(value, "spending_limit");
        REQUIRE(again.IsOk());
        REQUIRE_FALSE(again.Unwrap().success);
        REQUIRE(again.Unwrap().replay_detected);
    }
    SECTION("Unknown nullifier is unused") {
        REQUIRE_FALSE(registry.IsUsed(value).Unwrap());
    }
    SECTION("Replay is reported to the event handler") {
        auto events = std::make_shared<RecordingEventHandler>();
        registry.SetEventHandler(events);
        (void)registry.MarkUsed(value, "spending_limit");
        (void)registry.MarkUsed(value, "spending_limit");
        REQUIRE(events->ReplayCount() == 1);
    }
}
TEST_CASE("NullifierRegistry - Input validation", "[nullifier_registry]") {
    NullifierRegistry registry(NullifierConfig::ForTesting());
    const Timestamp now = Now();
    SECTION("Empty nullifier") {
        auto result = registry.MarkUsed("", "kyc");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
    SECTION("Empty proof type") {
        auto result = registry.MarkUsed(std::string(64, 'a'), "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
    SECTION("Expiry before use") {
        auto record = MakeRecord("n1", now, 1min);
        record.expires_at = now - 1s;
        auto result = registry.MarkUsed(record);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
}
TEST_CASE("NullifierRegistry - Expiry cleanup", "[nullifier_registry]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    NullifierRegistry registry(NullifierConfig::ForTesting());
    auto events = std::make_shared<RecordingEventHandler>();
    registry.SetEventHandler(events);
    const Timestamp now = Now();
    REQUIRE(registry.MarkUsed(MakeRecord("short-1", now, 1s)).Unwrap().success);
    REQUIRE(registry.MarkUsed(MakeRecord("short-2", now, 2s)).Unwrap().success);
    REQUIRE(registry.MarkUsed(MakeRecord("long", now, 1h)).Unwrap().success);
    SECTION("Nothing is removed before expiry") {
        REQUIRE(registry.CleanupExpired(now).Unwrap() == 0);
        REQUIRE(registry.GetStats().active_count == 3);
        REQUIRE(events->ExpiredTotal() == 0);
    }
    SECTION("Expired entries are removed at their expiry") {
        REQUIRE(registry.CleanupExpired(now + 2s).Unwrap() == 2);
        REQUIRE(registry.GetStats().active_count == 1);
        REQUIRE(events->ExpiredTotal() == 2);
        REQUIRE_FALSE(registry.IsUsed(Nullifier::Generate("short-1", "spending_limit")).Unwrap());
        REQUIRE(registry.IsUsed(Nullifier::Generate("long", "spending_limit")).Unwrap());
    }
    SECTION("Expired nullifier may be used again") {
        REQUIRE(registry.CleanupExpired(now + 5s).Unwrap() == 2);
        const Timestamp later = now + 5s;
        REQUIRE(registry.MarkUsed(MakeRecord("short-1", later, 1min)).Unwrap().success);
    }
    SECTION("Stats report the expiry range") {
        const auto stats = registry.GetStats();
        REQUIRE(stats.oldest_expiry.has_value());
        REQUIRE(stats.newest_expiry.has_value());
        REQUIRE(*stats.oldest_expiry == now + 1s);
        REQUIRE(*stats.newest_expiry == now + 1h);
    }
    SECTION("Clear drops everything") {
        registry.Clear();
        REQUIRE(registry.GetStats().active_count == 0);
        REQUIRE_FALSE(registry.GetStats().oldest_expiry.has_value());
    }
}
TEST_CASE("NullifierRegistry - Durable store", "[nullifier_registry][storage]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    auto store = std::make_shared<InMemoryNullifierStore>();
    const auto value = Nullifier::Generate("shared", "compliance");
    SECTION("Nullifier recorded by another process is a replay") {
        NullifierRegistry first(NullifierConfig::ForTesting(), store);
        NullifierRegistry second(NullifierConfig::ForTesting(), store);
        REQUIRE(first.MarkUsed(value, "compliance").Unwrap().success);
        auto outcome = second.MarkUsed(value, "compliance");
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().replay_detected);
        REQUIRE(second.IsUsed(value).Unwrap());
    }
    SECTION("Restart keeps used nullifiers") {
        {
            NullifierRegistry before(NullifierConfig::ForTesting(), store);
            REQUIRE(before.MarkUsed(value, "compliance").Unwrap().success);
        }
        NullifierRegistry after(NullifierConfig::ForTesting(), store);
        REQUIRE(after.IsUsed(value).Unwrap());
        REQUIRE(after.MarkUsed(value, "compliance").Unwrap().replay_detected);
    }
    SECTION("Unavailable store refuses the operation") {
        NullifierRegistry registry(NullifierConfig::ForTesting(), store);
        auto events = std::make_shared<RecordingEventHandler>();
        registry.SetEventHandler(events);
        store->SetUnavailable(true);
        auto outcome = registry.MarkUsed(value, "compliance");
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == TransferFailureType::RegistryUnavailable);
        REQUIRE(events->FaultCount() == 1);
        REQUIRE(registry.IsUsed(value).IsErr());
        store->SetUnavailable(false);
        REQUIRE(registry.MarkUsed(value, "compliance").Unwrap().success);
    }
    SECTION("Cleanup also sweeps the store") {
        NullifierRegistry registry(NullifierConfig::ForTesting(), store);
        const Timestamp now = Now();
        REQUIRE(registry.MarkUsed(MakeRecord("a", now, 1s)).Unwrap().success);
        REQUIRE(store->Size() == 1);
        REQUIRE(registry.CleanupExpired(now + 1s).Unwrap() == 1);
        REQUIRE(store->Size() == 0);
    }
}
TEST_CASE("NullifierRegistry - Background sweeper", "[nullifier_registry][sweeper]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    const auto config = NullifierConfig::ForTesting().WithSweepInterval(10ms);
    NullifierRegistry registry(config);
    REQUIRE_FALSE(registry.IsSweeperRunning());
    const Timestamp now = Now();
    REQUIRE(registry.MarkUsed(MakeRecord("fleeting", now, 1ms)).Unwrap().success);
    registry.StartSweeper();
    REQUIRE(registry.IsSweeperRunning());
    registry.StartSweeper();
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (registry.GetStats().active_count != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(registry.GetStats().active_count == 0);
    registry.Shutdown();
    REQUIRE_FALSE(registry.IsSweeperRunning());
    registry.Shutdown();
}
TEST_CASE("NullifierRegistry - Event handler may call back into the registry", "[nullifier_registry][events]") {
    REQUIRE(veil::transfer::crypto::SodiumInterop::Initialize().IsOk());
    auto store = std::make_shared<InMemoryNullifierStore>();
    NullifierRegistry registry(NullifierConfig::ForTesting(), store);
    auto events = std::make_shared<ReentrantEventHandler>(&registry);
    registry.SetEventHandler(events);
    const auto value = Nullifier::Generate("n1", "spending_limit");
    REQUIRE(registry.MarkUsed(value, "spending_limit").Unwrap().success);
    SECTION("Replay notification reads stats") {
        auto second = std::async(std::launch::async, [&] {
            return registry.MarkUsed(value, "spending_limit");
        });
        REQUIRE(second.wait_for(3s) == std::future_status::ready);
        auto outcome = second.get();
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().replay_detected);
        REQUIRE(events->replays_ == 1);
        REQUIRE(events->observed_count_ == 1);
        const auto other = Nullifier::Generate("n2", "spending_limit");
        REQUIRE(registry.MarkUsed(other, "spending_limit").Unwrap().success);
    }
    SECTION("Fault notification reads stats") {
        store->SetUnavailable(true);
        auto faulted = std::async(std::launch::async, [&] {
            return registry.MarkUsed(Nullifier::Generate("n3", "kyc"), "kyc");
        });
        REQUIRE(faulted.wait_for(3s) == std::future_status::ready);
        REQUIRE(faulted.get().UnwrapErr().type == TransferFailureType::RegistryUnavailable);
        REQUIRE(events->faults_ == 1);
        REQUIRE(events->observed_count_ == 1);
        store->SetUnavailable(false);
    }
}
