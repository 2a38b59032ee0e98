#include <catch2/catch_test_macros.hpp>
#include "veil/security/nullifier/nullifier_registry.hpp"
#include "veil/security/nullifier/proof_replay_guard.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "helpers/fake_nullifier_store.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace veil::transfer;
using namespace veil::transfer::security;
using namespace veil::transfer::configuration;
using namespace veil::transfer::test_helpers;
using namespace std::chrono_literals;

TEST_CASE("Concurrency - Racing marks on one nullifier", "[concurrency][nullifier]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("In-memory registry admits exactly one caller") {
        NullifierRegistry registry(NullifierConfig::ForTesting());
        const std::string value = Nullifier::Generate(Nullifier::GenerateSecureNonce(), "spending_limit");

        constexpr int THREAD_COUNT = 10;
        std::atomic<int> successes{0};
        std::atomic<int> replays{0};
        std::atomic<int> errors{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                auto outcome = registry.MarkUsed(value, "spending_limit");
                if (outcome.IsErr()) {
                    ++errors;
                } else if (outcome.Unwrap().success) {
                    ++successes;
                } else if (outcome.Unwrap().replay_detected) {
                    ++replays;
                }
            });
        }
        go.store(true);
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(successes.load() == 1);
        REQUIRE(replays.load() == THREAD_COUNT - 1);
        REQUIRE(errors.load() == 0);
    }

    SECTION("Two registries sharing a store admit exactly one caller") {
        auto store = std::make_shared<InMemoryNullifierStore>();
        NullifierRegistry first(NullifierConfig::ForTesting(), store);
        NullifierRegistry second(NullifierConfig::ForTesting(), store);
        const std::string value = Nullifier::Generate(Nullifier::GenerateSecureNonce(), "compliance");

        constexpr int THREAD_COUNT = 16;
        std::atomic<int> successes{0};
        std::atomic<int> replays{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            NullifierRegistry& registry = t % 2 == 0 ? first : second;
            threads.emplace_back([&registry, &value, &successes, &replays]() {
                auto outcome = registry.MarkUsed(value, "compliance");
                if (outcome.IsOk() && outcome.Unwrap().success) {
                    ++successes;
                } else if (outcome.IsOk() && outcome.Unwrap().replay_detected) {
                    ++replays;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(successes.load() == 1);
        REQUIRE(replays.load() == THREAD_COUNT - 1);
        REQUIRE(store->Size() == 1);
    }
}

TEST_CASE("Concurrency - Distinct nullifiers do not interfere", "[concurrency][nullifier]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    NullifierRegistry registry(NullifierConfig::ForTesting());

    constexpr int THREAD_COUNT = 8;
    constexpr int MARKS_PER_THREAD = 250;
    std::atomic<int> successes{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&registry, &successes, &failures, t]() {
            for (int i = 0; i < MARKS_PER_THREAD; ++i) {
                const std::string value = Nullifier::Generate(
                    "t" + std::to_string(t) + "-" + std::to_string(i), "spending_limit");
                auto outcome = registry.MarkUsed(value, "spending_limit");
                if (outcome.IsOk() && outcome.Unwrap().success) {
                    ++successes;
                } else {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(successes.load() == THREAD_COUNT * MARKS_PER_THREAD);
    REQUIRE(failures.load() == 0);
    REQUIRE(registry.GetStats().active_count == static_cast<size_t>(THREAD_COUNT * MARKS_PER_THREAD));
}

TEST_CASE("Concurrency - Racing proof consumption", "[concurrency][nullifier][proof]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    NullifierRegistry registry(NullifierConfig::ForTesting());
    ProofReplayGuard guard(registry);
    const ProofReplayMetadata metadata = guard.Issue("kyc", 10min);

    constexpr int THREAD_COUNT = 12;
    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            auto consumed = guard.Consume(metadata);
            if (consumed.IsOk()) {
                ++accepted;
            } else if (consumed.UnwrapErr().type == TransferFailureType::ReplayDetected) {
                ++refused;
            } else {
                ++unexpected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(accepted.load() == 1);
    REQUIRE(refused.load() == THREAD_COUNT - 1);
    REQUIRE(unexpected.load() == 0);
}

TEST_CASE("Concurrency - Sweeper runs alongside writers", "[concurrency][nullifier]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    NullifierRegistry registry(NullifierConfig::ForTesting().WithSweeper(true).WithSweepInterval(5ms));
    registry.StartSweeper();
    REQUIRE(registry.IsSweeperRunning());

    constexpr int THREAD_COUNT = 4;
    constexpr int MARKS_PER_THREAD = 200;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&registry, &successes, t]() {
            for (int i = 0; i < MARKS_PER_THREAD; ++i) {
                const Timestamp now = Now();
                auto outcome = registry.MarkUsed(NullifierRecord{
                    .nullifier = Nullifier::Generate("s" + std::to_string(t) + "-" + std::to_string(i), "kyc"),
                    .proof_type = "kyc",
                    .used_at = now,
                    .expires_at = now + 1ms
                });
                if (outcome.IsOk() && outcome.Unwrap().success) {
                    ++successes;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(successes.load() == THREAD_COUNT * MARKS_PER_THREAD);
    std::this_thread::sleep_for(50ms);
    REQUIRE(registry.GetStats().active_count == 0);
    registry.Shutdown();
    REQUIRE_FALSE(registry.IsSweeperRunning());
}
