#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/core/clock.hpp"
#include "veil/configuration/nullifier_config.hpp"
#include "veil/interfaces/i_nullifier_store.hpp"
#include "veil/interfaces/i_transfer_event_handler.hpp"
#include "veil/security/nullifier/nullifier.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>
namespace veil::transfer::security {

struct MarkUsedOutcome {
    bool success;
    bool replay_detected;
};

struct NullifierStats {
    size_t active_count = 0;
    std::optional<Timestamp> oldest_expiry;
    std::optional<Timestamp> newest_expiry;
};

/**
 * @brief Tracks single-use nullifiers to block proof and operation replay
 *
 * MarkUsed is an atomic check-then-insert: under contention for one value
 * exactly one caller succeeds and every other caller sees replay_detected.
 * The map is split into shards with one mutex each, so callers on different
 * values do not contend.
 *
 * "Already used" is a normal outcome, never an Err. Err is reserved for
 * malformed input and for a failing backing store (RegistryUnavailable);
 * callers must refuse the protected operation on any Err.
 */
class NullifierRegistry {
public:
    explicit NullifierRegistry(
        configuration::NullifierConfig config = configuration::NullifierConfig::Default(),
        std::shared_ptr<interfaces::INullifierStore> store = nullptr);
    NullifierRegistry(const NullifierRegistry&) = delete;
    NullifierRegistry& operator=(const NullifierRegistry&) = delete;
    NullifierRegistry(NullifierRegistry&&) = delete;
    NullifierRegistry& operator=(NullifierRegistry&&) = delete;
    ~NullifierRegistry();

    Result<MarkUsedOutcome, TransferFailure> MarkUsed(const NullifierRecord& record);

    /**
     * @brief Builds the record with used_at = now and expires_at = now + retention
     */
    Result<MarkUsedOutcome, TransferFailure> MarkUsed(std::string_view nullifier, std::string_view proof_type);

    Result<bool, TransferFailure> IsUsed(std::string_view nullifier) const;

    /**
     * @brief Evicts every record whose expiry has passed
     *
     * @return number of in-memory records removed
     */
    Result<size_t, TransferFailure> CleanupExpired();
    Result<size_t, TransferFailure> CleanupExpired(Timestamp now);

    [[nodiscard]] NullifierStats GetStats() const;

    void Clear();

    /**
     * @brief Starts the periodic sweep thread; no-op if already running
     */
    void StartSweeper();

    /**
     * @brief Stops the sweep thread. Idempotent; also run by the destructor.
     */
    void Shutdown();

    [[nodiscard]] bool IsSweeperRunning() const noexcept;

    void SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler);

    [[nodiscard]] const configuration::NullifierConfig& Config() const noexcept { return config_; }

private:
    struct Shard {
        mutable std::mutex lock;
        std::unordered_map<std::string, NullifierRecord> records;
    };

    Shard& ShardFor(std::string_view nullifier) const;
    void SweepLoop();
    void NotifyReplay(const std::string& proof_type) const;
    void NotifyFault(const std::string& reason) const;

    configuration::NullifierConfig config_;
    std::shared_ptr<interfaces::INullifierStore> store_;
    std::unique_ptr<Shard[]> shards_;

    mutable std::mutex handler_lock_;
    std::shared_ptr<interfaces::ITransferEventHandler> event_handler_;

    std::mutex sweep_lock_;
    std::condition_variable sweep_cv_;
    std::thread sweeper_;
    bool stop_requested_ = false;
    std::atomic<bool> sweeper_running_{false};
};
}
