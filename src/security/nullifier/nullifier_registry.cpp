#include "veil/security/nullifier/nullifier_registry.hpp"
#include "veil/debug/transfer_logger.hpp"
#include "veil/core/format.hpp"
#include <functional>

namespace veil::transfer::security {
    using MarkResult = Result<MarkUsedOutcome, TransferFailure>;

    NullifierRegistry::NullifierRegistry(
        configuration::NullifierConfig config,
        std::shared_ptr<interfaces::INullifierStore> store)
        : config_(config)
          , store_(std::move(store))
          , shards_(std::make_unique<Shard[]>(config.ShardCount())) {
        if (config_.StartSweeper()) {
            StartSweeper();
        }
    }

    NullifierRegistry::~NullifierRegistry() {
        Shutdown();
    }

    NullifierRegistry::Shard &NullifierRegistry::ShardFor(const std::string_view nullifier) const {
        const size_t index = std::hash<std::string_view>{}(nullifier) % config_.ShardCount();
        return shards_[index];
    }

    MarkResult NullifierRegistry::MarkUsed(const NullifierRecord &record) {
        if (record.nullifier.empty()) {
            return MarkResult::Err(TransferFailure::InvalidInput("Nullifier must not be empty"));
        }
        if (record.proof_type.empty()) {
            return MarkResult::Err(TransferFailure::InvalidInput("Proof type must not be empty"));
        }
        if (record.expires_at < record.used_at) {
            return MarkResult::Err(TransferFailure::InvalidInput("Nullifier expires before it was used"));
        }

        enum class Outcome { Recorded, Replay, StoreFault };
        Outcome outcome = Outcome::Recorded;
        std::string fault;
        {
            Shard &shard = ShardFor(record.nullifier);
            std::lock_guard guard(shard.lock);
            if (shard.records.contains(record.nullifier)) {
                outcome = Outcome::Replay;
            } else if (store_) {
                auto inserted = store_->InsertIfAbsent(record);
                if (inserted.IsErr()) {
                    fault = compat::format("Nullifier store unavailable: {}", inserted.UnwrapErr().message);
                    outcome = Outcome::StoreFault;
                } else if (!inserted.Unwrap()) {
                    // Recorded by another process; cache it so later checks stay local.
                    shard.records.emplace(record.nullifier, record);
                    outcome = Outcome::Replay;
                }
            }
            if (outcome == Outcome::Recorded) {
                shard.records.emplace(record.nullifier, record);
            }
        }

        // Handlers may call back into the registry, so notify with no shard held.
        switch (outcome) {
            case Outcome::Replay:
                VEIL_LOG_WARN("nullifier", "Replay detected for {} ({})",
                              debug::Redact(record.nullifier), record.proof_type);
                NotifyReplay(record.proof_type);
                return MarkResult::Ok(MarkUsedOutcome{.success = false, .replay_detected = true});
            case Outcome::StoreFault:
                VEIL_LOG_ERROR("nullifier", "{}", fault);
                NotifyFault(fault);
                return MarkResult::Err(TransferFailure::RegistryUnavailable(fault));
            case Outcome::Recorded:
                break;
        }
        VEIL_LOG_DEBUG("nullifier", "Marked {} used ({})", debug::Redact(record.nullifier), record.proof_type);
        return MarkResult::Ok(MarkUsedOutcome{.success = true, .replay_detected = false});
    }

    MarkResult NullifierRegistry::MarkUsed(const std::string_view nullifier, const std::string_view proof_type) {
        const Timestamp now = Now();
        return MarkUsed(NullifierRecord{
            .nullifier = std::string(nullifier),
            .proof_type = std::string(proof_type),
            .used_at = now,
            .expires_at = now + config_.Retention()
        });
    }

    Result<bool, TransferFailure> NullifierRegistry::IsUsed(const std::string_view nullifier) const {
        {
            Shard &shard = ShardFor(nullifier);
            std::lock_guard guard(shard.lock);
            if (shard.records.contains(std::string(nullifier))) {
                return Result<bool, TransferFailure>::Ok(true);
            }
        }
        if (!store_) {
            return Result<bool, TransferFailure>::Ok(false);
        }
        auto contained = store_->Contains(nullifier);
        if (contained.IsErr()) {
            const std::string reason = compat::format(
                "Nullifier store unavailable: {}", contained.UnwrapErr().message);
            NotifyFault(reason);
            return Result<bool, TransferFailure>::Err(TransferFailure::RegistryUnavailable(reason));
        }
        return contained;
    }

    Result<size_t, TransferFailure> NullifierRegistry::CleanupExpired() {
        return CleanupExpired(Now());
    }

    Result<size_t, TransferFailure> NullifierRegistry::CleanupExpired(const Timestamp now) {
        size_t removed = 0;
        for (size_t i = 0; i < config_.ShardCount(); ++i) {
            Shard &shard = shards_[i];
            std::lock_guard guard(shard.lock);
            auto it = shard.records.begin();
            while (it != shard.records.end()) {
                if (it->second.expires_at <= now) {
                    it = shard.records.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }

        if (store_) {
            auto store_removed = store_->RemoveExpired(now);
            if (store_removed.IsErr()) {
                const std::string reason = compat::format(
                    "Nullifier store sweep failed: {}", store_removed.UnwrapErr().message);
                NotifyFault(reason);
                return Result<size_t, TransferFailure>::Err(TransferFailure::RegistryUnavailable(reason));
            }
        }

        if (removed > 0) {
            VEIL_LOG_DEBUG("nullifier", "Swept {} expired nullifiers", removed);
            std::shared_ptr<interfaces::ITransferEventHandler> handler;
            {
                std::lock_guard guard(handler_lock_);
                handler = event_handler_;
            }
            if (handler) {
                handler->OnNullifiersExpired(removed);
            }
        }
        return Result<size_t, TransferFailure>::Ok(removed);
    }

    NullifierStats NullifierRegistry::GetStats() const {
        NullifierStats stats;
        for (size_t i = 0; i < config_.ShardCount(); ++i) {
            const Shard &shard = shards_[i];
            std::lock_guard guard(shard.lock);
            stats.active_count += shard.records.size();
            for (const auto &[key, record]: shard.records) {
                if (!stats.oldest_expiry || record.expires_at < *stats.oldest_expiry) {
                    stats.oldest_expiry = record.expires_at;
                }
                if (!stats.newest_expiry || record.expires_at > *stats.newest_expiry) {
                    stats.newest_expiry = record.expires_at;
                }
            }
        }
        return stats;
    }

    void NullifierRegistry::Clear() {
        for (size_t i = 0; i < config_.ShardCount(); ++i) {
            std::lock_guard guard(shards_[i].lock);
            shards_[i].records.clear();
        }
    }

    void NullifierRegistry::StartSweeper() {
        std::lock_guard guard(sweep_lock_);
        if (sweeper_.joinable()) {
            return;
        }
        stop_requested_ = false;
        sweeper_running_.store(true, std::memory_order_release);
        sweeper_ = std::thread([this] { SweepLoop(); });
    }

    void NullifierRegistry::Shutdown() {
        std::thread worker;
        {
            std::lock_guard guard(sweep_lock_);
            stop_requested_ = true;
            worker = std::move(sweeper_);
        }
        sweep_cv_.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
        sweeper_running_.store(false, std::memory_order_release);
    }

    bool NullifierRegistry::IsSweeperRunning() const noexcept {
        return sweeper_running_.load(std::memory_order_acquire);
    }

    void NullifierRegistry::SweepLoop() {
        std::unique_lock lock(sweep_lock_);
        while (!stop_requested_) {
            if (sweep_cv_.wait_for(lock, config_.SweepInterval(), [this] { return stop_requested_; })) {
                break;
            }
            lock.unlock();
            if (auto swept = CleanupExpired(); swept.IsErr()) {
                VEIL_LOG_ERROR("nullifier", "Periodic sweep failed: {}", swept.UnwrapErr().message);
            }
            lock.lock();
        }
    }

    void NullifierRegistry::SetEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler) {
        std::lock_guard guard(handler_lock_);
        event_handler_ = std::move(handler);
    }

    void NullifierRegistry::NotifyReplay(const std::string &proof_type) const {
        std::shared_ptr<interfaces::ITransferEventHandler> handler;
        {
            std::lock_guard guard(handler_lock_);
            handler = event_handler_;
        }
        if (handler) {
            handler->OnReplayDetected(proof_type);
        }
    }

    void NullifierRegistry::NotifyFault(const std::string &reason) const {
        std::shared_ptr<interfaces::ITransferEventHandler> handler;
        {
            std::lock_guard guard(handler_lock_);
            handler = event_handler_;
        }
        if (handler) {
            handler->OnRegistryFault(reason);
        }
    }
}
