#pragma once

#include "veil/core/constants.hpp"

#include <chrono>
#include <cstddef>

namespace veil::transfer::configuration {

/**
 * @brief Retention and sweep settings for the nullifier registry
 *
 * Entries are bounded by TTL, not count. The TTL must be at least the
 * validity window of the proofs being protected, otherwise a still-valid
 * proof could be replayed after its nullifier was swept.
 */
class NullifierConfig {
public:
    NullifierConfig(
        std::chrono::milliseconds retention,
        std::chrono::milliseconds sweep_interval,
        std::chrono::milliseconds max_clock_skew,
        size_t shard_count,
        bool start_sweeper) noexcept
        : retention_(retention)
        , sweep_interval_(sweep_interval)
        , max_clock_skew_(max_clock_skew)
        , shard_count_(shard_count == 0 ? 1 : shard_count)
        , start_sweeper_(start_sweeper) {}

    [[nodiscard]] static NullifierConfig Default() noexcept {
        return NullifierConfig(
            NullifierConstants::DEFAULT_PROOF_VALIDITY,
            NullifierConstants::SWEEP_INTERVAL,
            NullifierConstants::MAX_CLOCK_SKEW,
            NullifierConstants::SHARD_COUNT,
            true);
    }

    /**
     * @brief Short intervals and no background thread
     */
    [[nodiscard]] static NullifierConfig ForTesting() noexcept {
        return NullifierConfig(
            std::chrono::seconds(60),
            std::chrono::milliseconds(50),
            NullifierConstants::MAX_CLOCK_SKEW,
            4,
            false);
    }

    [[nodiscard]] std::chrono::milliseconds Retention() const noexcept { return retention_; }
    [[nodiscard]] std::chrono::milliseconds SweepInterval() const noexcept { return sweep_interval_; }
    [[nodiscard]] std::chrono::milliseconds MaxClockSkew() const noexcept { return max_clock_skew_; }
    [[nodiscard]] size_t ShardCount() const noexcept { return shard_count_; }
    [[nodiscard]] bool StartSweeper() const noexcept { return start_sweeper_; }

    [[nodiscard]] NullifierConfig WithSweeper(const bool enabled) const noexcept {
        NullifierConfig copy = *this;
        copy.start_sweeper_ = enabled;
        return copy;
    }

    [[nodiscard]] NullifierConfig WithSweepInterval(const std::chrono::milliseconds interval) const noexcept {
        NullifierConfig copy = *this;
        copy.sweep_interval_ = interval;
        return copy;
    }

private:
    std::chrono::milliseconds retention_;
    std::chrono::milliseconds sweep_interval_;
    std::chrono::milliseconds max_clock_skew_;
    size_t shard_count_;
    bool start_sweeper_;
};

} // namespace veil::transfer::configuration
