#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <cstddef>
#include <vector>
#include <utility>

namespace veil::transfer::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Every other crypto component goes through this class for initialization,
 * wiping, comparison and randomness.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Wipe a temporary that is only reachable through a const span
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Wipe serialized protobuf output held in a std::string
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return Ok((secret_key_handle, public_key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Generate an X25519 key pair for sealed-box exchange
     *
     * @param key_purpose Used in error messages only
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform value in [0, upper_bound), 0 when upper_bound is 0
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace veil::transfer::crypto
