#pragma once

#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace veil::transfer::crypto {

/**
 * @brief Move-only owner of a sodium_malloc'd buffer
 *
 * Holds wallet secret material and transient private keys. The buffer is
 * guard-paged, kept out of swap and zeroed when freed.
 *
 * @code
 * auto handle = SecureMemoryHandle::FromBytes(wallet_secret);
 * handle.Unwrap().WithReadAccess([](std::span<const uint8_t> secret) { ... });
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Copy data into a fresh guarded allocation of the same size
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Run func over the secret without copying it out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace veil::transfer::crypto
