#include "veil/crypto/sodium_interop.hpp"
#include "veil/crypto/secure_memory_handle.hpp"

namespace veil::transfer::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& buffer) {
    auto result = SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(buffer.data()),
        buffer.size()));
    buffer.clear();
    return result;
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Key Generation
// ============================================================================

namespace {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>;

    template<typename GenerateFn>
    KeyPairResult GenerateKeyPair(
        const size_t public_key_size,
        const size_t secret_key_size,
        const std::string_view key_purpose,
        GenerateFn&& generate) {

        std::vector<uint8_t> pk(public_key_size);
        std::vector<uint8_t> sk(secret_key_size);
        if (generate(pk.data(), sk.data()) != 0) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(sk));
            return KeyPairResult::Err(
                TransferFailure::KeyGeneration(
                    "Failed to generate " + std::string(key_purpose) + " key pair"));
        }

        auto handle_result = SecureMemoryHandle::FromBytes(sk);
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(sk));
        if (handle_result.IsErr()) {
            return KeyPairResult::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return KeyPairResult::Ok(
            std::make_pair(std::move(handle_result).Unwrap(), std::move(pk)));
    }
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    return GenerateKeyPair(
        kEd25519PublicKeyBytes,
        kEd25519SecretKeyBytes,
        "Ed25519",
        [](uint8_t* pk, uint8_t* sk) { return crypto_sign_keypair(pk, sk); });
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
SodiumInterop::GenerateX25519KeyPair(const std::string_view key_purpose) {
    return GenerateKeyPair(
        kX25519PublicKeyBytes,
        kX25519PrivateKeyBytes,
        key_purpose,
        [](uint8_t* pk, uint8_t* sk) { return crypto_box_keypair(pk, sk); });
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::RandomUniform(const uint32_t upper_bound) {
    if (upper_bound == 0) {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace veil::transfer::crypto
