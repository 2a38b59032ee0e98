#include "veil/crypto/key_derivation.hpp"
#include "veil/crypto/hkdf.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"

#include <cstring>

namespace veil::transfer::crypto {
    Result<std::vector<uint8_t>, TransferFailure> KeyDerivation::DeriveEncryptionKey(
        const std::span<const uint8_t> secret_material,
        const std::string_view context) {
        if (context.empty()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key derivation context cannot be empty"));
        }
        const auto info = BuildContextData(context);
        return Hkdf::DeriveKeyBytes(
            secret_material,
            kEncryptionKeyBytes,
            Encoding::AsBytes(kKeyDerivationSalt),
            info);
    }

    Result<SecureMemoryHandle, TransferFailure> KeyDerivation::DeriveEncryptionKey(
        const SecureMemoryHandle& secret_material,
        const std::string_view context) {
        auto derived = secret_material.WithReadAccess([context](std::span<const uint8_t> secret) {
            return DeriveEncryptionKey(secret, context);
        });
        if (derived.IsErr()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        auto key_result = std::move(derived).Unwrap();
        if (key_result.IsErr()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        auto handle = SecureMemoryHandle::FromBytes(key);
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(handle).Unwrap());
    }

    std::vector<uint8_t> KeyDerivation::BuildContextData(const std::string_view context) {
        std::vector<uint8_t> result(sizeof(int32_t) + context.size());
        constexpr int32_t version = CURRENT_VERSION;
        std::memcpy(result.data(), &version, sizeof(version));
        std::memcpy(result.data() + sizeof(version), context.data(), context.size());
        return result;
    }
}
