#include "veil/crypto/payload_sealer.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"
#include "veil/core/format.hpp"

#include <sodium.h>

namespace veil::transfer::crypto {

using BytesResult = Result<std::vector<uint8_t>, TransferFailure>;

Result<SealingKeyPair, TransferFailure> SealingKeyPair::Generate(const std::string_view purpose) {
    auto generated = SodiumInterop::GenerateX25519KeyPair(purpose);
    if (generated.IsErr()) {
        return Result<SealingKeyPair, TransferFailure>::Err(generated.UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(generated).Unwrap();
    return Result<SealingKeyPair, TransferFailure>::Ok(
        SealingKeyPair(std::move(secret_key), std::move(public_key)));
}

BytesResult PayloadSealer::Seal(
    std::span<const uint8_t> recipient_public_key,
    std::span<const uint8_t> plaintext) {
    if (recipient_public_key.size() != crypto_box_PUBLICKEYBYTES) {
        return BytesResult::Err(
            TransferFailure::InvalidInput(
                compat::format("Recipient public key must be {} bytes, got {}",
                               crypto_box_PUBLICKEYBYTES, recipient_public_key.size())));
    }
    std::vector<uint8_t> sealed(plaintext.size() + crypto_box_SEALBYTES);
    if (crypto_box_seal(sealed.data(), plaintext.data(), plaintext.size(),
                        recipient_public_key.data()) != 0) {
        return BytesResult::Err(TransferFailure::Encode("Failed to seal payload"));
    }
    return BytesResult::Ok(std::move(sealed));
}

BytesResult PayloadSealer::Open(
    const SealingKeyPair& recipient,
    std::span<const uint8_t> sealed) {
    if (sealed.size() < crypto_box_SEALBYTES) {
        return BytesResult::Err(TransferFailure::DecryptionFailed("Sealed payload is truncated"));
    }
    const std::vector<uint8_t>& public_key = recipient.PublicKey();
    auto opened = recipient.SecretKey().WithReadAccess([&](std::span<const uint8_t> secret_key) {
        std::vector<uint8_t> plaintext(sealed.size() - crypto_box_SEALBYTES);
        if (crypto_box_seal_open(plaintext.data(), sealed.data(), sealed.size(),
                                 public_key.data(), secret_key.data()) != 0) {
            return BytesResult::Err(
                TransferFailure::DecryptionFailed("Sealed payload failed authentication"));
        }
        return BytesResult::Ok(std::move(plaintext));
    });
    if (opened.IsErr()) {
        return BytesResult::Err(TransferFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    return std::move(opened).Unwrap();
}

} // namespace veil::transfer::crypto
