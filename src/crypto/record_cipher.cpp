#include "veil/crypto/record_cipher.hpp"
#include "veil/crypto/aes_gcm.hpp"
#include "veil/crypto/encoding.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"

namespace veil::transfer::crypto {

Result<std::string, TransferFailure> RecordCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> associated_data) {
    const std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);

    auto sealed = AesGcm::Encrypt(key, nonce, plaintext, associated_data);
    if (sealed.IsErr()) {
        return Result<std::string, TransferFailure>::Err(sealed.UnwrapErr());
    }
    const std::vector<uint8_t> ciphertext = std::move(sealed).Unwrap();

    std::vector<uint8_t> blob;
    blob.reserve(nonce.size() + ciphertext.size());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
    return Result<std::string, TransferFailure>::Ok(Encoding::ToBase64(blob));
}

Result<std::vector<uint8_t>, TransferFailure> RecordCipher::Decrypt(
    const std::string_view blob,
    std::span<const uint8_t> key,
    std::span<const uint8_t> associated_data) {
    auto decoded = Encoding::FromBase64(blob);
    if (decoded.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::DecryptionFailed("Encrypted record is not valid base64"));
    }
    const std::vector<uint8_t> bytes = std::move(decoded).Unwrap();
    if (bytes.size() < kAesGcmNonceBytes + kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::DecryptionFailed("Encrypted record is truncated"));
    }

    const std::span<const uint8_t> view(bytes);
    return AesGcm::Decrypt(
        key,
        view.first(kAesGcmNonceBytes),
        view.subspan(kAesGcmNonceBytes),
        associated_data);
}

} // namespace veil::transfer::crypto
