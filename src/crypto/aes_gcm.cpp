#include "veil/crypto/aes_gcm.hpp"
#include "veil/crypto/sodium_interop.hpp"
#include "veil/core/constants.hpp"
#include "veil/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <optional>
namespace veil::transfer::crypto {
using OpenSSL = OpenSSLConstants;
using BytesResult = Result<std::vector<uint8_t>, TransferFailure>;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    BytesResult OpenSSLFailure(const char* step) {
        return BytesResult::Err(
            TransferFailure::Generic(compat::format("{}: {}", step, GetOpenSSLError())));
    }
    std::optional<TransferFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return TransferFailure::InvalidInput(
                compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size()));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return TransferFailure::InvalidInput(
                compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size()));
        }
        return std::nullopt;
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    }
}
BytesResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSSLFailure("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSSLFailure("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}
BytesResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(
            TransferFailure::DecryptionFailed(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                               ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSSLFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSSLFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSSLFailure("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Decryption failed");
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAesGcmTagBytes),
                            tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenSSLFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return BytesResult::Err(
            TransferFailure::DecryptionFailed(std::string(ErrorMessages::TAG_MISMATCH)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
