#pragma once
#include "veil/core/result.hpp"
#include "veil/core/failures.hpp"
#include "veil/crypto/secure_memory_handle.hpp"
#include <cstdint>
#include <string_view>
#include <vector>
namespace veil::transfer::interfaces {
class IWalletKeyProvider {
public:
    virtual ~IWalletKeyProvider() = default;
    /**
     * @brief Secret material the agent record key is derived from
     */
    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, TransferFailure> GetRecordSecret(std::string_view wallet_pubkey) = 0;
    /**
     * @brief X25519 public key operation logs are sealed to
     */
    [[nodiscard]] virtual Result<std::vector<uint8_t>, TransferFailure> GetSealingPublicKey(std::string_view wallet_pubkey) = 0;
};
}
