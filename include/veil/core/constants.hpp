#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace veil::transfer {

inline constexpr uint32_t kRecordFormatVersion = 1;

inline constexpr size_t kHash256Bytes = 32;
inline constexpr size_t kHash256HexChars = 64;
inline constexpr size_t kNonceBytes = 32;
inline constexpr size_t kEncryptionKeyBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;

inline constexpr size_t kAgentIdRandomBytes = 8;
inline constexpr size_t kPipelineIdRandomBytes = 8;
inline constexpr size_t kLengthPrefixBytes = 4;

inline constexpr std::string_view kHexPrefix = "0x";
inline constexpr std::string_view kAgentIdPrefix = "agent-";
inline constexpr std::string_view kPipelineIdPrefix = "cashout_";

inline constexpr std::string_view kCommitmentDomain = "veil-commitment-v1";
inline constexpr std::string_view kPermissionsDomain = "veil-permissions-v1";
inline constexpr std::string_view kAgentCommitmentDomain = "veil-agent-commitment-v1";
inline constexpr std::string_view kNullifierDomain = "veil-nullifier-v1";
inline constexpr std::string_view kKeyDerivationSalt = "veil-transfer-kdf-salt-v1";
inline constexpr std::string_view kAgentRecordContext = "veil-agent-record-v1";
inline constexpr std::string_view kAgentOperationContext = "veil-agent-operation-v1";

inline constexpr std::string_view kProofTypeAgentOperation = "agent_operation";
inline constexpr std::string_view kProofTypeAgentProofOperation = "agent_proof_operation";
inline constexpr std::string_view kProofTypeAgentRevocation = "agent_revocation";

struct Constants {
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t REDACTED_ID_CHARS = 8;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct NullifierConstants {
    static constexpr std::chrono::hours DEFAULT_PROOF_VALIDITY{1};
    static constexpr std::chrono::minutes SWEEP_INTERVAL{5};
    static constexpr std::chrono::minutes MAX_CLOCK_SKEW{5};
    static constexpr size_t SHARD_COUNT = 16;
};
struct RelayConstants {
    static constexpr uint64_t NATIVE_FEE_BUFFER = 10'000;
    static constexpr uint64_t ASSET_ACCOUNT_RESERVE = 2'039'280;
    static constexpr uint32_t CONFIRMATION_MAX_ATTEMPTS = 30;
    static constexpr std::chrono::milliseconds CONFIRMATION_INITIAL_BACKOFF{500};
    static constexpr std::chrono::milliseconds CONFIRMATION_MAX_BACKOFF{4000};
    static constexpr std::chrono::milliseconds CONFIRMATION_WAIT_BUDGET{60'000};
};
struct CashoutConstants {
    static constexpr std::chrono::milliseconds MAX_JITTER{120'000};
    static constexpr std::chrono::milliseconds JITTER_TICK{1000};
    static constexpr std::string_view SETTLEMENT_ETA = "1-3 business days";
    static constexpr std::string_view QUARANTINE_MARKER = "quarantine";
    static constexpr std::string_view SETTLEMENT_MINT = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
    static constexpr std::string_view DEFAULT_FIAT_CURRENCY = "USD";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "libsodium not initialized";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view TAG_MISMATCH =
        "Authentication tag verification failed - data may have been tampered with";
    static constexpr std::string_view PIPELINE_INTERRUPTED =
        "Pipeline was interrupted. You can retry from where it left off.";
};
}
